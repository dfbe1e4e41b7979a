// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef __STORAGE_IN_MEMORY_HPP__
#define __STORAGE_IN_MEMORY_HPP__

#include <ownable/storage.hpp>

namespace ownable {
namespace internal {

// Keeps the owner in memory, for the lifetime of the storage object.
class InMemoryStorage : public Storage
{
public:
  InMemoryStorage();
  ~InMemoryStorage() override {}

  // Storage implementation.
  Address get() const override;
  void set(const Address& owner) override;

private:
  Address owner;
};

} // namespace internal {
} // namespace ownable {

#endif // __STORAGE_IN_MEMORY_HPP__
