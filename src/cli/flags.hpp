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

#ifndef __CLI_FLAGS_HPP__
#define __CLI_FLAGS_HPP__

#include <string>

#include <stout/option.hpp>

#include "logging/flags.hpp"

namespace ownable {
namespace internal {
namespace cli {

class Flags : public virtual logging::Flags
{
public:
  Flags();

  std::string state_path;
  std::string operation;
  Option<std::string> caller;
  Option<std::string> owner;
  Option<std::string> new_owner;
};

} // namespace cli {
} // namespace internal {
} // namespace ownable {

#endif // __CLI_FLAGS_HPP__
