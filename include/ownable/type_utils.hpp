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

#ifndef __OWNABLE_TYPE_UTILS_HPP__
#define __OWNABLE_TYPE_UTILS_HPP__

#include <ostream>

// ONLY USEFUL AFTER RUNNING PROTOC.
#include <ownable/ownable.pb.h>

namespace ownable {

// Two addresses are equal if they hold the same value. All
// representations of the zero address are equal to each other.
bool operator==(const Address& left, const Address& right);
bool operator==(
    const OwnershipTransferred& left,
    const OwnershipTransferred& right);


inline bool operator!=(const Address& left, const Address& right)
{
  return !(left == right);
}


inline bool operator!=(
    const OwnershipTransferred& left,
    const OwnershipTransferred& right)
{
  return !(left == right);
}


std::ostream& operator<<(std::ostream& stream, const Address& address);
std::ostream& operator<<(
    std::ostream& stream,
    const OwnershipTransferred& event);

} // namespace ownable {

#endif // __OWNABLE_TYPE_UTILS_HPP__
