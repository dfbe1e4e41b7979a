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

#include <ostream>

#include <ownable/address.hpp>
#include <ownable/type_utils.hpp>

using std::ostream;

namespace ownable {

bool operator==(const Address& left, const Address& right)
{
  if (address::isZero(left) || address::isZero(right)) {
    return address::isZero(left) && address::isZero(right);
  }

  return left.value() == right.value();
}


bool operator==(
    const OwnershipTransferred& left,
    const OwnershipTransferred& right)
{
  return left.previous_owner() == right.previous_owner() &&
    left.new_owner() == right.new_owner();
}


ostream& operator<<(ostream& stream, const Address& value)
{
  if (address::isZero(value)) {
    return stream << ZERO_ADDRESS().value();
  }

  return stream << value.value();
}


ostream& operator<<(ostream& stream, const OwnershipTransferred& event)
{
  return stream << event.previous_owner() << " -> " << event.new_owner();
}

} // namespace ownable {
