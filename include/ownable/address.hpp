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

#ifndef __OWNABLE_ADDRESS_HPP__
#define __OWNABLE_ADDRESS_HPP__

#include <cstddef>
#include <string>

// ONLY USEFUL AFTER RUNNING PROTOC.
#include <ownable/ownable.pb.h>

#include <stout/try.hpp>

namespace ownable {

// Addresses are 251-bit values, i.e. at most 63 hexadecimal digits
// with the leading digit no greater than 7.
constexpr size_t MAX_ADDRESS_DIGITS = 63;


// The address meaning "no one". It is never a valid transfer target
// and is the owner after ownership has been renounced.
const Address& ZERO_ADDRESS();


namespace address {

// Parses a `0x`-prefixed hexadecimal address (either case, leading
// zeros allowed) and returns it in canonical form, e.g. "0x00AB"
// becomes "0xab".
Try<Address> parse(const std::string& value);


// Returns true for the zero address in any of its spellings, e.g.
// "0x0", "0x000" or "0X0". An address without a value (or with an
// empty one) is treated as the zero address as well.
bool isZero(const Address& address);

} // namespace address {
} // namespace ownable {

#endif // __OWNABLE_ADDRESS_HPP__
