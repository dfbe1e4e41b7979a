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

#ifndef __STATE_STATE_HPP__
#define __STATE_STATE_HPP__

#include <string>

// ONLY USEFUL AFTER RUNNING PROTOC.
#include <ownable/ownable.pb.h>

#include <stout/nothing.hpp>
#include <stout/result.hpp>
#include <stout/try.hpp>

namespace ownable {
namespace internal {
namespace state {

// Writes the state to `path`, creating the parent directory if
// needed.
//
// NOTE: We provide atomic (all-or-nothing) semantics here by always
// writing to a temporary file first then using os::rename to move it
// to the desired path.
Try<Nothing> checkpoint(const std::string& path, const OwnershipState& state);


// Reads the state checkpointed at `path`. Returns None if nothing was
// checkpointed yet (the file does not exist or is empty) and an Error
// if the file cannot be read or does not hold a consistent state.
Result<OwnershipState> recover(const std::string& path);

} // namespace state {
} // namespace internal {
} // namespace ownable {

#endif // __STATE_STATE_HPP__
