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

#ifndef __CLI_OPERATIONS_HPP__
#define __CLI_OPERATIONS_HPP__

#include <ostream>
#include <string>

#include "cli/flags.hpp"

namespace ownable {
namespace internal {
namespace cli {

// Returns the path of the lock file guarding the state at `statePath`.
std::string lockPath(const std::string& statePath);


// Performs `flags.operation` against the state at `flags.state_path`
// and returns the exit status. Results are printed to `out`, failures
// to `err`.
//
// NOTE: The whole operation, from reading the state to checkpointing
// it, runs while holding an exclusive lock on `lockPath(state_path)`,
// so concurrent runs against the same state are applied one at a time.
int run(const Flags& flags, std::ostream& out, std::ostream& err);

} // namespace cli {
} // namespace internal {
} // namespace ownable {

#endif // __CLI_OPERATIONS_HPP__
