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

#include <string>

#include <glog/logging.h>

#include <ownable/address.hpp>
#include <ownable/type_utils.hpp>

#include <stout/error.hpp>
#include <stout/none.hpp>
#include <stout/option.hpp>
#include <stout/path.hpp>
#include <stout/protobuf.hpp>
#include <stout/stringify.hpp>

#include <stout/os/exists.hpp>
#include <stout/os/mkdir.hpp>
#include <stout/os/mktemp.hpp>
#include <stout/os/rename.hpp>
#include <stout/os/rm.hpp>

#include "state/state.hpp"

using std::string;

namespace ownable {
namespace internal {
namespace state {

// Checks that an address read back from disk is in canonical form.
static Option<Error> validate(const Address& stored)
{
  Try<Address> parsed = address::parse(stored.value());
  if (parsed.isError()) {
    return Error(parsed.error());
  }

  if (parsed->value() != stored.value()) {
    return Error("Address '" + stored.value() + "' is not canonical");
  }

  return None();
}


Try<Nothing> checkpoint(const string& path, const OwnershipState& state)
{
  const string base = Path(path).dirname();

  Try<Nothing> mkdir = os::mkdir(base);
  if (mkdir.isError()) {
    return Error("Failed to create directory '" + base + "': " + mkdir.error());
  }

  // NOTE: The temporary file is created next to `path` so that the
  // rename below does not cross devices.
  Try<string> temp = os::mktemp(path::join(base, "XXXXXX"));
  if (temp.isError()) {
    return Error("Failed to create temporary file: " + temp.error());
  }

  Try<Nothing> write = ::protobuf::write(temp.get(), state);
  if (write.isError()) {
    // Try removing the temporary file on error.
    os::rm(temp.get());

    return Error("Failed to write temporary file '" + temp.get() +
                 "': " + write.error());
  }

  Try<Nothing> rename = os::rename(temp.get(), path);
  if (rename.isError()) {
    // Try removing the temporary file on error.
    os::rm(temp.get());

    return Error("Failed to rename '" + temp.get() + "' to '" +
                 path + "': " + rename.error());
  }

  VLOG(1) << "Checkpointed ownership state with owner " << state.owner()
          << " and " << state.events_size() << " event(s) to '" << path << "'";

  return Nothing();
}


Result<OwnershipState> recover(const string& path)
{
  if (!os::exists(path)) {
    return None();
  }

  Result<OwnershipState> state = ::protobuf::read<OwnershipState>(path);

  if (state.isError()) {
    return Error(
        "Failed to read ownership state from '" + path + "': " +
        state.error());
  }

  if (state.isNone()) {
    // This could happen if the host crashed after the file was created
    // but before the data was synced to disk.
    LOG(WARNING) << "Found empty ownership state file '" << path << "'";
    return None();
  }

  Option<Error> error = validate(state->owner());
  if (error.isSome()) {
    return Error("Invalid owner in '" + path + "': " + error->message);
  }

  for (int i = 0; i < state->events_size(); i++) {
    const OwnershipTransferred& event = state->events(i);

    error = validate(event.previous_owner());
    if (error.isNone()) {
      error = validate(event.new_owner());
    }

    if (error.isSome()) {
      return Error(
          "Invalid event " + stringify(i) + " in '" + path + "': " +
          error->message);
    }
  }

  // The owner is whoever the most recent event handed ownership to.
  if (state->events_size() > 0) {
    const OwnershipTransferred& last =
      state->events(state->events_size() - 1);

    if (state->owner() != last.new_owner()) {
      return Error(
          "Owner " + stringify(state->owner()) + " in '" + path + "' does"
          " not match the last recorded ownership change " + stringify(last));
    }
  }

  return state;
}

} // namespace state {
} // namespace internal {
} // namespace ownable {
