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

#include <fcntl.h>
#include <sys/file.h> // For flock.
#include <sys/stat.h>

#include <ostream>
#include <string>
#include <vector>

#include <glog/logging.h>

#include <ownable/address.hpp>
#include <ownable/ownable.hpp>
#include <ownable/type_utils.hpp>

#include <process/future.hpp>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/path.hpp>
#include <stout/result.hpp>
#include <stout/try.hpp>

#include <stout/os/close.hpp>
#include <stout/os/exists.hpp>
#include <stout/os/mkdir.hpp>
#include <stout/os/open.hpp>

#include "cli/operations.hpp"

#include "host/host.hpp"

#include "state/state.hpp"

using std::endl;
using std::ostream;
using std::string;
using std::vector;

using process::Future;

namespace ownable {
namespace internal {
namespace cli {

// Parses the address given by `--name`.
static Try<Address> parseAddress(
    const Option<string>& value,
    const string& name)
{
  if (value.isNone()) {
    return Error("Missing required option --" + name);
  }

  Try<Address> parsed = address::parse(value.get());
  if (parsed.isError()) {
    return Error("Invalid --" + name + ": " + parsed.error());
  }

  return parsed;
}


static Try<Nothing> checkpoint(const string& path, OwnableHost* host)
{
  Future<OwnershipState> snapshot = host->snapshot();

  Try<Nothing> checkpoint = state::checkpoint(path, snapshot.get());
  if (checkpoint.isError()) {
    return Error(
        "Failed to checkpoint ownership state: " + checkpoint.error());
  }

  return Nothing();
}


// Opens (creating if needed) the file at `path` and takes an exclusive
// lock on it, waiting for any other holder to release it. Closing the
// returned file descriptor releases the lock.
static Try<int> lock(const string& path)
{
  Try<int> fd =
    os::open(path, O_RDWR | O_CREAT | O_CLOEXEC, S_IRUSR | S_IWUSR);
  if (fd.isError()) {
    return Error("Failed to open lock file '" + path + "': " + fd.error());
  }

  if (flock(fd.get(), LOCK_EX) != 0) {
    ErrnoError error("Failed to lock '" + path + "'");
    os::close(fd.get());
    return error;
  }

  return fd;
}


// Performs the operation. The caller holds the lock.
static int _run(const Flags& flags, ostream& out, ostream& err)
{
  const string& path = flags.state_path;

  if (flags.operation == "initialize") {
    if (os::exists(path)) {
      err << "Ownership state '" << path << "' is already initialized" << endl;
      return EXIT_FAILURE;
    }

    Try<Address> owner = parseAddress(flags.owner, "owner");
    if (owner.isError()) {
      err << owner.error() << endl;
      return EXIT_FAILURE;
    }

    OwnableHost host(owner.get());

    Try<Nothing> checkpointed = checkpoint(path, &host);
    if (checkpointed.isError()) {
      err << checkpointed.error() << endl;
      return EXIT_FAILURE;
    }

    out << owner.get() << endl;
    return EXIT_SUCCESS;
  }

  Result<OwnershipState> recovered = state::recover(path);
  if (recovered.isError()) {
    err << recovered.error() << endl;
    return EXIT_FAILURE;
  }

  if (recovered.isNone()) {
    err << "Ownership state '" << path << "' is not initialized;"
        << " use --operation=initialize first" << endl;
    return EXIT_FAILURE;
  }

  OwnableHost host(recovered.get());

  if (flags.operation == "owner") {
    Future<Address> owner = host.owner();
    out << owner.get() << endl;
    return EXIT_SUCCESS;
  }

  if (flags.operation == "events") {
    Future<vector<OwnershipTransferred>> events = host.events();
    foreach (const OwnershipTransferred& event, events.get()) {
      out << event << endl;
    }
    return EXIT_SUCCESS;
  }

  Try<Address> caller = parseAddress(flags.caller, "caller");
  if (caller.isError()) {
    err << caller.error() << endl;
    return EXIT_FAILURE;
  }

  Future<Try<Nothing, OwnershipError>> result;

  if (flags.operation == "transfer") {
    Try<Address> newOwner = parseAddress(flags.new_owner, "new_owner");
    if (newOwner.isError()) {
      err << newOwner.error() << endl;
      return EXIT_FAILURE;
    }

    result = host.transferOwnership(caller.get(), newOwner.get());
  } else {
    CHECK(flags.operation == "renounce");

    result = host.renounceOwnership(caller.get());
  }

  if (result.get().isError()) {
    LOG(WARNING) << "Rejected " << flags.operation << " by " << caller.get()
                 << " with " << result.get().error().type;
    err << result.get().error().message << endl;
    return EXIT_FAILURE;
  }

  Try<Nothing> checkpointed = checkpoint(path, &host);
  if (checkpointed.isError()) {
    err << checkpointed.error() << endl;
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}


string lockPath(const string& statePath)
{
  return statePath + ".lock";
}


int run(const Flags& flags, ostream& out, ostream& err)
{
  if (flags.operation != "initialize" &&
      flags.operation != "owner" &&
      flags.operation != "transfer" &&
      flags.operation != "renounce" &&
      flags.operation != "events") {
    err << flags.usage("Unknown operation '" + flags.operation + "'") << endl;
    return EXIT_FAILURE;
  }

  // The lock file lives next to the state, so the directory must exist
  // before the state is first checkpointed.
  const string directory = Path(flags.state_path).dirname();

  Try<Nothing> mkdir = os::mkdir(directory);
  if (mkdir.isError()) {
    err << "Failed to create directory '" << directory << "': "
        << mkdir.error() << endl;
    return EXIT_FAILURE;
  }

  Try<int> fd = lock(lockPath(flags.state_path));
  if (fd.isError()) {
    err << fd.error() << endl;
    return EXIT_FAILURE;
  }

  VLOG(1) << "Acquired lock on '" << lockPath(flags.state_path) << "'";

  const int status = _run(flags, out, err);

  os::close(fd.get());

  return status;
}

} // namespace cli {
} // namespace internal {
} // namespace ownable {
