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

#include <vector>

#include <glog/logging.h>

#include <ownable/ownable.hpp>
#include <ownable/type_utils.hpp>

#include <process/dispatch.hpp>
#include <process/future.hpp>
#include <process/id.hpp>
#include <process/process.hpp>

#include <stout/foreach.hpp>

#include "events/event_log.hpp"

#include "host/host.hpp"

#include "storage/in_memory.hpp"

using std::vector;

using process::Future;

using process::dispatch;

namespace ownable {
namespace internal {

class OwnableProcess : public process::Process<OwnableProcess>
{
public:
  explicit OwnableProcess(const Address& initialOwner)
    : ProcessBase(process::ID::generate("ownable")),
      ownable(&storage, &log)
  {
    ownable.initializer(initialOwner);
  }

  explicit OwnableProcess(const OwnershipState& state)
    : ProcessBase(process::ID::generate("ownable")),
      log(vector<OwnershipTransferred>(
          state.events().begin(), state.events().end())),
      ownable(&storage, &log)
  {
    storage.set(state.owner());

    LOG(INFO) << "Recovered owner " << state.owner() << " with "
              << log.size() << " recorded ownership change(s)";
  }

  Address owner()
  {
    return ownable.owner();
  }

  Try<Nothing, OwnershipError> transferOwnership(
      const Address& caller,
      const Address& newOwner)
  {
    return ownable.transferOwnership(caller, newOwner);
  }

  Try<Nothing, OwnershipError> renounceOwnership(const Address& caller)
  {
    return ownable.renounceOwnership(caller);
  }

  vector<OwnershipTransferred> events()
  {
    return log.events();
  }

  OwnershipState snapshot()
  {
    OwnershipState state;
    state.mutable_owner()->CopyFrom(ownable.owner());

    foreach (const OwnershipTransferred& event, log.events()) {
      state.add_events()->CopyFrom(event);
    }

    return state;
  }

private:
  // NOTE: `storage` and `log` must be declared before `ownable`,
  // which keeps pointers to both.
  InMemoryStorage storage;
  EventLog log;
  Ownable ownable;
};


OwnableHost::OwnableHost(const Address& initialOwner)
  : process(new OwnableProcess(initialOwner))
{
  spawn(process);
}


OwnableHost::OwnableHost(const OwnershipState& state)
  : process(new OwnableProcess(state))
{
  spawn(process);
}


OwnableHost::~OwnableHost()
{
  terminate(process);
  wait(process);
  delete process;
}


Future<Address> OwnableHost::owner() const
{
  return dispatch(process, &OwnableProcess::owner);
}


Future<Try<Nothing, OwnershipError>> OwnableHost::transferOwnership(
    const Address& caller,
    const Address& newOwner)
{
  return dispatch(
      process,
      &OwnableProcess::transferOwnership,
      caller,
      newOwner);
}


Future<Try<Nothing, OwnershipError>> OwnableHost::renounceOwnership(
    const Address& caller)
{
  return dispatch(process, &OwnableProcess::renounceOwnership, caller);
}


Future<vector<OwnershipTransferred>> OwnableHost::events() const
{
  return dispatch(process, &OwnableProcess::events);
}


Future<OwnershipState> OwnableHost::snapshot() const
{
  return dispatch(process, &OwnableProcess::snapshot);
}

} // namespace internal {
} // namespace ownable {
