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

#ifndef __HOST_HOST_HPP__
#define __HOST_HOST_HPP__

#include <vector>

#include <ownable/ownable.hpp>

#include <process/future.hpp>

#include <stout/nothing.hpp>
#include <stout/try.hpp>

namespace ownable {
namespace internal {

// Forward declaration.
class OwnableProcess;


// Embeds an `Ownable` into a libprocess actor. The owner is kept in
// memory and every change is recorded in an event history. Each
// operation runs in a single turn of the actor, so concurrent callers
// never interleave their reads and writes of the owner.
class OwnableHost
{
public:
  // Creates a host and makes `initialOwner` the owner before any
  // operation can reach it. This is the only place where the
  // `Ownable` is initialized.
  explicit OwnableHost(const Address& initialOwner);

  // Creates a host from a previously checkpointed state. The owner and
  // the history are restored as is; nothing is emitted.
  explicit OwnableHost(const OwnershipState& state);

  ~OwnableHost();

  process::Future<Address> owner() const;

  process::Future<Try<Nothing, OwnershipError>> transferOwnership(
      const Address& caller,
      const Address& newOwner);

  process::Future<Try<Nothing, OwnershipError>> renounceOwnership(
      const Address& caller);

  // Returns every ownership change so far, oldest first.
  process::Future<std::vector<OwnershipTransferred>> events() const;

  // Returns the state to checkpoint in order to recreate this host.
  process::Future<OwnershipState> snapshot() const;

private:
  OwnableHost(const OwnableHost&) = delete;
  OwnableHost& operator=(const OwnableHost&) = delete;

  OwnableProcess* process;
};

} // namespace internal {
} // namespace ownable {

#endif // __HOST_HOST_HPP__
