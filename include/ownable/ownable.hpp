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

#ifndef __OWNABLE_OWNABLE_HPP__
#define __OWNABLE_OWNABLE_HPP__

#include <ostream>

// ONLY USEFUL AFTER RUNNING PROTOC.
#include <ownable/ownable.pb.h>

#include <ownable/events.hpp>
#include <ownable/storage.hpp>

#include <stout/error.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

namespace ownable {

/**
 * The reason a guarded operation of an `Ownable` was rejected. The
 * `message` inherited from `Error` is a human readable description
 * of the `type`.
 */
class OwnershipError : public Error
{
public:
  enum Type
  {
    // The caller is not the current owner.
    NOT_OWNER,

    // The caller is the zero address.
    ZERO_ADDRESS_CALLER,

    // A transfer named the zero address as the new owner.
    ZERO_ADDRESS_NEW_OWNER
  };

  explicit OwnershipError(Type _type);

  const Type type;
};


std::ostream& operator<<(std::ostream& stream, OwnershipError::Type type);
std::ostream& operator<<(std::ostream& stream, const OwnershipError& error);


/**
 * A single owner gating a set of privileged operations. Ownership can
 * be transferred by the current owner, or renounced, after which no
 * guarded operation can ever succeed again.
 *
 * An `Ownable` holds no state of its own: the owner lives in the
 * `Storage` cell and every change is reported to the `EventSink`,
 * both provided (and owned) by the embedding system. The identity of
 * the caller is resolved by the embedding system and passed to every
 * guarded operation.
 *
 * Operations are synchronous and must not be interleaved; embedding
 * systems that accept concurrent calls must serialize them.
 */
class Ownable
{
public:
  Ownable(Storage* storage, EventSink* sink);

  // Returns the current owner, or the zero address once ownership has
  // been renounced (or before `initializer` ran). Never fails.
  Address owner() const;

  /**
   * Sets the initial owner and emits the corresponding event.
   *
   * This is a trusted operation: it performs no caller check and no
   * zero address validation. The embedding system is expected to
   * call it exactly once while setting itself up, before any guarded
   * operation is reachable.
   */
  void initializer(const Address& owner);

  /**
   * Makes `newOwner` the owner. Only the current owner can do this,
   * and `newOwner` must not be the zero address (use
   * `renounceOwnership` to give up ownership instead).
   *
   * @return `Nothing` on success, otherwise the `OwnershipError`
   *     describing why the transfer was rejected. A rejected transfer
   *     leaves the owner unchanged and emits nothing.
   */
  Try<Nothing, OwnershipError> transferOwnership(
      const Address& caller,
      const Address& newOwner);

  /**
   * Sets the owner to the zero address. Only the current owner can do
   * this and it cannot be undone.
   */
  Try<Nothing, OwnershipError> renounceOwnership(const Address& caller);

private:
  Ownable(const Ownable&) = delete;
  Ownable& operator=(const Ownable&) = delete;

  // The mismatch is checked before the zero address so that a zero
  // caller is reported as NOT_OWNER unless ownership was renounced.
  Option<OwnershipError> assertOnlyOwner(const Address& caller) const;

  // Writes `newOwner` and emits the event. No validation.
  void _transferOwnership(const Address& newOwner);

  Storage* storage;
  EventSink* sink;
};

} // namespace ownable {

#endif // __OWNABLE_OWNABLE_HPP__
