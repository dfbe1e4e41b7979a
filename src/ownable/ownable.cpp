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
#include <string>

#include <glog/logging.h>

#include <ownable/address.hpp>
#include <ownable/ownable.hpp>
#include <ownable/type_utils.hpp>

#include <stout/none.hpp>
#include <stout/unreachable.hpp>

using std::ostream;
using std::string;

namespace ownable {

static string describe(OwnershipError::Type type)
{
  switch (type) {
    case OwnershipError::NOT_OWNER:
      return "Caller is not the owner";
    case OwnershipError::ZERO_ADDRESS_CALLER:
      return "Caller is the zero address";
    case OwnershipError::ZERO_ADDRESS_NEW_OWNER:
      return "New owner is the zero address";
  }

  UNREACHABLE();
}


OwnershipError::OwnershipError(Type _type)
  : Error(describe(_type)), type(_type) {}


ostream& operator<<(ostream& stream, OwnershipError::Type type)
{
  switch (type) {
    case OwnershipError::NOT_OWNER:
      return stream << "NOT_OWNER";
    case OwnershipError::ZERO_ADDRESS_CALLER:
      return stream << "ZERO_ADDRESS_CALLER";
    case OwnershipError::ZERO_ADDRESS_NEW_OWNER:
      return stream << "ZERO_ADDRESS_NEW_OWNER";
  }

  UNREACHABLE();
}


ostream& operator<<(ostream& stream, const OwnershipError& error)
{
  return stream << error.message;
}


Ownable::Ownable(Storage* _storage, EventSink* _sink)
  : storage(CHECK_NOTNULL(_storage)),
    sink(CHECK_NOTNULL(_sink)) {}


Address Ownable::owner() const
{
  return storage->get();
}


void Ownable::initializer(const Address& owner)
{
  _transferOwnership(owner);
}


Try<Nothing, OwnershipError> Ownable::transferOwnership(
    const Address& caller,
    const Address& newOwner)
{
  if (address::isZero(newOwner)) {
    return OwnershipError(OwnershipError::ZERO_ADDRESS_NEW_OWNER);
  }

  Option<OwnershipError> error = assertOnlyOwner(caller);
  if (error.isSome()) {
    return error.get();
  }

  _transferOwnership(newOwner);

  return Nothing();
}


Try<Nothing, OwnershipError> Ownable::renounceOwnership(const Address& caller)
{
  Option<OwnershipError> error = assertOnlyOwner(caller);
  if (error.isSome()) {
    return error.get();
  }

  _transferOwnership(ZERO_ADDRESS());

  return Nothing();
}


Option<OwnershipError> Ownable::assertOnlyOwner(const Address& caller) const
{
  const Address owner = storage->get();

  if (caller != owner) {
    return OwnershipError(OwnershipError::NOT_OWNER);
  }

  // A renounced owner is the zero address, which a zero caller would
  // otherwise match.
  if (address::isZero(caller)) {
    return OwnershipError(OwnershipError::ZERO_ADDRESS_CALLER);
  }

  return None();
}


void Ownable::_transferOwnership(const Address& newOwner)
{
  const Address previousOwner = storage->get();

  // NOTE: An address without a value is stored as the canonical zero
  // address so that the events stay fully initialized messages.
  const Address& owner = address::isZero(newOwner) ? ZERO_ADDRESS() : newOwner;

  storage->set(owner);

  OwnershipTransferred event;
  event.mutable_previous_owner()->CopyFrom(
      address::isZero(previousOwner) ? ZERO_ADDRESS() : previousOwner);
  event.mutable_new_owner()->CopyFrom(owner);

  LOG(INFO) << "Ownership transferred from " << event.previous_owner()
            << " to " << event.new_owner();

  sink->ownershipTransferred(event);
}

} // namespace ownable {
