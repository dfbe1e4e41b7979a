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

#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include <ownable/address.hpp>
#include <ownable/type_utils.hpp>

#include <process/async.hpp>
#include <process/future.hpp>
#include <process/gtest.hpp>

#include <stout/duration.hpp>
#include <stout/gtest.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/result.hpp>
#include <stout/strings.hpp>
#include <stout/try.hpp>

#include <stout/os/close.hpp>
#include <stout/os/exists.hpp>
#include <stout/os/open.hpp>
#include <stout/os/read.hpp>
#include <stout/os/sleep.hpp>

#include "cli/flags.hpp"
#include "cli/operations.hpp"

#include "state/state.hpp"

#include "tests/utils.hpp"

using std::ostringstream;
using std::string;

using process::Future;

namespace ownable {
namespace internal {
namespace tests {

const char STATE_PATH[] = "ownership";


class OwnableCliTest : public TemporaryDirectoryTest
{
protected:
  OwnableCliTest()
    : alice(createAddress("0xa11ce")),
      bob(createAddress("0xb0b")),
      carol(createAddress("0xca201")) {}

  cli::Flags createFlags(
      const string& operation,
      const Option<string>& caller = None())
  {
    cli::Flags flags;
    flags.state_path = STATE_PATH;
    flags.operation = operation;
    flags.caller = caller;
    return flags;
  }

  // Runs the tool, keeping what it printed in `out` and `err`.
  int run(const cli::Flags& flags)
  {
    out.str("");
    err.str("");
    return cli::run(flags, out, err);
  }

  int initialize(const string& owner)
  {
    cli::Flags flags = createFlags("initialize");
    flags.owner = owner;
    return run(flags);
  }

  int transfer(const string& caller, const string& newOwner)
  {
    cli::Flags flags = createFlags("transfer", caller);
    flags.new_owner = newOwner;
    return run(flags);
  }

  int renounce(const string& caller)
  {
    return run(createFlags("renounce", caller));
  }

  const Address alice;
  const Address bob;
  const Address carol;

  ostringstream out;
  ostringstream err;
};


TEST_F(OwnableCliTest, Initialize)
{
  EXPECT_EQ(EXIT_SUCCESS, initialize("0xA11CE"));
  EXPECT_EQ("0xa11ce\n", out.str());

  Result<OwnershipState> recovered = state::recover(STATE_PATH);
  ASSERT_SOME(recovered);
  EXPECT_EQ(alice, recovered->owner());
  ASSERT_EQ(1, recovered->events_size());
  EXPECT_EQ(createEvent(ZERO_ADDRESS(), alice), recovered->events(0));

  EXPECT_EQ(EXIT_SUCCESS, run(createFlags("owner")));
  EXPECT_EQ("0xa11ce\n", out.str());
}


// Ownership is initialized exactly once; a second attempt neither
// succeeds nor touches the existing state.
TEST_F(OwnableCliTest, InitializeExistingState)
{
  ASSERT_EQ(EXIT_SUCCESS, initialize("0xa11ce"));

  Try<string> before = os::read(STATE_PATH);
  ASSERT_SOME(before);

  EXPECT_EQ(EXIT_FAILURE, initialize("0xb0b"));
  EXPECT_TRUE(strings::contains(err.str(), "already initialized"));
  EXPECT_EQ("", out.str());

  EXPECT_SOME_EQ(before.get(), os::read(STATE_PATH));
}


TEST_F(OwnableCliTest, InitializeRequiresOwner)
{
  EXPECT_EQ(EXIT_FAILURE, run(createFlags("initialize")));
  EXPECT_TRUE(strings::contains(err.str(), "--owner"));

  EXPECT_EQ(EXIT_FAILURE, initialize("alice"));
  EXPECT_TRUE(strings::contains(err.str(), "Invalid --owner"));

  EXPECT_FALSE(os::exists(STATE_PATH));
}


TEST_F(OwnableCliTest, MissingState)
{
  EXPECT_EQ(EXIT_FAILURE, run(createFlags("owner")));
  EXPECT_TRUE(strings::contains(err.str(), "not initialized"));

  EXPECT_EQ(EXIT_FAILURE, run(createFlags("events")));
  EXPECT_TRUE(strings::contains(err.str(), "not initialized"));

  EXPECT_EQ(EXIT_FAILURE, transfer("0xa11ce", "0xb0b"));
  EXPECT_TRUE(strings::contains(err.str(), "not initialized"));

  EXPECT_EQ(EXIT_FAILURE, renounce("0xa11ce"));
  EXPECT_TRUE(strings::contains(err.str(), "not initialized"));

  EXPECT_FALSE(os::exists(STATE_PATH));
}


TEST_F(OwnableCliTest, TransferOwnership)
{
  ASSERT_EQ(EXIT_SUCCESS, initialize("0xa11ce"));

  EXPECT_EQ(EXIT_SUCCESS, transfer("0xa11ce", "0xb0b"));
  EXPECT_EQ("", err.str());

  Result<OwnershipState> recovered = state::recover(STATE_PATH);
  ASSERT_SOME(recovered);
  EXPECT_EQ(bob, recovered->owner());
  EXPECT_EQ(2, recovered->events_size());

  EXPECT_EQ(EXIT_SUCCESS, run(createFlags("events")));
  EXPECT_EQ("0x0 -> 0xa11ce\n0xa11ce -> 0xb0b\n", out.str());
}


// Only successful operations are checkpointed.
TEST_F(OwnableCliTest, RejectedTransferLeavesStateUnchanged)
{
  ASSERT_EQ(EXIT_SUCCESS, initialize("0xa11ce"));

  Try<string> before = os::read(STATE_PATH);
  ASSERT_SOME(before);

  EXPECT_EQ(EXIT_FAILURE, transfer("0xb0b", "0xca201"));
  EXPECT_EQ("Caller is not the owner\n", err.str());
  EXPECT_SOME_EQ(before.get(), os::read(STATE_PATH));

  EXPECT_EQ(EXIT_FAILURE, transfer("0xa11ce", "0x0"));
  EXPECT_EQ("New owner is the zero address\n", err.str());
  EXPECT_SOME_EQ(before.get(), os::read(STATE_PATH));

  EXPECT_EQ(EXIT_FAILURE, transfer("0xa11ce", "bob"));
  EXPECT_TRUE(strings::contains(err.str(), "Invalid --new_owner"));
  EXPECT_SOME_EQ(before.get(), os::read(STATE_PATH));
}


TEST_F(OwnableCliTest, RenounceOwnership)
{
  ASSERT_EQ(EXIT_SUCCESS, initialize("0xa11ce"));

  EXPECT_EQ(EXIT_FAILURE, run(createFlags("renounce")));
  EXPECT_TRUE(strings::contains(err.str(), "--caller"));

  EXPECT_EQ(EXIT_SUCCESS, renounce("0xa11ce"));

  EXPECT_EQ(EXIT_SUCCESS, run(createFlags("owner")));
  EXPECT_EQ("0x0\n", out.str());

  EXPECT_EQ(EXIT_FAILURE, renounce("0x00"));
  EXPECT_EQ("Caller is the zero address\n", err.str());

  EXPECT_EQ(EXIT_FAILURE, transfer("0xa11ce", "0xb0b"));
  EXPECT_EQ("Caller is not the owner\n", err.str());
}


TEST_F(OwnableCliTest, UnknownOperation)
{
  EXPECT_EQ(EXIT_FAILURE, run(createFlags("delete")));
  EXPECT_TRUE(strings::contains(err.str(), "Unknown operation 'delete'"));

  // Usage is printed along with the error.
  EXPECT_TRUE(strings::contains(err.str(), "--state_path"));

  EXPECT_FALSE(os::exists(cli::lockPath(STATE_PATH)));
}


// While another run holds the lock on the state, a run waits for it
// instead of reading a state that is about to change. Of two competing
// transfers by the same owner only the first one applied succeeds.
TEST_F(OwnableCliTest, ConcurrentRunsAreSerialized)
{
  ASSERT_EQ(EXIT_SUCCESS, initialize("0xa11ce"));

  Try<int> fd = os::open(cli::lockPath(STATE_PATH), O_RDWR | O_CLOEXEC);
  ASSERT_SOME(fd);
  ASSERT_EQ(0, flock(fd.get(), LOCK_EX));

  cli::Flags toBob = createFlags("transfer", string("0xa11ce"));
  toBob.new_owner = string("0xb0b");

  cli::Flags toCarol = createFlags("transfer", string("0xa11ce"));
  toCarol.new_owner = string("0xca201");

  ostringstream out1, err1, out2, err2;

  Future<int> first = process::async([&]() {
    return cli::run(toBob, out1, err1);
  });

  Future<int> second = process::async([&]() {
    return cli::run(toCarol, out2, err2);
  });

  os::sleep(Milliseconds(100));

  EXPECT_TRUE(first.isPending());
  EXPECT_TRUE(second.isPending());

  Result<OwnershipState> recovered = state::recover(STATE_PATH);

  // Releases the lock.
  Try<Nothing> unlock = os::close(fd.get());

  AWAIT_READY(first);
  AWAIT_READY(second);

  ASSERT_SOME(unlock);

  // Nothing was applied while the lock was held.
  ASSERT_SOME(recovered);
  EXPECT_EQ(alice, recovered->owner());

  // Exactly one transfer went through.
  EXPECT_NE(first.get(), second.get());

  recovered = state::recover(STATE_PATH);
  ASSERT_SOME(recovered);
  EXPECT_EQ(2, recovered->events_size());

  if (first.get() == EXIT_SUCCESS) {
    EXPECT_EQ(bob, recovered->owner());
    EXPECT_EQ("Caller is not the owner\n", err2.str());
  } else {
    EXPECT_EQ(carol, recovered->owner());
    EXPECT_EQ("Caller is not the owner\n", err1.str());
  }
}

} // namespace tests {
} // namespace internal {
} // namespace ownable {
