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

#ifndef __TESTS_UTILS_HPP__
#define __TESTS_UTILS_HPP__

#include <gtest/gtest.h>

#include <string>

// ONLY USEFUL AFTER RUNNING PROTOC.
#include <ownable/ownable.pb.h>

#include <stout/option.hpp>

namespace ownable {
namespace internal {
namespace tests {

// Test fixture for creating a temporary directory for each test. The
// test runs with the directory as its working directory.
class TemporaryDirectoryTest : public ::testing::Test
{
protected:
  void SetUp() override;
  void TearDown() override;

  Option<std::string> sandbox;

private:
  std::string cwd;
};


// Returns the canonical form of `value`, which must be a valid address.
Address createAddress(const std::string& value);


// Returns a fully initialized event for the given change of ownership.
OwnershipTransferred createEvent(
    const Address& previousOwner,
    const Address& newOwner);

} // namespace tests {
} // namespace internal {
} // namespace ownable {

#endif // __TESTS_UTILS_HPP__
