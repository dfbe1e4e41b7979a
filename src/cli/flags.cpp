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

#include "cli/flags.hpp"


ownable::internal::cli::Flags::Flags()
{
  add(&Flags::state_path,
      "state_path",
      "Path of the file holding the checkpointed ownership state.\n"
      "Runs against the same state are serialized through an exclusive\n"
      "lock on `<state_path>.lock`.");

  add(&Flags::operation,
      "operation",
      "The operation to perform. One of:\n"
      "  `initialize`: create the state with `--owner` as the owner,\n"
      "                fails if the state already exists.\n"
      "  `owner`:      print the current owner.\n"
      "  `transfer`:   make `--new_owner` the owner, on behalf of\n"
      "                `--caller`.\n"
      "  `renounce`:   give up ownership for good, on behalf of\n"
      "                `--caller`.\n"
      "  `events`:     print every ownership change, oldest first.",
      "owner");

  add(&Flags::caller,
      "caller",
      "Address on whose behalf `transfer` or `renounce` is performed,\n"
      "e.g. `0x1f`.");

  add(&Flags::owner,
      "owner",
      "Initial owner address for `initialize`.");

  add(&Flags::new_owner,
      "new_owner",
      "Address to transfer ownership to for `transfer`.");
}
