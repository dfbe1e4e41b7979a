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

#include <ownable/type_utils.hpp>

#include "events/event_log.hpp"

using std::vector;

namespace ownable {
namespace internal {

EventLog::EventLog(const vector<OwnershipTransferred>& _history)
  : history(_history) {}


void EventLog::ownershipTransferred(const OwnershipTransferred& event)
{
  VLOG(1) << "Recording ownership change " << history.size() << ": " << event;

  history.push_back(event);
}


const vector<OwnershipTransferred>& EventLog::events() const
{
  return history;
}


size_t EventLog::size() const
{
  return history.size();
}

} // namespace internal {
} // namespace ownable {
