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

#ifndef __EVENTS_EVENT_LOG_HPP__
#define __EVENTS_EVENT_LOG_HPP__

#include <vector>

#include <ownable/events.hpp>

namespace ownable {
namespace internal {

// An `EventSink` that remembers every event, in the order received.
class EventLog : public EventSink
{
public:
  EventLog() {}

  // Starts from a previously recorded history, e.g. one recovered
  // from a checkpoint.
  explicit EventLog(const std::vector<OwnershipTransferred>& history);

  ~EventLog() override {}

  void ownershipTransferred(const OwnershipTransferred& event) override;

  const std::vector<OwnershipTransferred>& events() const;

  size_t size() const;

private:
  std::vector<OwnershipTransferred> history;
};

} // namespace internal {
} // namespace ownable {

#endif // __EVENTS_EVENT_LOG_HPP__
