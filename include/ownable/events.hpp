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

#ifndef __OWNABLE_EVENTS_HPP__
#define __OWNABLE_EVENTS_HPP__

// ONLY USEFUL AFTER RUNNING PROTOC.
#include <ownable/ownable.pb.h>

namespace ownable {

/**
 * Receives the notifications produced by an `Ownable`. Events are
 * delivered synchronously, once per ownership change, in the order the
 * changes happen.
 */
class EventSink
{
public:
  EventSink() {}
  virtual ~EventSink() {}

  virtual void ownershipTransferred(const OwnershipTransferred& event) = 0;
};

} // namespace ownable {

#endif // __OWNABLE_EVENTS_HPP__
