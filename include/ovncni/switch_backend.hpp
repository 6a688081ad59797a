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

#ifndef __OVNCNI_SWITCH_BACKEND_HPP__
#define __OVNCNI_SWITCH_BACKEND_HPP__

#include <map>
#include <string>

#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

namespace ovncni {

// Control interface of the virtual switch the host-side veths attach to.
class SwitchBackend
{
public:
  virtual ~SwitchBackend() {}

  // Attaches `port` to the switch and tags its interface record with
  // `externalIds`. Fails if the port already exists.
  virtual Try<Nothing> addPort(
      const std::string& port,
      const std::map<std::string, std::string>& externalIds) = 0;

  // Detaches `port`. Deleting a port that does not exist succeeds.
  virtual Try<Nothing> deletePort(const std::string& port) = 0;

  // Reads a column (e.g., "external_ids:iface-id") of the interface
  // record of `port`. Returns none if the port or key is unknown.
  virtual Try<Option<std::string>> get(
      const std::string& port,
      const std::string& column) = 0;
};

} // namespace ovncni {

#endif // __OVNCNI_SWITCH_BACKEND_HPP__
