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

#ifndef __OVS_VSCTL_BACKEND_HPP__
#define __OVS_VSCTL_BACKEND_HPP__

#include <map>
#include <string>

#include <ovncni/switch_backend.hpp>

#include <process/owned.hpp>

#include "common/command_utils.hpp"

namespace ovncni {
namespace internal {
namespace ovs {

constexpr char DEFAULT_BRIDGE[] = "br-int";
constexpr char DEFAULT_VSCTL[] = "ovs-vsctl";


// Drives Open vSwitch through `ovs-vsctl`; ports are added to a single
// integration bridge.
class VsctlBackend : public SwitchBackend
{
public:
  explicit VsctlBackend(
      const process::Owned<command::Executor>& executor,
      const std::string& vsctl = DEFAULT_VSCTL,
      const std::string& bridge = DEFAULT_BRIDGE);

  Try<Nothing> addPort(
      const std::string& port,
      const std::map<std::string, std::string>& externalIds) override;

  Try<Nothing> deletePort(const std::string& port) override;

  Try<Option<std::string>> get(
      const std::string& port,
      const std::string& column) override;

private:
  process::Owned<command::Executor> executor;
  const std::string vsctl;
  const std::string bridge;
};

} // namespace ovs {
} // namespace internal {
} // namespace ovncni {

#endif // __OVS_VSCTL_BACKEND_HPP__
