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

#ifndef __CNI_SWITCH_BINDER_HPP__
#define __CNI_SWITCH_BINDER_HPP__

#include <map>
#include <string>

#include <ovncni/logger.hpp>
#include <ovncni/switch_backend.hpp>

#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include "cni/annotation.hpp"
#include "cni/spec.hpp"

namespace ovncni {
namespace internal {
namespace cni {

// Keys of the interface `external_ids` the control plane reads back.
constexpr char EXTERNAL_ID_ATTACHED_MAC[] = "attached_mac";
constexpr char EXTERNAL_ID_IFACE_ID[] = "iface-id";
constexpr char EXTERNAL_ID_IP_ADDRESS[] = "ip_address";


struct SwitchPortBinding
{
  std::map<std::string, std::string> externalIds() const;

  std::string portName;
  std::string ifaceId;
  std::string attachedMac;
  std::string attachedIp;
};


// Attaches the outside end of a container's veth pair to the switch.
// The registration is a single call that is not retried; on failure the
// veth stays provisioned and DEL is expected to clean it up.
class SwitchBinder
{
public:
  SwitchBinder(SwitchBackend* backend, Logger* logger);

  Try<SwitchPortBinding, spec::PluginError> bind(
      const std::string& outside,
      const NetworkAnnotation& annotation,
      const std::string& podNamespace,
      const std::string& podName);

private:
  SwitchBackend* backend;
  Logger* logger;
};

} // namespace cni {
} // namespace internal {
} // namespace ovncni {

#endif // __CNI_SWITCH_BINDER_HPP__
