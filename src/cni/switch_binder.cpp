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

#include "cni/naming.hpp"
#include "cni/switch_binder.hpp"

using std::map;
using std::string;

namespace ovncni {
namespace internal {
namespace cni {

map<string, string> SwitchPortBinding::externalIds() const
{
  return {
    {EXTERNAL_ID_ATTACHED_MAC, attachedMac},
    {EXTERNAL_ID_IFACE_ID, ifaceId},
    {EXTERNAL_ID_IP_ADDRESS, attachedIp}
  };
}


SwitchBinder::SwitchBinder(SwitchBackend* _backend, Logger* _logger)
  : backend(_backend),
    logger(_logger) {}


Try<SwitchPortBinding, spec::PluginError> SwitchBinder::bind(
    const string& outside,
    const NetworkAnnotation& annotation,
    const string& podNamespace,
    const string& podName)
{
  SwitchPortBinding binding;
  binding.portName = outside;
  binding.ifaceId = cni::ifaceId(podNamespace, podName);
  binding.attachedMac = annotation.macAddress;
  binding.attachedIp = annotation.ipAddress;

  Try<Nothing> add = backend->addPort(binding.portName, binding.externalIds());
  if (add.isError()) {
    return spec::BindingError(
        "Failed to attach '" + outside + "' to the switch as '" +
        binding.ifaceId + "'",
        add.error());
  }

  logger->info(
      "Attached '" + outside + "' to the switch as '" + binding.ifaceId + "'");

  return binding;
}

} // namespace cni {
} // namespace internal {
} // namespace ovncni {
