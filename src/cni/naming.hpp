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

#ifndef __CNI_NAMING_HPP__
#define __CNI_NAMING_HPP__

#include <stddef.h>

#include <string>

namespace ovncni {
namespace internal {
namespace cni {

// Kernel limit on interface names (IFNAMSIZ minus the terminator).
constexpr size_t MAX_INTERFACE_NAME_LENGTH = 15;

constexpr char INSIDE_SUFFIX[] = "_c";


// The two ends of a container's veth pair. Both names are derived from
// the container id alone, so DEL finds the same links ADD created
// without any state kept in between.
struct VethPair
{
  static VethPair fromContainerId(const std::string& containerId);

  // Kept in the host namespace and attached to the switch.
  std::string outside;

  // Moved into the container and renamed there.
  std::string inside;
};


// The switch port's `iface-id`, which the control plane uses to find
// the logical port of the pod.
std::string ifaceId(
    const std::string& podNamespace,
    const std::string& podName);

} // namespace cni {
} // namespace internal {
} // namespace ovncni {

#endif // __CNI_NAMING_HPP__
