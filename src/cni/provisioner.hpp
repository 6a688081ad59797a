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

#ifndef __CNI_PROVISIONER_HPP__
#define __CNI_PROVISIONER_HPP__

#include <sys/types.h>

#include <string>

#include <ovncni/logger.hpp>
#include <ovncni/network_backend.hpp>

#include <stout/try.hpp>

#include "cni/annotation.hpp"
#include "cni/spec.hpp"

namespace ovncni {
namespace internal {
namespace cni {

// Leaves room for the overlay's tunnel encapsulation headers.
constexpr unsigned int DEFAULT_MTU = 1400;


/**
 * Builds the veth pair of a container and configures its inside end.
 *
 * The steps run strictly in this order:
 *   1. create the namespace-handle directory (idempotent),
 *   2. create the veth pair,
 *   3. bring the outside end up,
 *   4. link the container's namespace handle (skipped if present),
 *   5. move the inside end into the container's namespace,
 *   6. rename it to the requested interface name,
 *   7. bring it up,
 *   8. set its MTU,
 *   9. assign the IP address,
 *  10. assign the MAC address,
 *  11. install the default route.
 *
 * A failure of step 1 is a directory error. A failure of any later step
 * is a provisioning error, reported only after the outside end has been
 * deleted (which removes the inside end with it).
 */
class InterfaceProvisioner
{
public:
  InterfaceProvisioner(
      NetworkBackend* backend,
      Logger* logger,
      unsigned int mtu = DEFAULT_MTU);

  // Returns the name of the outside end.
  Try<std::string, spec::PluginError> provision(
      pid_t pid,
      const std::string& containerId,
      const std::string& interfaceName,
      const NetworkAnnotation& annotation);

private:
  NetworkBackend* backend;
  Logger* logger;
  const unsigned int mtu;
};

} // namespace cni {
} // namespace internal {
} // namespace ovncni {

#endif // __CNI_PROVISIONER_HPP__
