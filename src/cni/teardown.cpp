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

#include <stout/nothing.hpp>
#include <stout/stringify.hpp>
#include <stout/try.hpp>

#include "cni/naming.hpp"
#include "cni/spec.hpp"
#include "cni/teardown.hpp"

using std::string;

namespace ovncni {
namespace internal {
namespace cni {

Teardown::Teardown(
    NetworkBackend* _network,
    SwitchBackend* _vswitch,
    Logger* _logger)
  : network(_network),
    vswitch(_vswitch),
    logger(_logger) {}


int Teardown::teardown(const string& containerId, pid_t pid)
{
  const string port = VethPair::fromContainerId(containerId).outside;

  int failures = 0;

  Try<Nothing> deletePort = vswitch->deletePort(port);
  if (deletePort.isError()) {
    failures++;
    logger->warning(
        "Failed to delete switch port '" + port + "' (error " +
        stringify(spec::CNI_ERROR_TEARDOWN) + "): " + deletePort.error());
  } else {
    logger->info("Deleted switch port '" + port + "'");
  }

  Try<Nothing> unlink = network->unlinkNamespace(pid);
  if (unlink.isError()) {
    failures++;
    logger->warning(
        "Failed to remove the network namespace handle of pid " +
        stringify(pid) + " (error " + stringify(spec::CNI_ERROR_TEARDOWN) +
        "): " + unlink.error());
  } else {
    logger->info(
        "Removed the network namespace handle of pid " + stringify(pid));
  }

  return failures;
}

} // namespace cni {
} // namespace internal {
} // namespace ovncni {
