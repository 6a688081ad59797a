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
#include <stout/option.hpp>
#include <stout/stringify.hpp>

#include "cni/naming.hpp"
#include "cni/provisioner.hpp"

using std::string;

namespace ovncni {
namespace internal {
namespace cni {

using spec::PluginError;

namespace {

// Deletes the outside end of a veth pair on destruction unless
// `release` was called. Deleting either end removes both.
class VethGuard
{
public:
  VethGuard(NetworkBackend* _backend, Logger* _logger, const string& _link)
    : backend(_backend), logger(_logger), link(_link), armed(true) {}

  VethGuard(const VethGuard&) = delete;
  VethGuard& operator=(const VethGuard&) = delete;

  ~VethGuard()
  {
    if (!armed) {
      return;
    }

    Try<Nothing> deleted = backend->deleteLink(link);
    if (deleted.isError()) {
      logger->error(
          "Failed to delete veth '" + link + "' after a provisioning "
          "failure: " + deleted.error());
    } else {
      logger->info("Deleted veth '" + link + "' after a provisioning failure");
    }
  }

  void release() { armed = false; }

private:
  NetworkBackend* backend;
  Logger* logger;
  const string link;
  bool armed;
};


PluginError failed(const string& step, const Try<Nothing>& result)
{
  return spec::ProvisioningError("Failed to " + step, result.error());
}

} // namespace {


InterfaceProvisioner::InterfaceProvisioner(
    NetworkBackend* _backend,
    Logger* _logger,
    unsigned int _mtu)
  : backend(_backend),
    logger(_logger),
    mtu(_mtu) {}


Try<string, PluginError> InterfaceProvisioner::provision(
    pid_t pid,
    const string& containerId,
    const string& interfaceName,
    const NetworkAnnotation& annotation)
{
  Try<Nothing> directory = backend->createNamespaceDirectory();
  if (directory.isError()) {
    return spec::DirectoryError(
        "Failed to create the network namespace directory",
        directory.error());
  }

  const VethPair veth = VethPair::fromContainerId(containerId);
  const Option<string> netns = stringify(pid);

  logger->info(
      "Creating veth pair '" + veth.outside + "' <-> '" + veth.inside +
      "' for container " + containerId);

  // The outside name is derived from the container id, so an existing
  // link belongs to an earlier ADD of this container and must survive.
  if (backend->linkExists(veth.outside)) {
    return spec::ProvisioningError(
        "Failed to create veth pair '" + veth.outside + "'",
        "Link '" + veth.outside + "' already exists");
  }

  // Armed before the pair exists: a partially created pair is cleaned
  // up too, and deleting a missing link only logs.
  VethGuard guard(backend, logger, veth.outside);

  Try<Nothing> step = backend->createVethPair(veth.outside, veth.inside);
  if (step.isError()) {
    return failed("create veth pair '" + veth.outside + "'", step);
  }

  step = backend->setLinkUp(None(), veth.outside);
  if (step.isError()) {
    return failed("bring up '" + veth.outside + "'", step);
  }

  step = backend->linkNamespace(pid);
  if (step.isError()) {
    return failed("link the network namespace of pid " + netns.get(), step);
  }

  step = backend->moveLink(veth.inside, pid);
  if (step.isError()) {
    return failed(
        "move '" + veth.inside + "' into the network namespace of pid " +
        netns.get(),
        step);
  }

  step = backend->renameLink(netns, veth.inside, interfaceName);
  if (step.isError()) {
    return failed(
        "rename '" + veth.inside + "' to '" + interfaceName + "'", step);
  }

  step = backend->setLinkUp(netns, interfaceName);
  if (step.isError()) {
    return failed("bring up '" + interfaceName + "'", step);
  }

  step = backend->setMtu(netns, interfaceName, mtu);
  if (step.isError()) {
    return failed(
        "set the MTU of '" + interfaceName + "' to " + stringify(mtu), step);
  }

  step = backend->addAddress(netns, interfaceName, annotation.ipAddress);
  if (step.isError()) {
    return failed(
        "assign " + annotation.ipAddress + " to '" + interfaceName + "'",
        step);
  }

  step = backend->setMac(netns, interfaceName, annotation.macAddress);
  if (step.isError()) {
    return failed(
        "assign " + annotation.macAddress + " to '" + interfaceName + "'",
        step);
  }

  step = backend->addDefaultRoute(netns, interfaceName, annotation.gatewayIp);
  if (step.isError()) {
    return failed(
        "add a default route via " + annotation.gatewayIp, step);
  }

  guard.release();

  logger->info(
      "Configured '" + interfaceName + "' (" + annotation.ipAddress + ", " +
      annotation.macAddress + ") in the network namespace of pid " +
      netns.get());

  return veth.outside;
}

} // namespace cni {
} // namespace internal {
} // namespace ovncni {
