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

#ifndef __LINUX_IP_BACKEND_HPP__
#define __LINUX_IP_BACKEND_HPP__

// This file contains Linux-only OS utilities.
#ifndef __linux__
#error "linux/ip_backend.hpp is only available on Linux systems."
#endif

#include <string>
#include <vector>

#include <ovncni/network_backend.hpp>

#include <process/owned.hpp>

#include "common/command_utils.hpp"

namespace ovncni {
namespace internal {
namespace routing {

constexpr char DEFAULT_IP[] = "ip";

// `ip netns exec` only looks for namespace handles here.
constexpr char DEFAULT_NETNS_DIR[] = "/var/run/netns";

constexpr char DEFAULT_SYS_NET_DIR[] = "/sys/class/net";


// Configures links with iproute2's `ip`. Namespace handles are symlinks
// `<netnsDir>/<pid>` to `<procDir>/<pid>/ns/net`, which is what lets
// `ip netns exec <pid>` enter a container's network namespace. Host
// links are looked up under `<sysNetDir>`.
class IpBackend : public NetworkBackend
{
public:
  explicit IpBackend(
      const process::Owned<command::Executor>& executor,
      const std::string& ip = DEFAULT_IP,
      const std::string& netnsDir = DEFAULT_NETNS_DIR,
      const std::string& procDir = "/proc",
      const std::string& sysNetDir = DEFAULT_SYS_NET_DIR);

  Try<Nothing> createNamespaceDirectory() override;
  Try<Nothing> linkNamespace(pid_t pid) override;
  Try<Nothing> unlinkNamespace(pid_t pid) override;

  bool linkExists(const std::string& link) override;

  Try<Nothing> createVethPair(
      const std::string& outside,
      const std::string& inside) override;

  Try<Nothing> deleteLink(const std::string& link) override;
  Try<Nothing> moveLink(const std::string& link, pid_t pid) override;

  Try<Nothing> renameLink(
      const Option<std::string>& netns,
      const std::string& link,
      const std::string& name) override;

  Try<Nothing> setLinkUp(
      const Option<std::string>& netns,
      const std::string& link) override;

  Try<Nothing> setMtu(
      const Option<std::string>& netns,
      const std::string& link,
      unsigned int mtu) override;

  Try<Nothing> setMac(
      const Option<std::string>& netns,
      const std::string& link,
      const std::string& mac) override;

  Try<Nothing> addAddress(
      const Option<std::string>& netns,
      const std::string& link,
      const std::string& address) override;

  Try<Nothing> addDefaultRoute(
      const Option<std::string>& netns,
      const std::string& link,
      const std::string& gateway) override;

  // Path of the namespace handle of `pid`.
  std::string handle(pid_t pid) const;

private:
  // Runs `ip <args>`, or `ip netns exec <netns> ip <args>`.
  Try<Nothing> run(
      const Option<std::string>& netns,
      const std::vector<std::string>& args);

  process::Owned<command::Executor> executor;
  const std::string ip;
  const std::string netnsDir;
  const std::string procDir;
  const std::string sysNetDir;
};

} // namespace routing {
} // namespace internal {
} // namespace ovncni {

#endif // __LINUX_IP_BACKEND_HPP__
