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

#include <stout/error.hpp>
#include <stout/fs.hpp>
#include <stout/nothing.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/stringify.hpp>

#include <stout/os/exists.hpp>
#include <stout/os/mkdir.hpp>
#include <stout/os/rm.hpp>
#include <stout/os/stat.hpp>

#include "linux/ip_backend.hpp"

using std::string;
using std::vector;

using process::Owned;

namespace ovncni {
namespace internal {
namespace routing {

IpBackend::IpBackend(
    const Owned<command::Executor>& _executor,
    const string& _ip,
    const string& _netnsDir,
    const string& _procDir,
    const string& _sysNetDir)
  : executor(_executor),
    ip(_ip),
    netnsDir(_netnsDir),
    procDir(_procDir),
    sysNetDir(_sysNetDir) {}


string IpBackend::handle(pid_t pid) const
{
  return path::join(netnsDir, stringify(pid));
}


Try<Nothing> IpBackend::createNamespaceDirectory()
{
  // A recursive mkdir treats an existing directory as success, which
  // matters since concurrent invocations race to create it.
  Try<Nothing> mkdir = os::mkdir(netnsDir, true);
  if (mkdir.isError()) {
    return Error(
        "Failed to create directory '" + netnsDir + "': " + mkdir.error());
  }

  return Nothing();
}


Try<Nothing> IpBackend::linkNamespace(pid_t pid)
{
  const string link = handle(pid);

  if (os::stat::islink(link) || os::exists(link)) {
    return Nothing();
  }

  const string target = path::join(procDir, stringify(pid), "ns", "net");

  Try<Nothing> symlink = fs::symlink(target, link);
  if (symlink.isError()) {
    return Error(
        "Failed to symlink '" + target + "' to '" + link + "': " +
        symlink.error());
  }

  return Nothing();
}


Try<Nothing> IpBackend::unlinkNamespace(pid_t pid)
{
  const string link = handle(pid);

  Try<Nothing> rm = os::rm(link);
  if (rm.isError()) {
    return Error("Failed to remove '" + link + "': " + rm.error());
  }

  return Nothing();
}


bool IpBackend::linkExists(const string& link)
{
  return os::exists(path::join(sysNetDir, link));
}


Try<Nothing> IpBackend::createVethPair(
    const string& outside,
    const string& inside)
{
  return run(None(), {"link", "add", outside, "type", "veth",
                      "peer", "name", inside});
}


Try<Nothing> IpBackend::deleteLink(const string& link)
{
  return run(None(), {"link", "del", link});
}


Try<Nothing> IpBackend::moveLink(const string& link, pid_t pid)
{
  return run(None(), {"link", "set", link, "netns", stringify(pid)});
}


Try<Nothing> IpBackend::renameLink(
    const Option<string>& netns,
    const string& link,
    const string& name)
{
  return run(netns, {"link", "set", "dev", link, "name", name});
}


Try<Nothing> IpBackend::setLinkUp(
    const Option<string>& netns,
    const string& link)
{
  return run(netns, {"link", "set", "dev", link, "up"});
}


Try<Nothing> IpBackend::setMtu(
    const Option<string>& netns,
    const string& link,
    unsigned int mtu)
{
  return run(netns, {"link", "set", "dev", link, "mtu", stringify(mtu)});
}


Try<Nothing> IpBackend::setMac(
    const Option<string>& netns,
    const string& link,
    const string& mac)
{
  return run(netns, {"link", "set", "dev", link, "address", mac});
}


Try<Nothing> IpBackend::addAddress(
    const Option<string>& netns,
    const string& link,
    const string& address)
{
  return run(netns, {"addr", "add", address, "dev", link});
}


Try<Nothing> IpBackend::addDefaultRoute(
    const Option<string>& netns,
    const string& link,
    const string& gateway)
{
  return run(netns, {"route", "add", "default", "via", gateway, "dev", link});
}


Try<Nothing> IpBackend::run(
    const Option<string>& netns,
    const vector<string>& args)
{
  vector<string> argv;

  if (netns.isSome()) {
    argv = {ip, "netns", "exec", netns.get()};
  }

  argv.push_back(ip);
  argv.insert(argv.end(), args.begin(), args.end());

  Try<string> output = executor->execute(argv);
  if (output.isError()) {
    return Error(output.error());
  }

  return Nothing();
}

} // namespace routing {
} // namespace internal {
} // namespace ovncni {
