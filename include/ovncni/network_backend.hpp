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

#ifndef __OVNCNI_NETWORK_BACKEND_HPP__
#define __OVNCNI_NETWORK_BACKEND_HPP__

#include <sys/types.h>

#include <string>

#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

namespace ovncni {

/**
 * Link, namespace, address and route operations used to wire a
 * container into the overlay.
 *
 * Operations taking a `netns` run inside the network namespace whose
 * handle is named `netns` (see `linkNamespace`); `None()` means the
 * host's namespace.
 */
class NetworkBackend
{
public:
  virtual ~NetworkBackend() {}

  // Creates the directory holding namespace handles. Succeeds if the
  // directory already exists.
  virtual Try<Nothing> createNamespaceDirectory() = 0;

  // Makes the network namespace of `pid` addressable under the handle
  // name `stringify(pid)`. Succeeds without change if the handle exists.
  virtual Try<Nothing> linkNamespace(pid_t pid) = 0;

  // Removes the handle created by `linkNamespace`.
  virtual Try<Nothing> unlinkNamespace(pid_t pid) = 0;

  // Whether a link named `link` exists in the host's namespace.
  virtual bool linkExists(const std::string& link) = 0;

  virtual Try<Nothing> createVethPair(
      const std::string& outside,
      const std::string& inside) = 0;

  virtual Try<Nothing> deleteLink(const std::string& link) = 0;

  // Moves a host link into the network namespace of `pid`.
  virtual Try<Nothing> moveLink(const std::string& link, pid_t pid) = 0;

  virtual Try<Nothing> renameLink(
      const Option<std::string>& netns,
      const std::string& link,
      const std::string& name) = 0;

  virtual Try<Nothing> setLinkUp(
      const Option<std::string>& netns,
      const std::string& link) = 0;

  virtual Try<Nothing> setMtu(
      const Option<std::string>& netns,
      const std::string& link,
      unsigned int mtu) = 0;

  virtual Try<Nothing> setMac(
      const Option<std::string>& netns,
      const std::string& link,
      const std::string& mac) = 0;

  // Assigns `address` in CIDR notation, e.g., "10.0.0.5/24".
  virtual Try<Nothing> addAddress(
      const Option<std::string>& netns,
      const std::string& link,
      const std::string& address) = 0;

  virtual Try<Nothing> addDefaultRoute(
      const Option<std::string>& netns,
      const std::string& link,
      const std::string& gateway) = 0;
};

} // namespace ovncni {

#endif // __OVNCNI_NETWORK_BACKEND_HPP__
