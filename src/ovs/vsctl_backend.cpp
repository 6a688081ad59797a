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

#include <vector>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/nothing.hpp>
#include <stout/strings.hpp>

#include "ovs/vsctl_backend.hpp"

using std::map;
using std::string;
using std::vector;

using process::Owned;

namespace ovncni {
namespace internal {
namespace ovs {

// Quotes `value` as an OVSDB string atom so that pod names and
// addresses are never parsed as anything else.
static string quote(const string& value)
{
  return "\"" + strings::replace(value, "\"", "\\\"") + "\"";
}


VsctlBackend::VsctlBackend(
    const Owned<command::Executor>& _executor,
    const string& _vsctl,
    const string& _bridge)
  : executor(_executor),
    vsctl(_vsctl),
    bridge(_bridge) {}


Try<Nothing> VsctlBackend::addPort(
    const string& port,
    const map<string, string>& externalIds)
{
  vector<string> argv = {vsctl, "add-port", bridge, port};

  if (!externalIds.empty()) {
    argv.insert(argv.end(), {"--", "set", "interface", port});

    foreachpair (const string& key, const string& value, externalIds) {
      argv.push_back("external_ids:" + key + "=" + quote(value));
    }
  }

  Try<string> output = executor->execute(argv);
  if (output.isError()) {
    return Error(output.error());
  }

  return Nothing();
}


Try<Nothing> VsctlBackend::deletePort(const string& port)
{
  Try<string> output =
    executor->execute({vsctl, "--if-exists", "del-port", port});

  if (output.isError()) {
    return Error(output.error());
  }

  return Nothing();
}


Try<Option<string>> VsctlBackend::get(
    const string& port,
    const string& column)
{
  Try<string> output =
    executor->execute({vsctl, "--if-exists", "get", "interface", port, column});

  if (output.isError()) {
    return Error(output.error());
  }

  // Strings come back quoted only when OVSDB needs the quotes.
  const string value = strings::trim(strings::trim(output.get()), "\"");
  if (value.empty()) {
    return None();
  }

  return value;
}

} // namespace ovs {
} // namespace internal {
} // namespace ovncni {
