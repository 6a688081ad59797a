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

#include <stdlib.h>

#include <exception>
#include <vector>

#include <stout/foreach.hpp>
#include <stout/jsonify.hpp>
#include <stout/none.hpp>
#include <stout/numify.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>

#include "cni/annotation.hpp"
#include "cni/plugin.hpp"
#include "cni/provisioner.hpp"
#include "cni/switch_binder.hpp"
#include "cni/teardown.hpp"

#include "common/command_utils.hpp"

#include "kubernetes/api_client.hpp"

#include "linux/ip_backend.hpp"

#include "ovs/vsctl_backend.hpp"

using std::map;
using std::string;
using std::vector;

using process::Owned;

namespace ovncni {
namespace internal {
namespace cni {

using spec::PluginError;


Try<pid_t, PluginError> pidFromNetns(const string& path)
{
  const PluginError invalid = spec::ConfigurationError(
      "Invalid network namespace path '" + path + "'",
      string("Expected '/proc/<pid>/ns/net'"));

  // Splitting "/proc/<pid>/ns/net" yields {"", "proc", "<pid>", "ns",
  // "net"}. Anything else, including a trailing slash, is rejected.
  vector<string> tokens = strings::split(path, "/");
  if (tokens.size() != 5 ||
      !tokens[0].empty() ||
      tokens[1] != "proc" ||
      tokens[3] != "ns" ||
      tokens[4] != "net") {
    return invalid;
  }

  const string& digits = tokens[2];
  if (digits.empty() ||
      digits.find_first_not_of("0123456789") != string::npos) {
    return invalid;
  }

  Try<pid_t> pid = numify<pid_t>(digits);
  if (pid.isError() || pid.get() <= 0) {
    return invalid;
  }

  return pid.get();
}


// Returns the value of `key` in `environment`, which must be non-empty.
static Try<string, PluginError> require(
    const map<string, string>& environment,
    const string& key)
{
  map<string, string>::const_iterator it = environment.find(key);
  if (it == environment.end() || it->second.empty()) {
    return spec::ConfigurationError(
        "Missing required environment variable '" + key + "'");
  }

  return it->second;
}


Try<AttachmentRequest, PluginError> AttachmentRequest::parse(
    const map<string, string>& environment)
{
  AttachmentRequest request;

  Try<string, PluginError> command = require(environment, "CNI_COMMAND");
  if (command.isError()) {
    return command.error();
  }

  request.command = command.get();

  if (request.command != CNI_COMMAND_ADD &&
      request.command != CNI_COMMAND_DEL) {
    return spec::ConfigurationError(
        "Unknown CNI command '" + request.command + "'");
  }

  Try<string, PluginError> ifname = require(environment, "CNI_IFNAME");
  if (ifname.isError()) {
    return ifname.error();
  }

  request.interfaceName = ifname.get();

  Try<string, PluginError> netns = require(environment, "CNI_NETNS");
  if (netns.isError()) {
    return netns.error();
  }

  request.networkNamespacePath = netns.get();

  Try<pid_t, PluginError> pid = pidFromNetns(request.networkNamespacePath);
  if (pid.isError()) {
    return pid.error();
  }

  request.pid = pid.get();

  Try<string, PluginError> args = require(environment, "CNI_ARGS");
  if (args.isError()) {
    return args.error();
  }

  // CNI_ARGS is a list of `KEY=VALUE` pairs separated by ';'. Pairs the
  // plugin does not know about (e.g., `IgnoreUnknown=1`) are skipped.
  map<string, string> pairs;
  foreach (const string& token, strings::tokenize(args.get(), ";")) {
    vector<string> pair = strings::split(token, "=", 2);
    if (pair.size() != 2) {
      return spec::ConfigurationError(
          "Malformed CNI_ARGS entry '" + token + "'",
          string("Expected 'KEY=VALUE'"));
    }

    pairs[strings::trim(pair[0])] = pair[1];
  }

  Try<string, PluginError> podNamespace = require(pairs, K8S_POD_NAMESPACE);
  if (podNamespace.isError()) {
    return podNamespace.error();
  }

  Try<string, PluginError> podName = require(pairs, K8S_POD_NAME);
  if (podName.isError()) {
    return podName.error();
  }

  Try<string, PluginError> containerId =
    require(pairs, K8S_POD_INFRA_CONTAINER_ID);

  if (containerId.isError()) {
    return containerId.error();
  }

  request.podNamespace = podNamespace.get();
  request.podName = podName.get();
  request.containerId = containerId.get();

  return request;
}


int report(const PluginError& error, std::ostream& out)
{
  out << spec::error(error);
  return EXIT_FAILURE;
}


Owned<Plugin> Plugin::create(const Flags& flags, Logger* logger)
{
  Owned<command::Executor> executor(new command::SubprocessExecutor());

  Owned<NetworkBackend> network(
      new routing::IpBackend(executor, flags.ip, flags.netns_dir));

  Owned<SwitchBackend> vswitch(
      new ovs::VsctlBackend(executor, flags.ovs_vsctl, flags.bridge));

  return Owned<Plugin>(
      new Plugin(flags, logger, network, vswitch, Owned<AnnotationStore>()));
}


Plugin::Plugin(
    const Flags& _flags,
    Logger* _logger,
    const Owned<NetworkBackend>& _network,
    const Owned<SwitchBackend>& _vswitch,
    const Owned<AnnotationStore>& _store)
  : flags(_flags),
    logger(_logger),
    network(_network),
    vswitch(_vswitch),
    store(_store) {}


Try<Option<string>, PluginError> Plugin::execute(
    const map<string, string>& environment)
{
  // VERSION carries no other input, so it is answered before the rest
  // of the environment is validated.
  map<string, string>::const_iterator command =
    environment.find("CNI_COMMAND");

  if (command != environment.end() &&
      command->second == CNI_COMMAND_VERSION) {
    return Some(spec::versionInfo());
  }

  Try<AttachmentRequest, PluginError> request =
    AttachmentRequest::parse(environment);

  if (request.isError()) {
    return request.error();
  }

  logger->info(
      "Handling " + request->command + " for container '" +
      request->containerId + "' of pod '" + request->podNamespace + "/" +
      request->podName + "'");

  if (request->command == CNI_COMMAND_ADD) {
    return add(request.get());
  }

  return del(request.get());
}


int Plugin::run(const map<string, string>& environment, std::ostream& out)
{
  try {
    Try<Option<string>, PluginError> result = execute(environment);

    if (result.isError()) {
      logger->error(result.error().message);
      return report(result.error(), out);
    }

    // No trailing newline: stdout carries exactly one JSON object.
    if (result->isSome()) {
      out << result->get();
    }
  } catch (const std::exception& e) {
    logger->error("Unexpected failure: " + string(e.what()));
    return report(
        PluginError(
            "Unexpected failure",
            spec::CNI_ERROR_UNEXPECTED,
            string(e.what())),
        out);
  }

  return EXIT_SUCCESS;
}


Try<AnnotationStore*, PluginError> Plugin::annotationStore()
{
  if (store.get() == nullptr) {
    Try<Owned<kubernetes::ApiClient>> client = kubernetes::ApiClient::create(
        flags.k8s_api_server,
        flags.k8s_token_file,
        flags.k8s_request_timeout);

    if (client.isError()) {
      return spec::ConfigurationError(
          "Failed to create the Kubernetes API client",
          client.error());
    }

    store.reset(client->release());
  }

  return store.get();
}


Try<Option<string>, PluginError> Plugin::add(const AttachmentRequest& request)
{
  WaitPolicy policy;
  policy.attempts = flags.annotation_attempts;
  policy.interval = flags.annotation_interval;

  Try<AnnotationStore*, PluginError> annotations = annotationStore();
  if (annotations.isError()) {
    return annotations.error();
  }

  AnnotationWaiter waiter(
      annotations.get(), logger, flags.annotation_key, policy);

  Try<NetworkAnnotation, PluginError> annotation =
    waiter.wait(request.podNamespace, request.podName);

  if (annotation.isError()) {
    return annotation.error();
  }

  InterfaceProvisioner provisioner(network.get(), logger, flags.mtu);

  Try<string, PluginError> outside = provisioner.provision(
      request.pid,
      request.containerId,
      request.interfaceName,
      annotation.get());

  if (outside.isError()) {
    return outside.error();
  }

  SwitchBinder binder(vswitch.get(), logger);

  Try<SwitchPortBinding, PluginError> binding = binder.bind(
      outside.get(),
      annotation.get(),
      request.podNamespace,
      request.podName);

  if (binding.isError()) {
    return binding.error();
  }

  logger->info(
      "Attached container '" + request.containerId + "' to port '" +
      binding->portName + "' with iface-id '" + binding->ifaceId + "'");

  return Some(string(jsonify(annotation.get())));
}


Try<Option<string>, PluginError> Plugin::del(const AttachmentRequest& request)
{
  Teardown teardown(network.get(), vswitch.get(), logger);

  int failures = teardown.teardown(request.containerId, request.pid);
  if (failures > 0) {
    logger->warning(
        "Teardown of container '" + request.containerId + "' finished with " +
        stringify(failures) + " failed step(s)");
  }

  return None();
}

} // namespace cni {
} // namespace internal {
} // namespace ovncni {
