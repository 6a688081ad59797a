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

#ifndef __CNI_PLUGIN_HPP__
#define __CNI_PLUGIN_HPP__

#include <sys/types.h>

#include <map>
#include <ostream>
#include <string>

#include <ovncni/annotation_store.hpp>
#include <ovncni/logger.hpp>
#include <ovncni/network_backend.hpp>
#include <ovncni/switch_backend.hpp>

#include <process/owned.hpp>

#include <stout/option.hpp>
#include <stout/try.hpp>

#include "cni/flags.hpp"
#include "cni/spec.hpp"

namespace ovncni {
namespace internal {
namespace cni {

constexpr char CNI_COMMAND_ADD[] = "ADD";
constexpr char CNI_COMMAND_DEL[] = "DEL";
constexpr char CNI_COMMAND_VERSION[] = "VERSION";

// Keys of the CNI_ARGS pairs the runtime passes for Kubernetes pods.
constexpr char K8S_POD_NAMESPACE[] = "K8S_POD_NAMESPACE";
constexpr char K8S_POD_NAME[] = "K8S_POD_NAME";
constexpr char K8S_POD_INFRA_CONTAINER_ID[] = "K8S_POD_INFRA_CONTAINER_ID";


// Extracts the pid from a network namespace path of the form
// `/proc/<pid>/ns/net`.
Try<pid_t, spec::PluginError> pidFromNetns(const std::string& path);


// One ADD or DEL invocation, as described by the CNI_* environment.
struct AttachmentRequest
{
  static Try<AttachmentRequest, spec::PluginError> parse(
      const std::map<std::string, std::string>& environment);

  std::string command;
  std::string containerId;
  std::string podNamespace;
  std::string podName;
  std::string interfaceName;
  std::string networkNamespacePath;
  pid_t pid;
};


// Writes `error` to `out` as the CNI error object and returns the exit
// status of a failed invocation.
int report(const spec::PluginError& error, std::ostream& out);


/**
 * Entry point of an invocation: validates the request and runs ADD
 * (wait for the annotation, provision the interface, bind the switch
 * port) or DEL (tear down).
 *
 * `execute` returns what should be printed on success, and every
 * failure as a `PluginError`. `run` is the only place writing the
 * result, so exactly one JSON object (or nothing) reaches `out`.
 */
class Plugin
{
public:
  // Wires the plugin to the production backends. The Kubernetes API
  // client is only built once an ADD needs it, so VERSION and DEL work
  // whatever the API server settings are.
  static process::Owned<Plugin> create(const Flags& flags, Logger* logger);

  // A null `store` is replaced by an API client on first use.
  Plugin(
      const Flags& flags,
      Logger* logger,
      const process::Owned<NetworkBackend>& network,
      const process::Owned<SwitchBackend>& vswitch,
      const process::Owned<AnnotationStore>& store);

  Try<Option<std::string>, spec::PluginError> execute(
      const std::map<std::string, std::string>& environment);

  // Executes one invocation and writes its result, or its error, to
  // `out`. Exceptions escaping `execute` are reported as unexpected
  // errors. Returns the exit status of the process.
  int run(
      const std::map<std::string, std::string>& environment,
      std::ostream& out);

private:
  Try<Option<std::string>, spec::PluginError> add(
      const AttachmentRequest& request);

  Try<Option<std::string>, spec::PluginError> del(
      const AttachmentRequest& request);

  Try<AnnotationStore*, spec::PluginError> annotationStore();

  const Flags flags;
  Logger* logger;
  process::Owned<NetworkBackend> network;
  process::Owned<SwitchBackend> vswitch;
  process::Owned<AnnotationStore> store;
};

} // namespace cni {
} // namespace internal {
} // namespace ovncni {

#endif // __CNI_PLUGIN_HPP__
