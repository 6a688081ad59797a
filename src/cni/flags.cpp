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

#include "cni/annotation.hpp"
#include "cni/flags.hpp"
#include "cni/provisioner.hpp"

#include "linux/ip_backend.hpp"

#include "ovs/vsctl_backend.hpp"


ovncni::internal::cni::Flags::Flags()
{
  add(&Flags::k8s_api_server,
      "k8s_api_server",
      "URL of the Kubernetes API server the pod annotations are read from.",
      "http://127.0.0.1:8080");

  add(&Flags::k8s_token_file,
      "k8s_token_file",
      "Path of a file holding a bearer token to authenticate to the\n"
      "Kubernetes API server with. No authentication if not specified.");

  add(&Flags::k8s_request_timeout,
      "k8s_request_timeout",
      "How long a single query to the Kubernetes API server may take\n"
      "before it counts as a failed attempt.",
      Seconds(5));

  add(&Flags::annotation_key,
      "annotation_key",
      "Pod annotation holding the network configuration of the pod.",
      DEFAULT_ANNOTATION_KEY);

  add(&Flags::annotation_attempts,
      "annotation_attempts",
      "Number of times the pod annotation is polled before giving up.",
      DEFAULT_ANNOTATION_ATTEMPTS,
      [](size_t value) -> Option<Error> {
        if (value == 0) {
          return Error("Expected --annotation_attempts to be positive");
        }
        return None();
      });

  add(&Flags::annotation_interval,
      "annotation_interval",
      "Time to wait between two polls of the pod annotation.",
      DEFAULT_ANNOTATION_INTERVAL);

  add(&Flags::bridge,
      "bridge",
      "Open vSwitch bridge the host side of every veth pair is attached to.",
      ovs::DEFAULT_BRIDGE);

  add(&Flags::ovs_vsctl,
      "ovs_vsctl",
      "The `ovs-vsctl` binary, looked up in PATH unless absolute.",
      ovs::DEFAULT_VSCTL);

  add(&Flags::ip,
      "ip",
      "The `ip` binary (iproute2), looked up in PATH unless absolute.",
      routing::DEFAULT_IP);

  add(&Flags::netns_dir,
      "netns_dir",
      "Directory holding the network namespace handles `ip netns` uses.",
      routing::DEFAULT_NETNS_DIR);

  add(&Flags::mtu,
      "mtu",
      "MTU of the container side interface.",
      DEFAULT_MTU,
      [](unsigned int value) -> Option<Error> {
        if (value < 68) {
          return Error("Expected --mtu to be at least 68");
        }
        return None();
      });
}
