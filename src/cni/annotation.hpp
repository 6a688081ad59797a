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

#ifndef __CNI_ANNOTATION_HPP__
#define __CNI_ANNOTATION_HPP__

#include <stddef.h>

#include <string>

#include <ovncni/annotation_store.hpp>
#include <ovncni/logger.hpp>

#include <stout/duration.hpp>
#include <stout/json.hpp>
#include <stout/jsonify.hpp>
#include <stout/try.hpp>

#include "cni/spec.hpp"

namespace ovncni {
namespace internal {
namespace cni {

constexpr char DEFAULT_ANNOTATION_KEY[] = "ovn";
constexpr size_t DEFAULT_ANNOTATION_ATTEMPTS = 30;
constexpr Duration DEFAULT_ANNOTATION_INTERVAL = Milliseconds(100);


// Addressing the control plane assigned to a pod.
struct NetworkAnnotation
{
  // Decodes the value stored under the annotation key. Kubernetes keeps
  // annotation values as strings, so `value` is either a string holding
  // a JSON object or (for stores that decode it already) the object.
  static Try<NetworkAnnotation, spec::PluginError> parse(
      const JSON::Value& value);

  std::string ipAddress;  // CIDR, e.g., "10.0.0.5/24".
  std::string macAddress;
  std::string gatewayIp;
};


// Produces the ADD result, with keys in the order the runtime expects:
// {"ip_address":"...","gateway_ip":"...","mac_address":"..."}.
void json(JSON::ObjectWriter* writer, const NetworkAnnotation& annotation);


struct WaitPolicy
{
  size_t attempts = DEFAULT_ANNOTATION_ATTEMPTS;
  Duration interval = DEFAULT_ANNOTATION_INTERVAL;
};


/**
 * Polls the control plane until it has published the network
 * annotation of a pod.
 *
 * Failed queries count as "not yet available". The first annotation
 * found under the key ends the wait; if it does not decode, that is a
 * validation error right away rather than another retry.
 */
class AnnotationWaiter
{
public:
  AnnotationWaiter(
      AnnotationStore* store,
      Logger* logger,
      const std::string& key = DEFAULT_ANNOTATION_KEY,
      const WaitPolicy& policy = WaitPolicy());

  Try<NetworkAnnotation, spec::PluginError> wait(
      const std::string& ns,
      const std::string& name);

private:
  AnnotationStore* store;
  Logger* logger;
  const std::string key;
  const WaitPolicy policy;
};

} // namespace cni {
} // namespace internal {
} // namespace ovncni {

#endif // __CNI_ANNOTATION_HPP__
