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

#ifndef __KUBERNETES_API_CLIENT_HPP__
#define __KUBERNETES_API_CLIENT_HPP__

#include <string>

#include <ovncni/annotation_store.hpp>

#include <process/http.hpp>
#include <process/owned.hpp>

#include <stout/duration.hpp>
#include <stout/json.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

namespace ovncni {
namespace internal {
namespace kubernetes {

// Returns `metadata.annotations` of a pod object as served by the
// API server, or none if the pod carries no annotations.
Try<Option<JSON::Object>> annotations(const std::string& pod);


// Path of the pod resource `name` in namespace `ns`.
std::string podPath(const std::string& ns, const std::string& name);


// Reads pod annotations from the Kubernetes API server.
class ApiClient : public AnnotationStore
{
public:
  // `tokenFile`, if given, holds the bearer token sent with every
  // request.
  static Try<process::Owned<ApiClient>> create(
      const std::string& server,
      const Option<std::string>& tokenFile,
      const Duration& timeout);

  Try<Option<JSON::Object>> annotations(
      const std::string& ns,
      const std::string& name) override;

private:
  ApiClient(
      const process::http::URL& server,
      const Option<std::string>& token,
      const Duration& timeout);

  const process::http::URL server;
  const Option<std::string> token;
  const Duration timeout;
};

} // namespace kubernetes {
} // namespace internal {
} // namespace ovncni {

#endif // __KUBERNETES_API_CLIENT_HPP__
