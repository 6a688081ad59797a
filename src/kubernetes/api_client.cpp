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

#include <process/future.hpp>
#include <process/http.hpp>

#include <stout/error.hpp>
#include <stout/none.hpp>
#include <stout/path.hpp>
#include <stout/result.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>

#include <stout/os/read.hpp>

#include "kubernetes/api_client.hpp"

namespace http = process::http;

using std::string;

using process::Future;
using process::Owned;

namespace ovncni {
namespace internal {
namespace kubernetes {

Try<Option<JSON::Object>> annotations(const string& pod)
{
  Try<JSON::Object> object = JSON::parse<JSON::Object>(pod);
  if (object.isError()) {
    return Error("Failed to parse the pod object: " + object.error());
  }

  Result<JSON::Object> annotations =
    object->find<JSON::Object>("metadata.annotations");

  if (annotations.isError()) {
    return Error(
        "Unexpected 'metadata.annotations' in the pod object: " +
        annotations.error());
  } else if (annotations.isNone()) {
    return None();
  }

  return annotations.get();
}


string podPath(const string& ns, const string& name)
{
  return "/api/v1/namespaces/" + ns + "/pods/" + name;
}


Try<Owned<ApiClient>> ApiClient::create(
    const string& server,
    const Option<string>& tokenFile,
    const Duration& timeout)
{
  Try<http::URL> url = http::URL::parse(server);
  if (url.isError()) {
    return Error(
        "Failed to parse the API server URL '" + server + "': " + url.error());
  }

  Option<string> token;
  if (tokenFile.isSome()) {
    Try<string> read = os::read(tokenFile.get());
    if (read.isError()) {
      return Error(
          "Failed to read the API token from '" + tokenFile.get() + "': " +
          read.error());
    }

    token = strings::trim(read.get());
  }

  return Owned<ApiClient>(new ApiClient(url.get(), token, timeout));
}


ApiClient::ApiClient(
    const http::URL& _server,
    const Option<string>& _token,
    const Duration& _timeout)
  : server(_server),
    token(_token),
    timeout(_timeout) {}


Try<Option<JSON::Object>> ApiClient::annotations(
    const string& ns,
    const string& name)
{
  http::URL url = server;
  url.path = path::join(server.path, podPath(ns, name));

  http::Headers headers;
  headers["Accept"] = "application/json";

  if (token.isSome()) {
    headers["Authorization"] = "Bearer " + token.get();
  }

  Future<http::Response> response = http::get(url, headers);

  if (!response.await(timeout)) {
    response.discard();
    return Error(
        "Timed out after " + stringify(timeout) + " querying pod '" +
        ns + "/" + name + "'");
  }

  if (!response.isReady()) {
    return Error(
        "Failed to query pod '" + ns + "/" + name + "': " +
        (response.isFailed() ? response.failure() : "discarded"));
  }

  // The pod may not be visible to this node's view of the API yet.
  if (response->code == http::Status::NOT_FOUND) {
    return None();
  }

  if (response->code != http::Status::OK) {
    return Error(
        "Unexpected response querying pod '" + ns + "/" + name + "': " +
        response->status + ": " + response->body);
  }

  return kubernetes::annotations(response->body);
}

} // namespace kubernetes {
} // namespace internal {
} // namespace ovncni {
