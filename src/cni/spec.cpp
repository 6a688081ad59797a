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

#include <stout/json.hpp>
#include <stout/jsonify.hpp>

#include "cni/spec.hpp"

using std::string;

namespace ovncni {
namespace internal {
namespace cni {
namespace spec {

string error(const PluginError& error)
{
  return jsonify([&error](JSON::ObjectWriter* writer) {
    writer->field("cniVersion", string(CNI_VERSION));
    writer->field("code", error.code);
    writer->field("message", error.message);

    if (error.details.isSome() && !error.details->empty()) {
      writer->field("details", error.details.get());
    }
  });
}


string versionInfo()
{
  return jsonify([](JSON::ObjectWriter* writer) {
    writer->field("cniVersion", string(CNI_VERSION));
    writer->field("supportedVersions", [](JSON::ArrayWriter* writer) {
      writer->element(string(CNI_VERSION));
    });
  });
}

} // namespace spec {
} // namespace cni {
} // namespace internal {
} // namespace ovncni {
