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

#include "cni/naming.hpp"

using std::string;

namespace ovncni {
namespace internal {
namespace cni {

VethPair VethPair::fromContainerId(const string& containerId)
{
  const size_t suffix = sizeof(INSIDE_SUFFIX) - 1;

  VethPair pair;
  pair.outside = containerId.substr(0, MAX_INTERFACE_NAME_LENGTH);
  pair.inside =
    containerId.substr(0, MAX_INTERFACE_NAME_LENGTH - suffix) + INSIDE_SUFFIX;

  return pair;
}


string ifaceId(const string& podNamespace, const string& podName)
{
  return podNamespace + "_" + podName;
}

} // namespace cni {
} // namespace internal {
} // namespace ovncni {
