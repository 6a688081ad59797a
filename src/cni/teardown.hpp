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

#ifndef __CNI_TEARDOWN_HPP__
#define __CNI_TEARDOWN_HPP__

#include <sys/types.h>

#include <string>

#include <ovncni/logger.hpp>
#include <ovncni/network_backend.hpp>
#include <ovncni/switch_backend.hpp>

namespace ovncni {
namespace internal {
namespace cni {

// Undoes what ADD left behind for a container. The container may be
// gone already, so every step is attempted regardless of the others
// and failures are only logged.
class Teardown
{
public:
  Teardown(
      NetworkBackend* network,
      SwitchBackend* vswitch,
      Logger* logger);

  // Returns the number of steps that failed.
  int teardown(const std::string& containerId, pid_t pid);

private:
  NetworkBackend* network;
  SwitchBackend* vswitch;
  Logger* logger;
};

} // namespace cni {
} // namespace internal {
} // namespace ovncni {

#endif // __CNI_TEARDOWN_HPP__
