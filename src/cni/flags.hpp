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

#ifndef __CNI_FLAGS_HPP__
#define __CNI_FLAGS_HPP__

#include <stddef.h>

#include <string>

#include <stout/duration.hpp>
#include <stout/flags.hpp>
#include <stout/option.hpp>

#include "logging/flags.hpp"

namespace ovncni {
namespace internal {
namespace cni {

// Plugin configuration. The runtime only hands the plugin the CNI_*
// environment, so everything here comes from OVNCNI_* environment
// variables or the command line, with defaults for a standard node.
class Flags : public virtual logging::Flags
{
public:
  Flags();

  std::string k8s_api_server;
  Option<std::string> k8s_token_file;
  Duration k8s_request_timeout;
  std::string annotation_key;
  size_t annotation_attempts;
  Duration annotation_interval;
  std::string bridge;
  std::string ovs_vsctl;
  std::string ip;
  std::string netns_dir;
  unsigned int mtu;
};

} // namespace cni {
} // namespace internal {
} // namespace ovncni {

#endif // __CNI_FLAGS_HPP__
