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

#ifndef __CNI_SPEC_HPP__
#define __CNI_SPEC_HPP__

#include <stdint.h>

#include <string>

#include <stout/error.hpp>
#include <stout/option.hpp>

namespace ovncni {
namespace internal {
namespace cni {
namespace spec {

constexpr char CNI_VERSION[] = "0.1.0";

// Codes below 100 are reserved by CNI itself for its own
// well-known errors; everything this plugin reports is plugin-specific.
constexpr uint32_t CNI_ERROR_UNEXPECTED = 100;
constexpr uint32_t CNI_ERROR_CONFIGURATION = 101;
constexpr uint32_t CNI_ERROR_DIRECTORY = 102;
constexpr uint32_t CNI_ERROR_TIMEOUT = 103;
constexpr uint32_t CNI_ERROR_VALIDATION = 104;
constexpr uint32_t CNI_ERROR_PROVISIONING = 105;
constexpr uint32_t CNI_ERROR_BINDING = 106;
constexpr uint32_t CNI_ERROR_TEARDOWN = 107;


class PluginError : public ::Error
{
public:
  PluginError(
      const std::string& message,
      uint32_t _code,
      const Option<std::string>& _details = None())
    : Error(message), code(_code), details(_details) {}

  const uint32_t code;
  const Option<std::string> details;
};


inline PluginError ConfigurationError(
    const std::string& message,
    const Option<std::string>& details = None())
{
  return PluginError(message, CNI_ERROR_CONFIGURATION, details);
}


inline PluginError DirectoryError(
    const std::string& message,
    const Option<std::string>& details = None())
{
  return PluginError(message, CNI_ERROR_DIRECTORY, details);
}


inline PluginError TimeoutError(
    const std::string& message,
    const Option<std::string>& details = None())
{
  return PluginError(message, CNI_ERROR_TIMEOUT, details);
}


inline PluginError ValidationError(
    const std::string& message,
    const Option<std::string>& details = None())
{
  return PluginError(message, CNI_ERROR_VALIDATION, details);
}


inline PluginError ProvisioningError(
    const std::string& message,
    const Option<std::string>& details = None())
{
  return PluginError(message, CNI_ERROR_PROVISIONING, details);
}


inline PluginError BindingError(
    const std::string& message,
    const Option<std::string>& details = None())
{
  return PluginError(message, CNI_ERROR_BINDING, details);
}


// Serializes `error` into the CNI error object, e.g.,
// {"cniVersion":"0.1.0","code":105,"message":"...","details":"..."}.
// Empty details are omitted.
std::string error(const PluginError& error);


// The reply to the VERSION command.
std::string versionInfo();

} // namespace spec {
} // namespace cni {
} // namespace internal {
} // namespace ovncni {

#endif // __CNI_SPEC_HPP__
