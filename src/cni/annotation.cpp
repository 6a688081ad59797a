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

#include <map>

#include <stout/ip.hpp>
#include <stout/mac.hpp>
#include <stout/nothing.hpp>
#include <stout/os.hpp>
#include <stout/stringify.hpp>

#include "cni/annotation.hpp"

using std::map;
using std::string;

namespace ovncni {
namespace internal {
namespace cni {

using spec::PluginError;

static Try<string, PluginError> field(
    const JSON::Object& object,
    const string& name)
{
  map<string, JSON::Value>::const_iterator it = object.values.find(name);

  if (it == object.values.end()) {
    return spec::ValidationError(
        "Network annotation is missing '" + name + "'",
        stringify(object));
  }

  if (!it->second.is<JSON::String>()) {
    return spec::ValidationError(
        "Network annotation field '" + name + "' is not a string",
        stringify(object));
  }

  const string& value = it->second.as<JSON::String>().value;
  if (value.empty()) {
    return spec::ValidationError(
        "Network annotation field '" + name + "' is empty",
        stringify(object));
  }

  return value;
}


Try<NetworkAnnotation, PluginError> NetworkAnnotation::parse(
    const JSON::Value& value)
{
  JSON::Object object;

  if (value.is<JSON::Object>()) {
    object = value.as<JSON::Object>();
  } else if (value.is<JSON::String>()) {
    Try<JSON::Object> parse =
      JSON::parse<JSON::Object>(value.as<JSON::String>().value);

    if (parse.isError()) {
      return spec::ValidationError(
          "Network annotation is not a JSON object",
          parse.error());
    }

    object = parse.get();
  } else {
    return spec::ValidationError(
        "Network annotation has an unexpected type",
        stringify(value));
  }

  Try<string, PluginError> ipAddress = field(object, "ip_address");
  if (ipAddress.isError()) {
    return ipAddress.error();
  }

  Try<string, PluginError> macAddress = field(object, "mac_address");
  if (macAddress.isError()) {
    return macAddress.error();
  }

  Try<string, PluginError> gatewayIp = field(object, "gateway_ip");
  if (gatewayIp.isError()) {
    return gatewayIp.error();
  }

  Try<net::IP::Network> network = net::IP::Network::parse(ipAddress.get());
  if (network.isError()) {
    return spec::ValidationError(
        "Invalid 'ip_address' '" + ipAddress.get() + "' in network annotation",
        network.error());
  }

  Try<net::MAC> mac = net::MAC::parse(macAddress.get());
  if (mac.isError()) {
    return spec::ValidationError(
        "Invalid 'mac_address' '" + macAddress.get() +
        "' in network annotation",
        mac.error());
  }

  Try<net::IP> gateway = net::IP::parse(gatewayIp.get());
  if (gateway.isError()) {
    return spec::ValidationError(
        "Invalid 'gateway_ip' '" + gatewayIp.get() + "' in network annotation",
        gateway.error());
  }

  NetworkAnnotation annotation;
  annotation.ipAddress = ipAddress.get();
  annotation.macAddress = macAddress.get();
  annotation.gatewayIp = gatewayIp.get();

  return annotation;
}


void json(JSON::ObjectWriter* writer, const NetworkAnnotation& annotation)
{
  writer->field("ip_address", annotation.ipAddress);
  writer->field("gateway_ip", annotation.gatewayIp);
  writer->field("mac_address", annotation.macAddress);
}


// The control plane may create the key before filling it in.
static bool empty(const JSON::Value& value)
{
  if (value.is<JSON::Null>()) {
    return true;
  } else if (value.is<JSON::String>()) {
    return value.as<JSON::String>().value.empty();
  } else if (value.is<JSON::Object>()) {
    return value.as<JSON::Object>().values.empty();
  }

  return false;
}


AnnotationWaiter::AnnotationWaiter(
    AnnotationStore* _store,
    Logger* _logger,
    const string& _key,
    const WaitPolicy& _policy)
  : store(_store),
    logger(_logger),
    key(_key),
    policy(_policy) {}


Try<NetworkAnnotation, PluginError> AnnotationWaiter::wait(
    const string& ns,
    const string& name)
{
  const string pod = ns + "/" + name;

  for (size_t attempt = 1; attempt <= policy.attempts; attempt++) {
    Try<Option<JSON::Object>> annotations = store->annotations(ns, name);

    if (annotations.isError()) {
      logger->warning(
          "Failed to query annotations of pod '" + pod + "' (attempt " +
          stringify(attempt) + " of " + stringify(policy.attempts) + "): " +
          annotations.error());
    } else if (annotations->isSome()) {
      const JSON::Object& object = annotations->get();

      map<string, JSON::Value>::const_iterator it = object.values.find(key);
      if (it != object.values.end() && !empty(it->second)) {
        logger->info(
            "Found annotation '" + key + "' on pod '" + pod + "' after " +
            stringify(attempt) + " attempt(s)");

        return NetworkAnnotation::parse(it->second);
      }
    }

    if (attempt < policy.attempts) {
      Try<Nothing> sleep = os::sleep(policy.interval);
      if (sleep.isError()) {
        return PluginError(
            "Failed to wait for the annotation of pod '" + pod + "'",
            spec::CNI_ERROR_UNEXPECTED,
            sleep.error());
      }
    }
  }

  return spec::TimeoutError(
      "Timed out waiting for annotation '" + key + "' on pod '" + pod + "'",
      "Gave up after " + stringify(policy.attempts) + " attempts " +
      stringify(policy.interval) + " apart");
}

} // namespace cni {
} // namespace internal {
} // namespace ovncni {
