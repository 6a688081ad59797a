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


#include <stdlib.h>

#include <map>
#include <sstream>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include <process/owned.hpp>

#include <stout/duration.hpp>
#include <stout/foreach.hpp>
#include <stout/gtest.hpp>
#include <stout/json.hpp>
#include <stout/none.hpp>
#include <stout/path.hpp>
#include <stout/result.hpp>
#include <stout/strings.hpp>

#include "cni/flags.hpp"
#include "cni/plugin.hpp"
#include "cni/spec.hpp"

#include "tests/mock_backends.hpp"
#include "tests/utils.hpp"

using std::map;
using std::string;

using process::Owned;

namespace ovncni {
namespace internal {
namespace tests {

using cni::AttachmentRequest;
using cni::Plugin;

using cni::spec::PluginError;

static const char CONTAINER_ID[] = "abcdef0123456789";


static map<string, string> environment(const string& command)
{
  return {
    {"CNI_COMMAND", command},
    {"CNI_IFNAME", "eth0"},
    {"CNI_NETNS", "/proc/4242/ns/net"},
    {"CNI_ARGS",
     "IgnoreUnknown=1;"
     "K8S_POD_NAMESPACE=default;"
     "K8S_POD_NAME=web-1;"
     "K8S_POD_INFRA_CONTAINER_ID=" + string(CONTAINER_ID)},
    {"PATH", "/usr/sbin:/usr/bin:/sbin:/bin"}
  };
}


TEST(NetnsTest, Pid)
{
  Try<pid_t, PluginError> pid = cni::pidFromNetns("/proc/4242/ns/net");

  ASSERT_FALSE(pid.isError()) << pid.error().message;
  EXPECT_EQ(4242, pid.get());
}


TEST(NetnsTest, Invalid)
{
  const string invalid[] = {
    "",
    "/proc//ns/net",
    "/proc/abc/ns/net",
    "/proc/-1/ns/net",
    "/proc/0/ns/net",
    "/proc/4242/ns/net/",
    "/proc/4242/ns/mnt",
    "proc/4242/ns/net",
    "/var/run/netns/4242",
    "/proc/4242/../1/ns/net",
    "/proc/99999999999999999999/ns/net",
  };

  foreach (const string& path, invalid) {
    Try<pid_t, PluginError> pid = cni::pidFromNetns(path);

    ASSERT_TRUE(pid.isError()) << path;
    EXPECT_EQ(cni::spec::CNI_ERROR_CONFIGURATION, pid.error().code) << path;
  }
}


TEST(AttachmentRequestTest, Parse)
{
  Try<AttachmentRequest, PluginError> request =
    AttachmentRequest::parse(environment("ADD"));

  ASSERT_FALSE(request.isError()) << request.error().message;

  EXPECT_EQ("ADD", request->command);
  EXPECT_EQ(CONTAINER_ID, request->containerId);
  EXPECT_EQ("default", request->podNamespace);
  EXPECT_EQ("web-1", request->podName);
  EXPECT_EQ("eth0", request->interfaceName);
  EXPECT_EQ("/proc/4242/ns/net", request->networkNamespacePath);
  EXPECT_EQ(4242, request->pid);
}


TEST(AttachmentRequestTest, MissingEnvironment)
{
  const string keys[] = {"CNI_COMMAND", "CNI_IFNAME", "CNI_NETNS", "CNI_ARGS"};

  foreach (const string& key, keys) {
    map<string, string> env = environment("ADD");
    env.erase(key);

    Try<AttachmentRequest, PluginError> request =
      AttachmentRequest::parse(env);

    ASSERT_TRUE(request.isError()) << key;
    EXPECT_EQ(cni::spec::CNI_ERROR_CONFIGURATION, request.error().code)
      << key;

    // Present but empty is just as bad.
    env[key] = "";

    request = AttachmentRequest::parse(env);

    ASSERT_TRUE(request.isError()) << key;
    EXPECT_EQ(cni::spec::CNI_ERROR_CONFIGURATION, request.error().code)
      << key;
  }
}


TEST(AttachmentRequestTest, MissingArgs)
{
  const string args[] = {
    "K8S_POD_NAME=web-1;K8S_POD_INFRA_CONTAINER_ID=abc",
    "K8S_POD_NAMESPACE=default;K8S_POD_INFRA_CONTAINER_ID=abc",
    "K8S_POD_NAMESPACE=default;K8S_POD_NAME=web-1",
    "K8S_POD_NAMESPACE=;K8S_POD_NAME=web-1;K8S_POD_INFRA_CONTAINER_ID=abc",
  };

  foreach (const string& value, args) {
    map<string, string> env = environment("DEL");
    env["CNI_ARGS"] = value;

    Try<AttachmentRequest, PluginError> request =
      AttachmentRequest::parse(env);

    ASSERT_TRUE(request.isError()) << value;
    EXPECT_EQ(cni::spec::CNI_ERROR_CONFIGURATION, request.error().code)
      << value;
  }
}


TEST(AttachmentRequestTest, MalformedArgs)
{
  map<string, string> env = environment("ADD");
  env["CNI_ARGS"] = "K8S_POD_NAMESPACE=default;K8S_POD_NAME;"
                    "K8S_POD_INFRA_CONTAINER_ID=abc";

  Try<AttachmentRequest, PluginError> request = AttachmentRequest::parse(env);

  ASSERT_TRUE(request.isError());
  EXPECT_EQ(cni::spec::CNI_ERROR_CONFIGURATION, request.error().code);
}


TEST(AttachmentRequestTest, ArgsValueWithSeparator)
{
  map<string, string> env = environment("ADD");
  env["CNI_ARGS"] = "K8S_POD_NAMESPACE=default;K8S_POD_NAME=a=b;"
                    "K8S_POD_INFRA_CONTAINER_ID=abc;;";

  Try<AttachmentRequest, PluginError> request = AttachmentRequest::parse(env);

  ASSERT_FALSE(request.isError()) << request.error().message;
  EXPECT_EQ("a=b", request->podName);
  EXPECT_EQ("abc", request->containerId);
}


TEST(AttachmentRequestTest, UnknownCommand)
{
  Try<AttachmentRequest, PluginError> request =
    AttachmentRequest::parse(environment("CHECK"));

  ASSERT_TRUE(request.isError());
  EXPECT_EQ(cni::spec::CNI_ERROR_CONFIGURATION, request.error().code);
}


class PluginTest : public ::testing::Test
{
protected:
  PluginTest()
    : network(new FakeNetworkBackend()),
      vswitch(new FakeSwitchBackend()),
      store(new FakeAnnotationStore())
  {
    flags.annotation_interval = Duration::zero();

    plugin.reset(new Plugin(
        flags,
        &logger,
        Owned<NetworkBackend>(network),
        Owned<SwitchBackend>(vswitch),
        Owned<AnnotationStore>(store)));
  }

  cni::Flags flags;
  RecordingLogger logger;

  // Owned by `plugin`.
  FakeNetworkBackend* network;
  FakeSwitchBackend* vswitch;
  FakeAnnotationStore* store;

  Owned<Plugin> plugin;
};


TEST_F(PluginTest, Add)
{
  store->responses.push_back(Option<JSON::Object>::none());
  store->fallback = annotationsWith("ovn", networkAnnotation());

  Try<Option<string>, PluginError> result =
    plugin->execute(environment("ADD"));

  ASSERT_FALSE(result.isError()) << result.error().message;

  EXPECT_SOME_EQ(
      "{\"ip_address\":\"10.0.0.5/24\","
      "\"gateway_ip\":\"10.0.0.1\","
      "\"mac_address\":\"02:00:00:00:00:01\"}",
      result.get());

  EXPECT_EQ(2u, store->queries.size());
  EXPECT_EQ("default/web-1", store->queries.front());

  // The outside end stays in the host and is attached to the switch;
  // the inside end now is the container's `eth0`.
  EXPECT_EQ(1u, network->links.count("abcdef012345678"));
  EXPECT_EQ(1u, network->links.count("eth0"));
  EXPECT_EQ(1u, network->handles.count(4242));

  ASSERT_EQ(1u, vswitch->ports.count("abcdef012345678"));

  map<string, string> externalIds = vswitch->ports["abcdef012345678"];
  EXPECT_EQ("default_web-1", externalIds["iface-id"]);
  EXPECT_EQ("02:00:00:00:00:01", externalIds["attached_mac"]);
  EXPECT_EQ("10.0.0.5/24", externalIds["ip_address"]);
}


TEST_F(PluginTest, AddThenDel)
{
  store->fallback = annotationsWith("ovn", networkAnnotation());

  Try<Option<string>, PluginError> add = plugin->execute(environment("ADD"));
  ASSERT_FALSE(add.isError()) << add.error().message;

  Try<Option<string>, PluginError> del = plugin->execute(environment("DEL"));
  ASSERT_FALSE(del.isError()) << del.error().message;

  // DEL prints nothing.
  EXPECT_NONE(del.get());

  EXPECT_TRUE(vswitch->ports.empty());
  EXPECT_TRUE(network->handles.empty());
  EXPECT_TRUE(logger.warnings.empty());

  // DEL never waits for the annotation.
  EXPECT_EQ(1u, store->queries.size());
}


// DEL of a container whose state is already gone still succeeds.
TEST_F(PluginTest, DelWithFailures)
{
  vswitch->fail("deletePort");
  network->fail("unlinkNamespace");

  Try<Option<string>, PluginError> del = plugin->execute(environment("DEL"));

  ASSERT_FALSE(del.isError()) << del.error().message;
  EXPECT_NONE(del.get());

  EXPECT_TRUE(logged(logger.warnings, "error 107"));
}


TEST_F(PluginTest, AddTimeout)
{
  flags.annotation_attempts = 3;

  plugin.reset(new Plugin(
      flags,
      &logger,
      Owned<NetworkBackend>(network = new FakeNetworkBackend()),
      Owned<SwitchBackend>(vswitch = new FakeSwitchBackend()),
      Owned<AnnotationStore>(store = new FakeAnnotationStore())));

  Try<Option<string>, PluginError> result =
    plugin->execute(environment("ADD"));

  ASSERT_TRUE(result.isError());
  EXPECT_EQ(cni::spec::CNI_ERROR_TIMEOUT, result.error().code);

  EXPECT_EQ(3u, store->queries.size());
  EXPECT_TRUE(network->calls.empty());
  EXPECT_TRUE(vswitch->calls.empty());
}


TEST_F(PluginTest, AddValidationError)
{
  store->fallback = annotationsWith("ovn", "not json");

  Try<Option<string>, PluginError> result =
    plugin->execute(environment("ADD"));

  ASSERT_TRUE(result.isError());
  EXPECT_EQ(cni::spec::CNI_ERROR_VALIDATION, result.error().code);
  EXPECT_TRUE(network->calls.empty());
}


TEST_F(PluginTest, AddProvisioningError)
{
  store->fallback = annotationsWith("ovn", networkAnnotation());
  network->fail("addAddress");

  Try<Option<string>, PluginError> result =
    plugin->execute(environment("ADD"));

  ASSERT_TRUE(result.isError());
  EXPECT_EQ(cni::spec::CNI_ERROR_PROVISIONING, result.error().code);

  EXPECT_TRUE(network->links.empty());
  EXPECT_TRUE(vswitch->calls.empty());
}


// A binding failure leaves the provisioned veth for DEL to clean up.
TEST_F(PluginTest, AddBindingError)
{
  store->fallback = annotationsWith("ovn", networkAnnotation());
  vswitch->fail("addPort");

  Try<Option<string>, PluginError> result =
    plugin->execute(environment("ADD"));

  ASSERT_TRUE(result.isError());
  EXPECT_EQ(cni::spec::CNI_ERROR_BINDING, result.error().code);

  EXPECT_EQ(1u, network->links.count("abcdef012345678"));
}


// An invalid namespace path is rejected before anything is touched.
TEST_F(PluginTest, InvalidNetns)
{
  store->fallback = annotationsWith("ovn", networkAnnotation());

  map<string, string> env = environment("ADD");
  env["CNI_NETNS"] = "/var/run/netns/cni-1234";

  Try<Option<string>, PluginError> result = plugin->execute(env);

  ASSERT_TRUE(result.isError());
  EXPECT_EQ(cni::spec::CNI_ERROR_CONFIGURATION, result.error().code);

  EXPECT_TRUE(store->queries.empty());
  EXPECT_TRUE(network->calls.empty());
  EXPECT_TRUE(vswitch->calls.empty());
}


TEST_F(PluginTest, UnknownCommand)
{
  Try<Option<string>, PluginError> result =
    plugin->execute(environment("CHECK"));

  ASSERT_TRUE(result.isError());
  EXPECT_EQ(cni::spec::CNI_ERROR_CONFIGURATION, result.error().code);
}


TEST_F(PluginTest, Version)
{
  map<string, string> env;
  env["CNI_COMMAND"] = "VERSION";

  Try<Option<string>, PluginError> result = plugin->execute(env);

  ASSERT_FALSE(result.isError()) << result.error().message;
  EXPECT_SOME_EQ(cni::spec::versionInfo(), result.get());

  EXPECT_TRUE(store->queries.empty());
}


TEST_F(PluginTest, RunAdd)
{
  store->fallback = annotationsWith("ovn", networkAnnotation());

  std::ostringstream out;

  EXPECT_EQ(EXIT_SUCCESS, plugin->run(environment("ADD"), out));

  EXPECT_EQ(
      "{\"ip_address\":\"10.0.0.5/24\","
      "\"gateway_ip\":\"10.0.0.1\","
      "\"mac_address\":\"02:00:00:00:00:01\"}",
      out.str());
}


TEST_F(PluginTest, RunDel)
{
  std::ostringstream out;

  EXPECT_EQ(EXIT_SUCCESS, plugin->run(environment("DEL"), out));
  EXPECT_EQ("", out.str());
}


TEST_F(PluginTest, RunAddFailure)
{
  store->fallback = annotationsWith("ovn", networkAnnotation());
  vswitch->fail("addPort");

  std::ostringstream out;

  EXPECT_EQ(EXIT_FAILURE, plugin->run(environment("ADD"), out));

  Try<JSON::Object> error = JSON::parse<JSON::Object>(out.str());
  ASSERT_SOME(error);

  Result<JSON::String> version = error->at<JSON::String>("cniVersion");
  ASSERT_SOME(version);
  EXPECT_EQ(string(cni::spec::CNI_VERSION), version->value);

  Result<JSON::Number> code = error->at<JSON::Number>("code");
  ASSERT_SOME(code);
  EXPECT_EQ(cni::spec::CNI_ERROR_BINDING, code->as<uint64_t>());

  EXPECT_SOME(error->at<JSON::String>("message"));

  EXPECT_EQ(1u, logger.errors.size());
}


class ThrowingAnnotationStore : public FakeAnnotationStore
{
public:
  Try<Option<JSON::Object>> annotations(
      const string& ns,
      const string& name) override
  {
    throw std::runtime_error("connection reset");
  }
};


TEST_F(PluginTest, RunUnexpectedFailure)
{
  plugin.reset(new Plugin(
      flags,
      &logger,
      Owned<NetworkBackend>(network = new FakeNetworkBackend()),
      Owned<SwitchBackend>(vswitch = new FakeSwitchBackend()),
      Owned<AnnotationStore>(store = new ThrowingAnnotationStore())));

  std::ostringstream out;

  EXPECT_EQ(EXIT_FAILURE, plugin->run(environment("ADD"), out));

  Try<JSON::Object> error = JSON::parse<JSON::Object>(out.str());
  ASSERT_SOME(error);

  Result<JSON::Number> code = error->at<JSON::Number>("code");
  ASSERT_SOME(code);
  EXPECT_EQ(cni::spec::CNI_ERROR_UNEXPECTED, code->as<uint64_t>());

  Result<JSON::String> details = error->at<JSON::String>("details");
  ASSERT_SOME(details);
  EXPECT_EQ("connection reset", details->value);

  EXPECT_TRUE(network->calls.empty());
  EXPECT_TRUE(logged(logger.errors, "connection reset"));
}


TEST(ReportTest, Report)
{
  std::ostringstream out;

  EXPECT_EQ(
      EXIT_FAILURE,
      cni::report(cni::spec::ConfigurationError("Bad flag"), out));

  EXPECT_EQ(
      "{\"cniVersion\":\"0.1.0\",\"code\":101,\"message\":\"Bad flag\"}",
      out.str());
}


// The production plugin, with a token file that does not exist. Only ADD
// talks to the API server, so only ADD fails.
class PluginCreateTest : public TemporaryDirectoryTest
{
protected:
  void SetUp() override
  {
    TemporaryDirectoryTest::SetUp();

    flags.k8s_token_file = path::join(sandbox.get(), "missing-token");
    flags.netns_dir = path::join(sandbox.get(), "netns");
    flags.ovs_vsctl = "true";
    flags.annotation_interval = Duration::zero();

    plugin = Plugin::create(flags, &logger);
  }

  cni::Flags flags;
  RecordingLogger logger;
  Owned<Plugin> plugin;
};


TEST_F(PluginCreateTest, VersionWithoutToken)
{
  map<string, string> env;
  env["CNI_COMMAND"] = "VERSION";

  std::ostringstream out;

  EXPECT_EQ(EXIT_SUCCESS, plugin->run(env, out));
  EXPECT_EQ(cni::spec::versionInfo(), out.str());
}


TEST_F(PluginCreateTest, DelWithoutToken)
{
  std::ostringstream out;

  // The namespace handle is missing, which is only logged.
  EXPECT_EQ(EXIT_SUCCESS, plugin->run(environment("DEL"), out));
  EXPECT_EQ("", out.str());

  EXPECT_TRUE(logger.errors.empty());
  EXPECT_TRUE(logged(logger.warnings, "error 107"));
}


TEST_F(PluginCreateTest, AddWithoutToken)
{
  Try<Option<string>, PluginError> result =
    plugin->execute(environment("ADD"));

  ASSERT_TRUE(result.isError());
  EXPECT_EQ(cni::spec::CNI_ERROR_CONFIGURATION, result.error().code);
  EXPECT_TRUE(strings::contains(result.error().message, "Kubernetes"));
}

} // namespace tests {
} // namespace internal {
} // namespace ovncni {
