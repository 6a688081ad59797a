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
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <process/owned.hpp>

#include <stout/error.hpp>
#include <stout/gtest.hpp>

#include "ovs/vsctl_backend.hpp"

#include "tests/mock_backends.hpp"

using std::map;
using std::string;
using std::vector;

using process::Owned;

namespace ovncni {
namespace internal {
namespace tests {

using ovs::VsctlBackend;


class VsctlBackendTest : public ::testing::Test
{
protected:
  VsctlBackendTest()
    : executor(new RecordingExecutor()),
      backend(Owned<command::Executor>(executor)) {}

  // Owned by `backend`.
  RecordingExecutor* executor;
  VsctlBackend backend;
};


TEST_F(VsctlBackendTest, AddPort)
{
  const map<string, string> externalIds = {
    {"attached_mac", "02:00:00:00:00:01"},
    {"iface-id", "default_web-1"},
    {"ip_address", "10.0.0.5/24"}
  };

  ASSERT_SOME(backend.addPort("3f8a1c2be97d40a", externalIds));

  const vector<vector<string>> expected = {
    {"ovs-vsctl", "add-port", "br-int", "3f8a1c2be97d40a",
     "--", "set", "interface", "3f8a1c2be97d40a",
     "external_ids:attached_mac=\"02:00:00:00:00:01\"",
     "external_ids:iface-id=\"default_web-1\"",
     "external_ids:ip_address=\"10.0.0.5/24\""}
  };

  EXPECT_EQ(expected, executor->commands);
}


TEST_F(VsctlBackendTest, AddPortWithoutExternalIds)
{
  ASSERT_SOME(backend.addPort("veth0", map<string, string>()));

  const vector<vector<string>> expected = {
    {"ovs-vsctl", "add-port", "br-int", "veth0"}
  };

  EXPECT_EQ(expected, executor->commands);
}


TEST_F(VsctlBackendTest, QuotesValues)
{
  ASSERT_SOME(backend.addPort("veth0", {{"iface-id", "a\"b"}}));

  ASSERT_EQ(1u, executor->commands.size());
  EXPECT_EQ("external_ids:iface-id=\"a\\\"b\"",
            executor->commands.front().back());
}


TEST_F(VsctlBackendTest, DeletePort)
{
  ASSERT_SOME(backend.deletePort("3f8a1c2be97d40a"));

  const vector<vector<string>> expected = {
    {"ovs-vsctl", "--if-exists", "del-port", "3f8a1c2be97d40a"}
  };

  EXPECT_EQ(expected, executor->commands);
}


TEST_F(VsctlBackendTest, Get)
{
  executor->outputs.push_back(string("\"default_web-1\"\n"));
  executor->outputs.push_back(string("\n"));

  Try<Option<string>> ifaceId =
    backend.get("3f8a1c2be97d40a", "external_ids:iface-id");

  ASSERT_SOME(ifaceId);
  EXPECT_SOME_EQ("default_web-1", ifaceId.get());

  // Missing ports print nothing with `--if-exists`.
  Try<Option<string>> missing =
    backend.get("missing", "external_ids:iface-id");

  ASSERT_SOME(missing);
  EXPECT_NONE(missing.get());

  const vector<string> expected = {
    "ovs-vsctl", "--if-exists", "get", "interface", "3f8a1c2be97d40a",
    "external_ids:iface-id"
  };

  ASSERT_EQ(2u, executor->commands.size());
  EXPECT_EQ(expected, executor->commands.front());
}


TEST_F(VsctlBackendTest, CommandFailure)
{
  executor->outputs.push_back(
      Error("'ovs-vsctl add-port' exited with status 1: "
            "ovs-vsctl: no bridge named br-int"));

  Try<Nothing> add = backend.addPort("veth0", map<string, string>());

  ASSERT_ERROR(add);
  EXPECT_TRUE(strings::contains(add.error(), "no bridge named br-int"));
}


TEST(VsctlBackendBridgeTest, CustomBridge)
{
  RecordingExecutor* executor = new RecordingExecutor();

  VsctlBackend backend(
      Owned<command::Executor>(executor),
      "/usr/bin/ovs-vsctl",
      "br-ovn");

  ASSERT_SOME(backend.addPort("veth0", map<string, string>()));

  const vector<vector<string>> expected = {
    {"/usr/bin/ovs-vsctl", "add-port", "br-ovn", "veth0"}
  };

  EXPECT_EQ(expected, executor->commands);
}

} // namespace tests {
} // namespace internal {
} // namespace ovncni {
