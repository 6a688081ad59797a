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

#include <sys/wait.h>

#include <string.h>

#include <tuple>
#include <vector>

#include <process/collect.hpp>
#include <process/io.hpp>
#include <process/subprocess.hpp>

#include <stout/error.hpp>
#include <stout/os.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>

#include <stout/os/constants.hpp>

#include "common/command_utils.hpp"

using std::string;
using std::tuple;
using std::vector;

using process::Failure;
using process::Future;
using process::Subprocess;

namespace ovncni {
namespace internal {
namespace command {

static string describe(int status)
{
  if (WIFEXITED(status)) {
    return "exited with status " + stringify(WEXITSTATUS(status));
  }

  if (WIFSIGNALED(status)) {
    return string("terminated with signal ") + strsignal(WTERMSIG(status));
  }

  return "wait status " + stringify(status);
}


Future<string> launch(const vector<string>& argv)
{
  if (argv.empty()) {
    return Failure("No command to execute");
  }

  const string command = strings::join(" ", argv);

  Try<Subprocess> s = process::subprocess(
      argv[0],
      argv,
      Subprocess::PATH(os::DEV_NULL),
      Subprocess::PIPE(),
      Subprocess::PIPE());

  if (s.isError()) {
    return Failure(
        "Failed to execute the subprocess '" + command + "': " + s.error());
  }

  return await(
      s->status(),
      process::io::read(s->out().get()),
      process::io::read(s->err().get()))
    .then([command](const tuple<
        Future<Option<int>>,
        Future<string>,
        Future<string>>& t) -> Future<string> {
      const Future<Option<int>>& status = std::get<0>(t);
      if (!status.isReady()) {
        return Failure(
            "Failed to get the exit status of '" + command + "': " +
            (status.isFailed() ? status.failure() : "discarded"));
      }

      if (status->isNone()) {
        return Failure("Failed to reap '" + command + "'");
      }

      if (status->get() != 0) {
        const Future<string>& error = std::get<2>(t);
        return Failure(
            "'" + command + "' " + describe(status->get()) +
            (error.isReady() ? ": " + strings::trim(error.get()) : ""));
      }

      const Future<string>& output = std::get<1>(t);
      if (!output.isReady()) {
        return Failure(
            "Failed to read stdout from '" + command + "': " +
            (output.isFailed() ? output.failure() : "discarded"));
      }

      return output;
    });
}


Try<string> SubprocessExecutor::execute(const vector<string>& argv)
{
  Future<string> output = launch(argv);

  // The plugin runs one short-lived command at a time, so blocking the
  // calling thread until the subprocess is reaped is fine.
  output.await();

  if (!output.isReady()) {
    return Error(output.isFailed() ? output.failure() : "discarded");
  }

  return output.get();
}

} // namespace command {
} // namespace internal {
} // namespace ovncni {
