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

#ifndef __COMMON_COMMAND_UTILS_HPP__
#define __COMMON_COMMAND_UTILS_HPP__

#include <string>
#include <vector>

#include <process/future.hpp>

#include <stout/try.hpp>

namespace ovncni {
namespace internal {
namespace command {

/**
 * Launches `argv[0]` (searched in PATH) with the given arguments.
 *
 * @param argv the command and its arguments; must not be empty.
 * @return the standard output of the command if it exits with status
 *     0, otherwise a failure carrying the exit status and stderr.
 */
process::Future<std::string> launch(const std::vector<std::string>& argv);


// Runs external configuration commands on behalf of the backends.
class Executor
{
public:
  virtual ~Executor() {}

  // Runs the command to completion and returns its standard output.
  virtual Try<std::string> execute(const std::vector<std::string>& argv) = 0;
};


// Blocks on `launch` for every command.
class SubprocessExecutor : public Executor
{
public:
  Try<std::string> execute(const std::vector<std::string>& argv) override;
};

} // namespace command {
} // namespace internal {
} // namespace ovncni {

#endif // __COMMON_COMMAND_UTILS_HPP__
