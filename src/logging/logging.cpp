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

#include <string>

#include <glog/logging.h>

#include <process/once.hpp>

#include <stout/error.hpp>
#include <stout/nothing.hpp>
#include <stout/os.hpp>
#include <stout/try.hpp>

#include "logging/logging.hpp"

#ifdef __linux__
// Declare FLAGS_drop_log_memory flag for glog. This declaration is based on the
// the DECLARE_XXX macros from glog/logging.h.
namespace fLB {
  extern GOOGLE_GLOG_DLL_DECL bool FLAGS_drop_log_memory;
}
using fLB::FLAGS_drop_log_memory;
#endif

using process::Once;

using std::string;

namespace ovncni {
namespace internal {
namespace logging {

// Persistent copy of argv0 since InitGoogleLogging requires the
// string we pass to it to be accessible indefinitely.
static string argv0;


Try<Nothing> initialize(const string& _argv0, const Option<Flags>& _flags)
{
  static Once* initialized = new Once();

  if (initialized->once()) {
    return Nothing();
  }

  argv0 = _argv0;

  // Use the default flags if not specified.
  Flags flags;
  if (_flags.isSome()) {
    flags = _flags.get();
  }

  if (flags.logging_level != "INFO" &&
      flags.logging_level != "WARNING" &&
      flags.logging_level != "ERROR") {
    initialized->done();
    return Error(
        "'" + flags.logging_level + "' is not a valid logging level."
        " Possible values for 'logging_level' flag are:"
        " 'INFO', 'WARNING', 'ERROR'");
  }

  FLAGS_minloglevel = getLogSeverity(flags.logging_level);
  // An invocation lives for seconds at most; nothing may sit in a
  // buffer when it exits.
  FLAGS_logbufsecs = 0;

  if (flags.log_dir.isSome()) {
    Try<Nothing> mkdir = os::mkdir(flags.log_dir.get());
    if (mkdir.isError()) {
      initialized->done();
      return Error(
          "Failed to create log directory '" + flags.log_dir.get() + "': " +
          mkdir.error());
    }
    FLAGS_log_dir = flags.log_dir.get();
    FLAGS_logtostderr = false;
  } else {
    // Standard output is the CNI result channel; glog's stderr sink is
    // the only console destination we allow.
    FLAGS_logtostderr = true;
  }

  FLAGS_stderrthreshold = FLAGS_minloglevel;

#ifdef __linux__
  // Do not drop in-memory buffers of log contents unless asked to via
  // the corresponding environment variable.
  if (os::getenv("GLOG_drop_log_memory").isNone()) {
    FLAGS_drop_log_memory = false;
  }
#endif

  google::InitGoogleLogging(argv0.c_str());

  VLOG(1) << "Logging to " <<
    (flags.log_dir.isSome() ? flags.log_dir.get() : "STDERR");

  initialized->done();

  return Nothing();
}


google::LogSeverity getLogSeverity(const string& logging_level)
{
  if (logging_level == "INFO") {
    return google::INFO;
  } else if (logging_level == "WARNING") {
    return google::WARNING;
  } else if (logging_level == "ERROR") {
    return google::ERROR;
  } else {
    // Unknown levels are rejected by `initialize`.
    return google::INFO;
  }
}


void GlogLogger::info(const string& message)
{
  LOG(INFO) << message;
}


void GlogLogger::warning(const string& message)
{
  LOG(WARNING) << message;
}


void GlogLogger::error(const string& message)
{
  LOG(ERROR) << message;
}

} // namespace logging {
} // namespace internal {
} // namespace ovncni {
