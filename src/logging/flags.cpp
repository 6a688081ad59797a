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

#include "logging/flags.hpp"


ovncni::internal::logging::Flags::Flags()
{
  add(&Flags::logging_level,
      "logging_level",
      "Log messages at or above this level.\n"
      "Possible values: `INFO`, `WARNING`, `ERROR`.",
      "INFO");

  add(&Flags::log_dir,
      "log_dir",
      "Directory the plugin writes its log files to, one per invocation.\n"
      "Without it, logs go to stderr. Logs never go to stdout, which\n"
      "carries the CNI result.");
}
