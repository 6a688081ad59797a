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

#include <iostream>
#include <string>

#include <process/owned.hpp>

#include <stout/flags.hpp>
#include <stout/foreach.hpp>
#include <stout/os.hpp>
#include <stout/try.hpp>

#include "cni/flags.hpp"
#include "cni/plugin.hpp"
#include "cni/spec.hpp"

#include "logging/logging.hpp"

using namespace ovncni::internal;

using std::cerr;
using std::cout;
using std::endl;

using process::Owned;

using ovncni::internal::cni::Plugin;


// Standard output belongs to the runtime: exactly one JSON object, with
// no trailing newline, or nothing at all.
int main(int argc, char** argv)
{
  cni::Flags flags;

  Try<flags::Warnings> load = flags.load("OVNCNI_", argc, argv);

  if (flags.help) {
    cerr << flags.usage() << endl;
    return EXIT_SUCCESS;
  }

  if (load.isError()) {
    return cni::report(
        cni::spec::ConfigurationError("Failed to load flags", load.error()),
        cout);
  }

  Try<Nothing> initialize = logging::initialize(argv[0], flags);
  if (initialize.isError()) {
    return cni::report(
        cni::spec::ConfigurationError(
            "Failed to initialize logging", initialize.error()),
        cout);
  }

  // Log any flag warnings (after logging is initialized).
  foreach (const flags::Warning& warning, load->warnings) {
    LOG(WARNING) << warning.message;
  }

  logging::GlogLogger logger;

  Owned<Plugin> plugin = Plugin::create(flags, &logger);

  return plugin->run(os::environment(), cout);
}
