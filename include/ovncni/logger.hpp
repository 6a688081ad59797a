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

#ifndef __OVNCNI_LOGGER_HPP__
#define __OVNCNI_LOGGER_HPP__

#include <string>

namespace ovncni {

/**
 * Leveled text sink handed to every component of the plugin.
 *
 * The plugin's standard output is reserved for the CNI result, so an
 * implementation must never write to stdout.
 */
class Logger
{
public:
  virtual ~Logger() {}

  virtual void info(const std::string& message) = 0;

  virtual void warning(const std::string& message) = 0;

  virtual void error(const std::string& message) = 0;
};

} // namespace ovncni {

#endif // __OVNCNI_LOGGER_HPP__
