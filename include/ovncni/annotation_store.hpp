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

#ifndef __OVNCNI_ANNOTATION_STORE_HPP__
#define __OVNCNI_ANNOTATION_STORE_HPP__

#include <string>

#include <stout/json.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

namespace ovncni {

// The control plane's view of a pod's metadata annotations.
class AnnotationStore
{
public:
  virtual ~AnnotationStore() {}

  // Returns the annotations attached to the pod `name` in `ns`, or
  // none if the pod (or its annotation map) does not exist yet. An
  // error means the query itself failed and may be retried.
  virtual Try<Option<JSON::Object>> annotations(
      const std::string& ns,
      const std::string& name) = 0;
};

} // namespace ovncni {

#endif // __OVNCNI_ANNOTATION_STORE_HPP__
