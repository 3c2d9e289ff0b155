/*
 * Copyright 2018- The Pixie Authors.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "src/common/base/logging.h"

namespace dp {

/**
 * Sets up flags, logging and the symbolizer for the lifetime of the guard. Flags named in
 * argv are consumed. Constructing a second guard in the same process is a fatal error.
 */
class EnvironmentGuard {
 public:
  EnvironmentGuard(int* argc, char** argv);
  ~EnvironmentGuard();

  EnvironmentGuard(const EnvironmentGuard&) = delete;
  EnvironmentGuard& operator=(const EnvironmentGuard&) = delete;
};

}  // namespace dp
