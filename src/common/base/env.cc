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

#include "src/common/base/env.h"

#include <absl/debugging/symbolize.h>
#include <absl/strings/str_join.h>

#include <atomic>
#include <string>

namespace dp {

namespace {
std::atomic<bool> env_initialized{false};
}  // namespace

EnvironmentGuard::EnvironmentGuard(int* argc, char** argv) {
  CHECK(argc != nullptr && argv != nullptr);
  CHECK(!env_initialized.exchange(true)) << "EnvironmentGuard constructed twice";

  FLAGS_logtostderr = true;
  std::string cmd = absl::StrJoin(argv, argv + *argc, " ");

  absl::InitializeSymbolizer(argv[0]);
  google::ParseCommandLineFlags(argc, &argv, /*remove_flags*/ true);
  google::InitGoogleLogging(argv[0]);
  VLOG(1) << "Started: " << cmd;
}

EnvironmentGuard::~EnvironmentGuard() {
  VLOG(1) << "Shutting down";
  google::ShutdownGoogleLogging();
  env_initialized = false;
}

}  // namespace dp
