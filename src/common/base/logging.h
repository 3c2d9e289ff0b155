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
#include "src/common/base/macros.h"  // NOLINT(build/include_order).
// This header file should be used for all logging.

// Include gflags before glog so flags get set correctly.
DP_SUPPRESS_WARNINGS_START()
#include <gflags/gflags.h>     // NOLINT(build/include_order).
#include <glog/logging.h>      // NOLINT(build/include_order).
#include <glog/stl_logging.h>  // NOLINT(build/include_order).
DP_SUPPRESS_WARNINGS_END()
