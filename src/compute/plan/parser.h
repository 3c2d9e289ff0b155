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

#include <string_view>

#include "src/common/base/base.h"
#include "src/compute/planpb/plan.pb.h"

namespace dp {
namespace compute {
namespace plan {

/**
 * Parses the s-expression form of a construction request:
 *
 *   (defsource x [int64 int64])
 *   (defview v (filter (get x) [(call_binary gt #0 1)]))
 *   (top_k (get v) [#1] [(#0 asc)] 5 1)
 *
 * Every top-level relational form is an anonymous result; defview names one. `;` starts a
 * comment. Syntax errors fail with ParseError carrying the line and column (both 1-based) of the
 * offending token. Names, columns and functions are not checked here; PlanBuilder does that.
 */
StatusOr<planpb::PlanRequest> ParseRequest(std::string_view text);

}  // namespace plan
}  // namespace compute
}  // namespace dp
