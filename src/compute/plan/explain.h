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

#include <string>

#include "src/compute/plan/plan.h"
#include "src/compute/plan/planner_flags.h"

namespace dp {
namespace compute {
namespace plan {

/**
 * Renders every result of the plan in request order, separated by a blank line.
 *
 * Each result is a sequence of blocks. A block starts with a `%N =` header and lists its operators
 * as `| ` lines, input first. Join and Union inputs, and the values bound by Let, are rendered as
 * blocks of their own before the block that reads them; a let value's header is `%N = Let lK =`.
 * Block and let numbers restart at zero for each result. The output depends only on the plan, so
 * rendering the same plan twice gives identical text.
 */
std::string Explain(const Plan& plan, const PlannerOptions& options = PlannerOptions::FromFlags());

// Renders the result at `index` on its own.
std::string ExplainResult(const Plan& plan, size_t index,
                          const PlannerOptions& options = PlannerOptions::FromFlags());

}  // namespace plan
}  // namespace compute
}  // namespace dp
