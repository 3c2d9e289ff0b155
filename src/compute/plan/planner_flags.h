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

#include "src/common/base/base.h"

DECLARE_bool(plan_joins);
DECLARE_bool(fold_constants);
DECLARE_bool(explain_demand);

namespace dp {
namespace compute {
namespace plan {

/**
 * Knobs consumed by plan construction and explain.
 */
struct PlannerOptions {
  // Plan joins whose strategy is left unplanned. Otherwise they stay Unplanned.
  bool plan_joins = true;
  // Replace constant-only results by a single Constant.
  bool fold_constants = false;
  // Render the demand annotation on joins.
  bool explain_demand = true;

  static PlannerOptions FromFlags();
};

}  // namespace plan
}  // namespace compute
}  // namespace dp
