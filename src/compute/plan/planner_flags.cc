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

#include "src/compute/plan/planner_flags.h"

DEFINE_bool(plan_joins, gflags::BoolFromEnv("DP_PLAN_JOINS", true),
            "Run the delta-query planner on joins that do not specify a strategy.");
DEFINE_bool(fold_constants, gflags::BoolFromEnv("DP_FOLD_CONSTANTS", false),
            "Evaluate constant-only results at construction time.");
DEFINE_bool(explain_demand, gflags::BoolFromEnv("DP_EXPLAIN_DEMAND", true),
            "Include join demand annotations in explain output.");

namespace dp {
namespace compute {
namespace plan {

PlannerOptions PlannerOptions::FromFlags() {
  PlannerOptions options;
  options.plan_joins = FLAGS_plan_joins;
  options.fold_constants = FLAGS_fold_constants;
  options.explain_demand = FLAGS_explain_demand;
  return options;
}

}  // namespace plan
}  // namespace compute
}  // namespace dp
