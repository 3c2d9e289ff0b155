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
#include <string_view>

#include <absl/strings/substitute.h>

#include "src/common/base/base.h"
#include "src/compute/planpb/plan.pb.h"

namespace dp {
namespace compute {
namespace plan {

// Canonical status code each plan error kind is reported with.
statuspb::Code PlanErrorCode(planpb::PlanErrorKind kind);

// Returns "UnresolvedReference" style names for kinds.
std::string PlanErrorKindName(planpb::PlanErrorKind kind);

/**
 * Returns an error Status carrying `ctx` (with its kind set to `kind`) as context. The message is
 * formatted with absl::Substitute.
 */
template <typename... Args>
Status PlanErrorStatus(planpb::PlanErrorKind kind, planpb::PlanError ctx, std::string_view format,
                       Args... args) {
  ctx.set_kind(kind);
  return Status(PlanErrorCode(kind), absl::Substitute(format, args...), ctx);
}

// Returns PLAN_ERROR_KIND_UNKNOWN if the status has no PlanError context.
planpb::PlanErrorKind GetPlanErrorKind(const Status& status);

// Copies the PlanError context out of status. Returns false if there is none.
bool GetPlanError(const Status& status, planpb::PlanError* error);

inline bool IsPlanError(const Status& status, planpb::PlanErrorKind kind) {
  return GetPlanErrorKind(status) == kind;
}

// Context builders.
planpb::PlanError NodeErrorContext(int64_t node_id);
planpb::PlanError ColumnErrorContext(int64_t node_id, int64_t column);
planpb::PlanError NameErrorContext(int64_t node_id, std::string_view name);
planpb::PlanError TokenErrorContext(int64_t node_id, std::string_view token);
planpb::PlanError LineColErrorContext(int64_t line, int64_t column, std::string_view token);

}  // namespace plan
}  // namespace compute
}  // namespace dp
