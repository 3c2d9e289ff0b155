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

#include "src/compute/plan/plan_error.h"

#include <cctype>

#include <absl/strings/str_cat.h>
#include <magic_enum.hpp>

namespace dp {
namespace compute {
namespace plan {

statuspb::Code PlanErrorCode(planpb::PlanErrorKind kind) {
  switch (kind) {
    case planpb::UNRESOLVED_REFERENCE:
    case planpb::UNKNOWN_FUNCTION:
      return statuspb::NOT_FOUND;
    case planpb::COLUMN_OUT_OF_RANGE:
    case planpb::INVALID_LITERAL_CONTEXT:
    case planpb::MALFORMED_CONSTRAINT:
    case planpb::TYPE_MISMATCH:
    case planpb::ARITY_MISMATCH:
    case planpb::PARSE_ERROR:
    case planpb::INVALID_PARAMETER:
      return statuspb::INVALID_ARGUMENT;
    case planpb::NO_VALID_JOIN_STRATEGY:
    case planpb::CYCLIC_REFERENCE:
      return statuspb::FAILED_PRECONDITION;
    case planpb::DUPLICATE_NAME:
      return statuspb::ALREADY_EXISTS;
    default:
      return statuspb::INTERNAL;
  }
}

std::string PlanErrorKindName(planpb::PlanErrorKind kind) {
  std::string_view raw = magic_enum::enum_name(kind);
  if (raw.empty()) {
    return "UnknownPlanError";
  }
  // UNRESOLVED_REFERENCE -> UnresolvedReference
  std::string out;
  bool upper = true;
  for (char c : raw) {
    if (c == '_') {
      upper = true;
      continue;
    }
    out.push_back(upper ? c : static_cast<char>(std::tolower(c)));
    upper = false;
  }
  return out;
}

bool GetPlanError(const Status& status, planpb::PlanError* error) {
  return status.ContextAs(error);
}

planpb::PlanErrorKind GetPlanErrorKind(const Status& status) {
  planpb::PlanError error;
  if (!GetPlanError(status, &error)) {
    return planpb::PLAN_ERROR_KIND_UNKNOWN;
  }
  return error.kind();
}

planpb::PlanError NodeErrorContext(int64_t node_id) {
  planpb::PlanError ctx;
  ctx.set_node_id(node_id);
  return ctx;
}

planpb::PlanError ColumnErrorContext(int64_t node_id, int64_t column) {
  planpb::PlanError ctx = NodeErrorContext(node_id);
  ctx.set_column(column);
  ctx.set_token(absl::StrCat("#", column));
  return ctx;
}

planpb::PlanError NameErrorContext(int64_t node_id, std::string_view name) {
  planpb::PlanError ctx = NodeErrorContext(node_id);
  ctx.set_name(std::string(name));
  return ctx;
}

planpb::PlanError TokenErrorContext(int64_t node_id, std::string_view token) {
  planpb::PlanError ctx = NodeErrorContext(node_id);
  ctx.set_token(std::string(token));
  return ctx;
}

planpb::PlanError LineColErrorContext(int64_t line, int64_t column, std::string_view token) {
  planpb::PlanError ctx;
  ctx.set_line(line);
  ctx.set_line_column(column);
  ctx.set_token(std::string(token));
  return ctx;
}

}  // namespace plan
}  // namespace compute
}  // namespace dp
