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

#include "src/compute/plan/func_registry.h"

#include <algorithm>

#include <absl/strings/str_join.h>
#include <absl/strings/substitute.h>

#include "src/compute/plan/builtins.h"
#include "src/compute/plan/plan_error.h"

namespace dp {
namespace compute {
namespace plan {

namespace {

planpb::PlanError FunctionErrorContext(std::string_view name) {
  planpb::PlanError ctx;
  ctx.set_name(std::string(name));
  ctx.set_token(std::string(name));
  return ctx;
}

size_t ExpectedArgs(CallForm form) {
  switch (form) {
    case CallForm::kUnary:
      return 1;
    case CallForm::kBinary:
      return 2;
    case CallForm::kVariadic:
      return 0;
  }
  return 0;
}

}  // namespace

StatusOr<types::Datum> ScalarFunction::Evaluate(const std::vector<types::Datum>& args) const {
  if (propagates_nulls) {
    for (const auto& arg : args) {
      if (types::IsNull(arg)) {
        return types::Datum{};
      }
    }
  }
  return eval(args);
}

const FunctionRegistry& FunctionRegistry::Default() {
  static const FunctionRegistry* registry = [] {
    auto* r = new FunctionRegistry();
    RegisterBuiltinsOrDie(r);
    return r;
  }();
  return *registry;
}

Status FunctionRegistry::RegisterScalar(ScalarFunction fn) {
  if (scalars_.find(fn.name) != scalars_.end()) {
    return error::AlreadyExists("Scalar function \"$0\" already exists.", fn.name);
  }
  std::string name = fn.name;
  scalars_[name] = std::make_unique<ScalarFunction>(std::move(fn));
  return Status::OK();
}

Status FunctionRegistry::RegisterAggregate(AggregateFunction fn) {
  if (aggregates_.find(fn.name) != aggregates_.end()) {
    return error::AlreadyExists("Aggregate \"$0\" already exists.", fn.name);
  }
  std::string name = fn.name;
  aggregates_[name] = std::make_unique<AggregateFunction>(std::move(fn));
  return Status::OK();
}

void FunctionRegistry::RegisterScalarOrDie(ScalarFunction fn) {
  DP_CHECK_OK(RegisterScalar(std::move(fn)));
}

void FunctionRegistry::RegisterAggregateOrDie(AggregateFunction fn) {
  DP_CHECK_OK(RegisterAggregate(std::move(fn)));
}

StatusOr<const ScalarFunction*> FunctionRegistry::GetScalar(std::string_view name) const {
  auto it = scalars_.find(name);
  if (it == scalars_.end()) {
    return PlanErrorStatus(planpb::UNKNOWN_FUNCTION, FunctionErrorContext(name),
                           "unknown function '$0'", name);
  }
  return static_cast<const ScalarFunction*>(it->second.get());
}

StatusOr<const AggregateFunction*> FunctionRegistry::GetAggregate(std::string_view name) const {
  auto it = aggregates_.find(name);
  if (it == aggregates_.end()) {
    return PlanErrorStatus(planpb::UNKNOWN_FUNCTION, FunctionErrorContext(name),
                           "unknown aggregate '$0'", name);
  }
  return static_cast<const AggregateFunction*>(it->second.get());
}

StatusOr<types::DataType> FunctionRegistry::ResolveCall(
    const ScalarFunction& fn, const std::vector<types::DataType>& arg_types) {
  if (fn.form == CallForm::kVariadic) {
    if (arg_types.empty()) {
      return PlanErrorStatus(planpb::ARITY_MISMATCH, FunctionErrorContext(fn.name),
                             "function '$0' expects at least 1 argument, got 0", fn.name);
    }
  } else if (arg_types.size() != ExpectedArgs(fn.form)) {
    return PlanErrorStatus(planpb::ARITY_MISMATCH, FunctionErrorContext(fn.name),
                           "function '$0' expects $1 argument(s), got $2", fn.name,
                           ExpectedArgs(fn.form), arg_types.size());
  }

  auto bound = types::DataType::DATA_TYPE_UNKNOWN;
  for (size_t i = 0; i < arg_types.size(); ++i) {
    types::DataType expected = fn.form == CallForm::kVariadic ? fn.arg_types[0] : fn.arg_types[i];
    if (expected == types::DataType::DATA_TYPE_UNKNOWN) {
      if (bound == types::DataType::DATA_TYPE_UNKNOWN) {
        bound = arg_types[i];
        continue;
      }
      expected = bound;
    }
    if (arg_types[i] != expected) {
      return PlanErrorStatus(planpb::TYPE_MISMATCH, FunctionErrorContext(fn.name),
                             "argument $0 of '$1' must be $2, got $3", i, fn.name,
                             types::DataTypeName(expected), types::DataTypeName(arg_types[i]));
    }
  }
  return fn.return_type == types::DataType::DATA_TYPE_UNKNOWN ? bound : fn.return_type;
}

StatusOr<types::DataType> FunctionRegistry::ResolveAggregate(const AggregateFunction& fn,
                                                             types::DataType input_type) {
  if (!fn.input_types.empty() && std::find(fn.input_types.begin(), fn.input_types.end(),
                                           input_type) == fn.input_types.end()) {
    return PlanErrorStatus(planpb::TYPE_MISMATCH, FunctionErrorContext(fn.name),
                           "aggregate '$0' does not accept $1", fn.name,
                           types::DataTypeName(input_type));
  }
  return fn.return_type == types::DataType::DATA_TYPE_UNKNOWN ? input_type : fn.return_type;
}

std::string FunctionRegistry::DebugString() const {
  std::vector<std::string> lines;
  for (const auto& [name, fn] : scalars_) {
    lines.push_back(absl::Substitute("scalar $0$1 -> $2", name, types::SchemaToString(fn->arg_types),
                                     types::DataTypeName(fn->return_type)));
  }
  for (const auto& [name, fn] : aggregates_) {
    lines.push_back(absl::Substitute("aggregate $0$1 -> $2", name,
                                     types::SchemaToString(fn->input_types),
                                     types::DataTypeName(fn->return_type)));
  }
  return absl::StrJoin(lines, "\n");
}

}  // namespace plan
}  // namespace compute
}  // namespace dp
