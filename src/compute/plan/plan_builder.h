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
#include <utility>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "src/common/base/base.h"
#include "src/compute/plan/func_registry.h"
#include "src/compute/plan/plan.h"
#include "src/compute/plan/planner_flags.h"
#include "src/compute/planpb/plan.pb.h"

namespace dp {
namespace compute {
namespace plan {

/**
 * Builds an immutable Plan from a PlanRequest, validating every node as it goes.
 *
 * Sources are declared first. Named results (views) may be referenced from any result, so results
 * are built in dependency order; a reference cycle fails with CyclicReference. Get resolves its
 * name against the enclosing lets (innermost first), then views, then sources. Joins are planned
 * or validated here, and every arrangement request is recorded in the plan's registry.
 *
 * Construction is all or nothing: on error no plan is returned.
 */
class PlanBuilder {
 public:
  explicit PlanBuilder(PlannerOptions options = PlannerOptions::FromFlags(),
                       const FunctionRegistry* registry = &FunctionRegistry::Default())
      : options_(options), registry_(registry) {}

  StatusOr<Plan> Build(const planpb::PlanRequest& request);

 private:
  Status DeclareSources(const planpb::PlanRequest& request);
  Status DeclareResults(const planpb::PlanRequest& request);
  StatusOr<std::vector<int64_t>> ResultBuildOrder();

  StatusOr<int64_t> BuildResult(const planpb::RelationExpr& expr);
  StatusOr<int64_t> TryFoldConstant(const planpb::RelationExpr& expr);

  StatusOr<int64_t> BuildRelation(const planpb::RelationExpr& expr);
  StatusOr<int64_t> BuildConstant(const planpb::ConstantExpr& pb);
  StatusOr<int64_t> BuildGet(const planpb::GetExpr& pb);
  StatusOr<int64_t> BuildLet(const planpb::LetExpr& pb);
  StatusOr<int64_t> BuildMap(const planpb::MapExpr& pb);
  StatusOr<int64_t> BuildFilter(const planpb::FilterExpr& pb);
  StatusOr<int64_t> BuildProject(const planpb::ProjectExpr& pb);
  StatusOr<int64_t> BuildArrangeBy(const planpb::ArrangeByExpr& pb);
  StatusOr<int64_t> BuildJoin(const planpb::JoinExpr& pb);
  StatusOr<int64_t> BuildReduce(const planpb::ReduceExpr& pb);
  StatusOr<int64_t> BuildTopK(const planpb::TopKExpr& pb);
  StatusOr<int64_t> BuildUnion(const planpb::UnionExpr& pb);
  StatusOr<int64_t> BuildNegate(const planpb::NegateExpr& pb);
  StatusOr<int64_t> BuildThreshold(const planpb::ThresholdExpr& pb);

  // Fails with ColumnOutOfRange unless 0 <= column < arity.
  Status CheckColumn(int64_t column, int64_t arity, int64_t node_id) const;

  // Appends the names of views read by `expr` that are not shadowed by a let.
  void CollectViewReferences(const planpb::RelationExpr& expr, std::vector<std::string>* let_names,
                             std::vector<std::string>* views) const;
  // True if every Get in `expr` reads a let bound inside `expr`.
  bool IsConstantOnly(const planpb::RelationExpr& expr, std::vector<std::string>* let_names) const;

  const RelationNode& node(int64_t id) const { return plan_->node(id); }

  PlannerOptions options_;
  const FunctionRegistry* registry_;

  // Plan under construction; a scratch plan while constant folding.
  Plan* plan_ = nullptr;
  const planpb::PlanRequest* request_ = nullptr;
  // Request form index of each result.
  std::vector<int> result_forms_;
  std::vector<bool> result_built_;
  absl::flat_hash_map<std::string, int64_t> source_index_;
  absl::flat_hash_map<std::string, int64_t> view_index_;
  // Names bound by the enclosing lets, innermost last, with the id of the bound value.
  std::vector<std::pair<std::string, int64_t>> let_scope_;
};

// Builds a plan with the builtin function registry.
StatusOr<Plan> BuildPlan(const planpb::PlanRequest& request,
                         const PlannerOptions& options = PlannerOptions::FromFlags());

}  // namespace plan
}  // namespace compute
}  // namespace dp
