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

#include "src/compute/plan/plan_builder.h"

#include <algorithm>
#include <utility>

#include <absl/strings/str_cat.h>
#include <absl/strings/substitute.h>

#include "src/compute/plan/constant_evaluator.h"
#include "src/compute/plan/join_planner.h"
#include "src/compute/plan/plan_error.h"

namespace dp {
namespace compute {
namespace plan {

using types::DataType;

namespace {

// Relational sub-expressions of `expr`, except for Let which binds a name over its body.
std::vector<const planpb::RelationExpr*> ChildExprs(const planpb::RelationExpr& expr) {
  std::vector<const planpb::RelationExpr*> children;
  switch (expr.kind_case()) {
    case planpb::RelationExpr::kMap:
      children.push_back(&expr.map().input());
      break;
    case planpb::RelationExpr::kFilter:
      children.push_back(&expr.filter().input());
      break;
    case planpb::RelationExpr::kProject:
      children.push_back(&expr.project().input());
      break;
    case planpb::RelationExpr::kArrangeBy:
      children.push_back(&expr.arrange_by().input());
      break;
    case planpb::RelationExpr::kJoin:
      for (const auto& input : expr.join().inputs()) {
        children.push_back(&input);
      }
      break;
    case planpb::RelationExpr::kReduce:
      children.push_back(&expr.reduce().input());
      break;
    case planpb::RelationExpr::kTopK:
      children.push_back(&expr.top_k().input());
      break;
    case planpb::RelationExpr::kUnionAll:
      for (const auto& input : expr.union_all().inputs()) {
        children.push_back(&input);
      }
      break;
    case planpb::RelationExpr::kNegate:
      children.push_back(&expr.negate().input());
      break;
    case planpb::RelationExpr::kThreshold:
      children.push_back(&expr.threshold().input());
      break;
    default:
      break;
  }
  return children;
}

bool IsBound(const std::vector<std::string>& let_names, const std::string& name) {
  return std::find(let_names.begin(), let_names.end(), name) != let_names.end();
}

Status CheckDataType(DataType type, int64_t node_id) {
  if (type == DataType::DATA_TYPE_UNKNOWN || !types::DataType_IsValid(type)) {
    return PlanErrorStatus(planpb::TYPE_MISMATCH, NodeErrorContext(node_id),
                           "column type $0 is not a valid type", static_cast<int>(type));
  }
  return Status::OK();
}

}  // namespace

StatusOr<Plan> PlanBuilder::Build(const planpb::PlanRequest& request) {
  Plan plan;
  plan_ = &plan;
  request_ = &request;
  result_forms_.clear();
  result_built_.clear();
  source_index_.clear();
  view_index_.clear();
  let_scope_.clear();

  DP_RETURN_IF_ERROR(DeclareSources(request));
  DP_RETURN_IF_ERROR(DeclareResults(request));
  DP_ASSIGN_OR_RETURN(std::vector<int64_t> order, ResultBuildOrder());

  for (int64_t i : order) {
    const auto& decl = request.forms(result_forms_[i]).result();
    DP_ASSIGN_OR_RETURN(int64_t root, BuildResult(decl.expr()));
    Result& result = plan.results_[i];
    result.root = root;
    result.column_types = plan.node(root).column_types;
    result_built_[i] = true;
  }
  plan_ = nullptr;
  request_ = nullptr;
  return plan;
}

Status PlanBuilder::DeclareSources(const planpb::PlanRequest& request) {
  for (const auto& form : request.forms()) {
    if (form.form_case() != planpb::Form::kSource) {
      continue;
    }
    const auto& decl = form.source();
    if (source_index_.contains(decl.name())) {
      return PlanErrorStatus(planpb::DUPLICATE_NAME, NameErrorContext(-1, decl.name()),
                             "source '$0' is declared more than once", decl.name());
    }
    Source source;
    source.name = decl.name();
    for (int type : decl.column_types()) {
      DP_RETURN_IF_ERROR(CheckDataType(static_cast<DataType>(type), -1));
      source.column_types.push_back(static_cast<DataType>(type));
    }
    source_index_[decl.name()] = static_cast<int64_t>(plan_->sources_.size());
    plan_->sources_.push_back(std::move(source));
  }
  return Status::OK();
}

Status PlanBuilder::DeclareResults(const planpb::PlanRequest& request) {
  for (int i = 0; i < request.forms_size(); ++i) {
    const auto& form = request.forms(i);
    if (form.form_case() == planpb::Form::kSource) {
      continue;
    }
    if (form.form_case() != planpb::Form::kResult) {
      return error::InvalidArgument("form $0 is neither a source nor a result", i);
    }
    const std::string& name = form.result().name();
    int64_t index = static_cast<int64_t>(plan_->results_.size());
    if (!name.empty()) {
      if (source_index_.contains(name) || view_index_.contains(name)) {
        return PlanErrorStatus(planpb::DUPLICATE_NAME, NameErrorContext(-1, name),
                               "view '$0' is declared more than once", name);
      }
      view_index_[name] = index;
    }
    Result result;
    result.name = name;
    plan_->results_.push_back(std::move(result));
    result_forms_.push_back(i);
    result_built_.push_back(false);
  }
  return Status::OK();
}

StatusOr<std::vector<int64_t>> PlanBuilder::ResultBuildOrder() {
  DAG deps;
  for (size_t i = 0; i < result_forms_.size(); ++i) {
    deps.AddNode(static_cast<int64_t>(i));
  }
  for (size_t i = 0; i < result_forms_.size(); ++i) {
    std::vector<std::string> let_names;
    std::vector<std::string> views;
    CollectViewReferences(request_->forms(result_forms_[i]).result().expr(), &let_names, &views);
    for (const auto& view : views) {
      deps.AddEdge(view_index_[view], static_cast<int64_t>(i));
    }
  }
  std::vector<int64_t> order = deps.TopologicalSort();
  if (order.size() == result_forms_.size()) {
    return order;
  }

  std::vector<bool> ordered(result_forms_.size(), false);
  for (int64_t i : order) {
    ordered[i] = true;
  }
  for (size_t i = 0; i < ordered.size(); ++i) {
    const std::string& name = plan_->results_[i].name;
    if (!ordered[i] && !name.empty()) {
      return PlanErrorStatus(planpb::CYCLIC_REFERENCE, NameErrorContext(-1, name),
                             "view '$0' depends on itself", name);
    }
  }
  // Only views can be referenced, so a cycle always contains one.
  return error::Internal("result dependencies are cyclic without a view on the cycle");
}

void PlanBuilder::CollectViewReferences(const planpb::RelationExpr& expr,
                                        std::vector<std::string>* let_names,
                                        std::vector<std::string>* views) const {
  if (expr.has_get()) {
    const std::string& name = expr.get().name();
    if (!IsBound(*let_names, name) && view_index_.contains(name)) {
      views->push_back(name);
    }
    return;
  }
  if (expr.has_let()) {
    CollectViewReferences(expr.let().value(), let_names, views);
    let_names->push_back(expr.let().name());
    CollectViewReferences(expr.let().body(), let_names, views);
    let_names->pop_back();
    return;
  }
  for (const auto* child : ChildExprs(expr)) {
    CollectViewReferences(*child, let_names, views);
  }
}

bool PlanBuilder::IsConstantOnly(const planpb::RelationExpr& expr,
                                 std::vector<std::string>* let_names) const {
  if (expr.has_get()) {
    return IsBound(*let_names, expr.get().name());
  }
  if (expr.has_let()) {
    if (!IsConstantOnly(expr.let().value(), let_names)) {
      return false;
    }
    let_names->push_back(expr.let().name());
    bool constant = IsConstantOnly(expr.let().body(), let_names);
    let_names->pop_back();
    return constant;
  }
  for (const auto* child : ChildExprs(expr)) {
    if (!IsConstantOnly(*child, let_names)) {
      return false;
    }
  }
  return true;
}

StatusOr<int64_t> PlanBuilder::BuildResult(const planpb::RelationExpr& expr) {
  std::vector<std::string> let_names;
  if (options_.fold_constants && !expr.has_constant() && IsConstantOnly(expr, &let_names)) {
    auto folded = TryFoldConstant(expr);
    if (folded.ok()) {
      return folded;
    }
    VLOG(1) << "Not folding result: " << folded.msg();
  }
  return BuildRelation(expr);
}

StatusOr<int64_t> PlanBuilder::TryFoldConstant(const planpb::RelationExpr& expr) {
  Plan scratch;
  scratch.sources_ = plan_->sources_;
  Plan* target = plan_;
  plan_ = &scratch;
  StatusOr<int64_t> root = BuildRelation(expr);
  plan_ = target;
  DP_RETURN_IF_ERROR(root.status());

  ConstantEvaluator evaluator(&scratch);
  DP_ASSIGN_OR_RETURN(Multiset rows, evaluator.Evaluate(root.ValueOrDie()));
  DP_ASSIGN_OR_RETURN(std::vector<types::Row> listed, ConstantEvaluator::ToRows(rows));
  return plan_->AddNode(scratch.node(root.ValueOrDie()).column_types,
                        ConstantNode{std::move(listed)});
}

Status PlanBuilder::CheckColumn(int64_t column, int64_t arity, int64_t node_id) const {
  if (column < 0 || column >= arity) {
    return PlanErrorStatus(planpb::COLUMN_OUT_OF_RANGE, ColumnErrorContext(node_id, column),
                           "column #$0 is out of range for arity $1", column, arity);
  }
  return Status::OK();
}

StatusOr<int64_t> PlanBuilder::BuildRelation(const planpb::RelationExpr& expr) {
  switch (expr.kind_case()) {
    case planpb::RelationExpr::kConstant:
      return BuildConstant(expr.constant());
    case planpb::RelationExpr::kGet:
      return BuildGet(expr.get());
    case planpb::RelationExpr::kLet:
      return BuildLet(expr.let());
    case planpb::RelationExpr::kMap:
      return BuildMap(expr.map());
    case planpb::RelationExpr::kFilter:
      return BuildFilter(expr.filter());
    case planpb::RelationExpr::kProject:
      return BuildProject(expr.project());
    case planpb::RelationExpr::kArrangeBy:
      return BuildArrangeBy(expr.arrange_by());
    case planpb::RelationExpr::kJoin:
      return BuildJoin(expr.join());
    case planpb::RelationExpr::kReduce:
      return BuildReduce(expr.reduce());
    case planpb::RelationExpr::kTopK:
      return BuildTopK(expr.top_k());
    case planpb::RelationExpr::kUnionAll:
      return BuildUnion(expr.union_all());
    case planpb::RelationExpr::kNegate:
      return BuildNegate(expr.negate());
    case planpb::RelationExpr::kThreshold:
      return BuildThreshold(expr.threshold());
    case planpb::RelationExpr::KIND_NOT_SET:
      break;
  }
  return error::InvalidArgument("relational expression for node $0 has no operator",
                                plan_->NextNodeId());
}

StatusOr<int64_t> PlanBuilder::BuildConstant(const planpb::ConstantExpr& pb) {
  int64_t id = plan_->NextNodeId();
  std::vector<DataType> column_types;
  for (int type : pb.column_types()) {
    DP_RETURN_IF_ERROR(CheckDataType(static_cast<DataType>(type), id));
    column_types.push_back(static_cast<DataType>(type));
  }
  ConstantNode constant;
  for (const auto& row_pb : pb.rows()) {
    if (row_pb.values_size() != static_cast<int>(column_types.size())) {
      return PlanErrorStatus(planpb::ARITY_MISMATCH, NodeErrorContext(id),
                             "constant row has $0 values but the schema has $1 columns",
                             row_pb.values_size(), column_types.size());
    }
    types::Row row;
    for (int i = 0; i < row_pb.values_size(); ++i) {
      DP_ASSIGN_OR_RETURN(types::Datum value,
                          ConstantValueFromProto(row_pb.values(i), column_types[i], id));
      row.push_back(std::move(value));
    }
    constant.rows.push_back(std::move(row));
  }
  return plan_->AddNode(std::move(column_types), std::move(constant));
}

StatusOr<int64_t> PlanBuilder::BuildGet(const planpb::GetExpr& pb) {
  const std::string& name = pb.name();
  for (auto it = let_scope_.rbegin(); it != let_scope_.rend(); ++it) {
    if (it->first == name) {
      return plan_->AddNode(node(it->second).column_types,
                            GetNode{GlobalRef{GlobalRef::Kind::kLocal, it->second}, name});
    }
  }
  auto view = view_index_.find(name);
  if (view != view_index_.end()) {
    // Views are built in dependency order, so a view read here always exists.
    DCHECK(result_built_[view->second]);
    return plan_->AddNode(plan_->results_[view->second].column_types,
                          GetNode{GlobalRef{GlobalRef::Kind::kView, view->second}, name});
  }
  auto source = source_index_.find(name);
  if (source != source_index_.end()) {
    return plan_->AddNode(plan_->sources_[source->second].column_types,
                          GetNode{GlobalRef{GlobalRef::Kind::kSource, source->second}, name});
  }
  return PlanErrorStatus(planpb::UNRESOLVED_REFERENCE,
                         NameErrorContext(plan_->NextNodeId(), name), "unknown name '$0'", name);
}

StatusOr<int64_t> PlanBuilder::BuildLet(const planpb::LetExpr& pb) {
  DP_ASSIGN_OR_RETURN(int64_t value, BuildRelation(pb.value()));
  let_scope_.emplace_back(pb.name(), value);
  StatusOr<int64_t> body = BuildRelation(pb.body());
  let_scope_.pop_back();
  DP_RETURN_IF_ERROR(body.status());
  return plan_->AddNode(node(body.ValueOrDie()).column_types,
                        LetNode{pb.name(), value, body.ValueOrDie()});
}

StatusOr<int64_t> PlanBuilder::BuildMap(const planpb::MapExpr& pb) {
  DP_ASSIGN_OR_RETURN(int64_t input, BuildRelation(pb.input()));
  int64_t id = plan_->NextNodeId();
  std::vector<DataType> column_types = node(input).column_types;
  MapNode map{input, {}};
  for (const auto& expr_pb : pb.exprs()) {
    DP_ASSIGN_OR_RETURN(ScalarExpr expr,
                        ScalarExprFromProto(expr_pb, column_types, *registry_, id));
    column_types.push_back(expr.type());
    map.exprs.push_back(std::move(expr));
  }
  return plan_->AddNode(std::move(column_types), std::move(map));
}

StatusOr<int64_t> PlanBuilder::BuildFilter(const planpb::FilterExpr& pb) {
  DP_ASSIGN_OR_RETURN(int64_t input, BuildRelation(pb.input()));
  int64_t id = plan_->NextNodeId();
  const auto& column_types = node(input).column_types;
  FilterNode filter{input, {}};
  for (const auto& predicate_pb : pb.predicates()) {
    DP_ASSIGN_OR_RETURN(ScalarExpr predicate,
                        ScalarExprFromProto(predicate_pb, column_types, *registry_, id));
    if (predicate.type() != DataType::BOOLEAN) {
      return PlanErrorStatus(planpb::TYPE_MISMATCH, TokenErrorContext(id, predicate.ToString()),
                             "filter predicate $0 has type $1, expected bool",
                             predicate.ToString(), types::DataTypeName(predicate.type()));
    }
    filter.predicates.push_back(std::move(predicate));
  }
  return plan_->AddNode(column_types, std::move(filter));
}

StatusOr<int64_t> PlanBuilder::BuildProject(const planpb::ProjectExpr& pb) {
  DP_ASSIGN_OR_RETURN(int64_t input, BuildRelation(pb.input()));
  int64_t id = plan_->NextNodeId();
  const auto& input_types = node(input).column_types;
  ProjectNode project{input, {}};
  std::vector<DataType> column_types;
  for (int64_t column : pb.outputs()) {
    DP_RETURN_IF_ERROR(CheckColumn(column, node(input).arity(), id));
    project.outputs.push_back(column);
    column_types.push_back(input_types[column]);
  }
  return plan_->AddNode(std::move(column_types), std::move(project));
}

StatusOr<int64_t> PlanBuilder::BuildArrangeBy(const planpb::ArrangeByExpr& pb) {
  DP_ASSIGN_OR_RETURN(int64_t input, BuildRelation(pb.input()));
  int64_t id = plan_->NextNodeId();
  ArrangeByNode arrange{input, {}};
  for (const auto& key_pb : pb.keys()) {
    std::vector<int64_t> key(key_pb.columns().begin(), key_pb.columns().end());
    for (int64_t column : key) {
      DP_RETURN_IF_ERROR(CheckColumn(column, node(input).arity(), id));
    }
    if (std::find(arrange.keys.begin(), arrange.keys.end(), key) == arrange.keys.end()) {
      arrange.keys.push_back(std::move(key));
    }
  }
  CollectionId collection = plan_->CollectionOf(input);
  std::vector<std::vector<int64_t>> keys = arrange.keys;
  id = plan_->AddNode(node(input).column_types, std::move(arrange));
  for (const auto& key : keys) {
    plan_->arrangements_.Request(collection, key, id);
  }
  return id;
}

StatusOr<int64_t> PlanBuilder::BuildJoin(const planpb::JoinExpr& pb) {
  std::vector<int64_t> inputs;
  for (const auto& input_pb : pb.inputs()) {
    DP_ASSIGN_OR_RETURN(int64_t input, BuildRelation(input_pb));
    inputs.push_back(input);
  }
  int64_t id = plan_->NextNodeId();
  if (inputs.empty()) {
    return PlanErrorStatus(planpb::ARITY_MISMATCH, NodeErrorContext(id),
                           "join needs at least one input");
  }

  std::vector<std::vector<DataType>> input_types;
  std::vector<DataType> column_types;
  for (int64_t input : inputs) {
    const auto& types = node(input).column_types;
    input_types.push_back(types);
    column_types.insert(column_types.end(), types.begin(), types.end());
  }
  JoinPlanner planner(input_types, id);

  std::vector<std::vector<int64_t>> declared;
  for (const auto& cls : pb.equivalences()) {
    declared.emplace_back(cls.columns().begin(), cls.columns().end());
  }
  JoinNode join;
  join.inputs = inputs;
  DP_ASSIGN_OR_RETURN(join.equivalences, planner.CanonicalizeEquivalences(declared));

  if (pb.has_demand()) {
    std::vector<int64_t> demand(pb.demand().columns().begin(), pb.demand().columns().end());
    for (int64_t column : demand) {
      DP_RETURN_IF_ERROR(CheckColumn(column, static_cast<int64_t>(column_types.size()), id));
    }
    SortAndDedup(&demand);
    join.demand = std::move(demand);
  }

  if (pb.implementation().has_delta_query()) {
    DP_ASSIGN_OR_RETURN(join.implementation, planner.ValidateDeltaQuery(
                                                 pb.implementation().delta_query(),
                                                 join.equivalences));
  } else if (options_.plan_joins) {
    DP_ASSIGN_OR_RETURN(join.implementation, planner.PlanDeltaQuery(join.equivalences));
  } else {
    join.implementation = Unplanned{};
  }

  std::vector<std::pair<CollectionId, std::vector<int64_t>>> probes;
  if (const auto* delta = std::get_if<DeltaQuery>(&join.implementation)) {
    for (const auto& rule : delta->rules) {
      for (const auto& step : rule.steps) {
        probes.emplace_back(plan_->CollectionOf(inputs[step.input]), step.key);
      }
      VLOG(1) << absl::Substitute("Join $0: delta rule for input $1 has $2 steps", id,
                                  rule.source, rule.steps.size());
    }
  }
  id = plan_->AddNode(std::move(column_types), std::move(join));
  for (const auto& [collection, key] : probes) {
    plan_->arrangements_.Request(collection, key, id);
  }
  return id;
}

StatusOr<int64_t> PlanBuilder::BuildReduce(const planpb::ReduceExpr& pb) {
  DP_ASSIGN_OR_RETURN(int64_t input, BuildRelation(pb.input()));
  int64_t id = plan_->NextNodeId();
  const auto& input_types = node(input).column_types;

  ReduceNode reduce;
  reduce.input = input;
  std::vector<DataType> column_types;
  std::vector<int64_t> key_columns;
  bool plain_key = true;
  for (const auto& key_pb : pb.group_key()) {
    DP_ASSIGN_OR_RETURN(ScalarExpr key,
                        ScalarExprFromProto(key_pb, input_types, *registry_, id));
    if (const auto* column = std::get_if<ColumnRef>(&key.kind())) {
      key_columns.push_back(column->index);
    } else {
      plain_key = false;
    }
    column_types.push_back(key.type());
    reduce.group_key.push_back(std::move(key));
  }
  for (const auto& agg_pb : pb.aggregates()) {
    DP_RETURN_IF_ERROR(CheckColumn(agg_pb.column(), node(input).arity(), id));
    DP_ASSIGN_OR_RETURN(const AggregateFunction* fn, registry_->GetAggregate(agg_pb.function()));
    DP_ASSIGN_OR_RETURN(DataType type,
                        FunctionRegistry::ResolveAggregate(*fn, input_types[agg_pb.column()]));
    column_types.push_back(type);
    reduce.aggregates.push_back(AggregateExpr{fn, agg_pb.column(), agg_pb.distinct(), type});
  }

  CollectionId collection = plan_->CollectionOf(input);
  id = plan_->AddNode(std::move(column_types), std::move(reduce));
  if (plain_key && !key_columns.empty()) {
    plan_->arrangements_.Request(collection, key_columns, id);
  }
  return id;
}

StatusOr<int64_t> PlanBuilder::BuildTopK(const planpb::TopKExpr& pb) {
  DP_ASSIGN_OR_RETURN(int64_t input, BuildRelation(pb.input()));
  int64_t id = plan_->NextNodeId();
  int64_t arity = node(input).arity();

  TopKNode top_k;
  top_k.input = input;
  for (int64_t column : pb.group_key()) {
    DP_RETURN_IF_ERROR(CheckColumn(column, arity, id));
    top_k.group_key.push_back(column);
  }
  for (const auto& key : pb.order()) {
    DP_RETURN_IF_ERROR(CheckColumn(key.column(), arity, id));
    top_k.order.push_back(OrderKey{key.column(), key.descending()});
  }
  if (pb.has_limit()) {
    if (pb.limit() < 0) {
      return PlanErrorStatus(planpb::INVALID_PARAMETER,
                             TokenErrorContext(id, absl::StrCat(pb.limit())),
                             "limit must not be negative, got $0", pb.limit());
    }
    top_k.limit = pb.limit();
  }
  if (pb.offset() < 0) {
    return PlanErrorStatus(planpb::INVALID_PARAMETER,
                           TokenErrorContext(id, absl::StrCat(pb.offset())),
                           "offset must not be negative, got $0", pb.offset());
  }
  top_k.offset = pb.offset();

  CollectionId collection = plan_->CollectionOf(input);
  std::vector<int64_t> group_key = top_k.group_key;
  id = plan_->AddNode(node(input).column_types, std::move(top_k));
  if (!group_key.empty()) {
    plan_->arrangements_.Request(collection, group_key, id);
  }
  return id;
}

StatusOr<int64_t> PlanBuilder::BuildUnion(const planpb::UnionExpr& pb) {
  std::vector<int64_t> inputs;
  for (const auto& input_pb : pb.inputs()) {
    DP_ASSIGN_OR_RETURN(int64_t input, BuildRelation(input_pb));
    inputs.push_back(input);
  }
  int64_t id = plan_->NextNodeId();
  if (inputs.empty()) {
    return PlanErrorStatus(planpb::ARITY_MISMATCH, NodeErrorContext(id),
                           "union needs at least one input");
  }
  const auto& column_types = node(inputs[0]).column_types;
  for (size_t i = 1; i < inputs.size(); ++i) {
    const auto& other = node(inputs[i]).column_types;
    if (other.size() != column_types.size()) {
      return PlanErrorStatus(planpb::ARITY_MISMATCH, NodeErrorContext(id),
                             "union input $0 has arity $1, expected $2", i, other.size(),
                             column_types.size());
    }
    if (other != column_types) {
      return PlanErrorStatus(planpb::TYPE_MISMATCH, NodeErrorContext(id),
                             "union input $0 has schema $1, expected $2", i,
                             types::SchemaToString(other), types::SchemaToString(column_types));
    }
  }
  return plan_->AddNode(column_types, UnionNode{std::move(inputs)});
}

StatusOr<int64_t> PlanBuilder::BuildNegate(const planpb::NegateExpr& pb) {
  DP_ASSIGN_OR_RETURN(int64_t input, BuildRelation(pb.input()));
  return plan_->AddNode(node(input).column_types, NegateNode{input});
}

StatusOr<int64_t> PlanBuilder::BuildThreshold(const planpb::ThresholdExpr& pb) {
  DP_ASSIGN_OR_RETURN(int64_t input, BuildRelation(pb.input()));
  return plan_->AddNode(node(input).column_types, ThresholdNode{input});
}

StatusOr<Plan> BuildPlan(const planpb::PlanRequest& request, const PlannerOptions& options) {
  PlanBuilder builder(options);
  return builder.Build(request);
}

}  // namespace plan
}  // namespace compute
}  // namespace dp
