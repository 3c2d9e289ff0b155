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

#include <absl/strings/str_cat.h>
#include <absl/strings/substitute.h>

#include "src/common/testing/testing.h"
#include "src/compute/plan/test_utils.h"

namespace dp {
namespace compute {
namespace plan {

using ::dp::testing::status::StatusIs;
using ::testing::ElementsAre;
using testutils::HasPlanError;
using testutils::RequestFromText;
using types::DataType;

constexpr char kSourceX[] = R"(
forms { source { name: "x" column_types: [INT64, INT64] } }
)";

class PlanBuilderTest : public ::testing::Test {
 protected:
  StatusOr<Plan> Build(const std::string& forms) {
    PlanBuilder builder(options_);
    return builder.Build(RequestFromText(absl::StrCat(kSourceX, forms)));
  }

  // Builds a single anonymous result over source x.
  StatusOr<Plan> BuildExpr(const std::string& expr) {
    return Build(absl::Substitute("forms { result { expr { $0 } } }", expr));
  }

  PlannerOptions options_;
};

TEST_F(PlanBuilderTest, constant_schema_and_rows) {
  ASSERT_OK_AND_ASSIGN(Plan plan, BuildExpr(R"(
    constant {
      column_types: [INT64, STRING]
      rows { values { literal { type: INT64 int64_value: 1 } }
             values { literal { type: STRING string_value: "a" } } }
    })"));
  ASSERT_EQ(1, plan.results().size());
  const RelationNode& root = plan.node(plan.results()[0].root);
  EXPECT_THAT(root.column_types, ElementsAre(DataType::INT64, DataType::STRING));
  const auto& constant = std::get<ConstantNode>(root.op);
  ASSERT_EQ(1, constant.rows.size());
  EXPECT_EQ("(1, \"a\")", types::RowToString(constant.rows[0]));
}

TEST_F(PlanBuilderTest, column_in_constant_row_is_invalid_literal_context) {
  auto plan_or = BuildExpr(R"(
    constant {
      column_types: [INT64]
      rows { values { column { index: 0 } } }
    })");
  EXPECT_THAT(plan_or, HasPlanError(planpb::INVALID_LITERAL_CONTEXT));
  EXPECT_THAT(plan_or, StatusIs(statuspb::INVALID_ARGUMENT));
  planpb::PlanError error;
  ASSERT_TRUE(GetPlanError(plan_or.status(), &error));
  EXPECT_EQ(0, error.node_id());
  EXPECT_EQ("#0", error.token());
}

TEST_F(PlanBuilderTest, constant_row_width_must_match_schema) {
  EXPECT_THAT(BuildExpr(R"(
    constant {
      column_types: [INT64, INT64]
      rows { values { literal { type: INT64 int64_value: 1 } } }
    })"),
              HasPlanError(planpb::ARITY_MISMATCH));
}

TEST_F(PlanBuilderTest, get_of_unknown_name) {
  auto plan_or = BuildExpr(R"(get { name: "y" })");
  EXPECT_THAT(plan_or, HasPlanError(planpb::UNRESOLVED_REFERENCE));
  EXPECT_THAT(plan_or, StatusIs(statuspb::NOT_FOUND));
  planpb::PlanError error;
  ASSERT_TRUE(GetPlanError(plan_or.status(), &error));
  EXPECT_EQ("y", error.name());
}

TEST_F(PlanBuilderTest, duplicate_names) {
  EXPECT_THAT(Build(R"(forms { source { name: "x" column_types: [INT64] } })"),
              HasPlanError(planpb::DUPLICATE_NAME));
  EXPECT_THAT(Build(R"(
    forms { result { name: "v" expr { get { name: "x" } } } }
    forms { result { name: "x" expr { get { name: "x" } } } })"),
              HasPlanError(planpb::DUPLICATE_NAME));
}

TEST_F(PlanBuilderTest, views_are_built_in_dependency_order) {
  ASSERT_OK_AND_ASSIGN(Plan plan, Build(R"(
    forms { result { name: "a" expr { get { name: "b" } } } }
    forms { result { name: "b" expr { get { name: "x" } } } })"));
  ASSERT_EQ(2, plan.results().size());
  // "b" is built first even though it is declared second.
  EXPECT_EQ("a", plan.results()[0].name);
  EXPECT_EQ(1, plan.results()[0].root);
  EXPECT_EQ(0, plan.results()[1].root);
  EXPECT_THAT(plan.results()[0].column_types, ElementsAre(DataType::INT64, DataType::INT64));

  const auto& get = std::get<GetNode>(plan.node(1).op);
  EXPECT_EQ(GlobalRef::Kind::kView, get.ref.kind);
  EXPECT_EQ(1, get.ref.id);
  EXPECT_EQ((CollectionId{CollectionId::Kind::kView, 1}), plan.CollectionOf(1));
  EXPECT_EQ((CollectionId{CollectionId::Kind::kSource, 0}), plan.CollectionOf(0));
}

TEST_F(PlanBuilderTest, cyclic_views) {
  auto plan_or = Build(R"(
    forms { result { name: "a" expr { get { name: "b" } } } }
    forms { result { name: "b" expr { get { name: "a" } } } })");
  EXPECT_THAT(plan_or, HasPlanError(planpb::CYCLIC_REFERENCE));
  planpb::PlanError error;
  ASSERT_TRUE(GetPlanError(plan_or.status(), &error));
  EXPECT_EQ("a", error.name());

  EXPECT_THAT(Build(R"(forms { result { name: "v" expr { get { name: "v" } } } })"),
              HasPlanError(planpb::CYCLIC_REFERENCE));
}

TEST_F(PlanBuilderTest, let_shadows_views_and_sources) {
  ASSERT_OK_AND_ASSIGN(Plan plan, Build(R"(
    forms { result { name: "v" expr { let {
      name: "v"
      value { constant { column_types: [BOOLEAN] } }
      body { get { name: "v" } }
    } } } })"));
  // 0: Constant, 1: Get of the let, 2: Let.
  ASSERT_EQ(3, plan.nodes().size());
  const auto& get = std::get<GetNode>(plan.node(1).op);
  EXPECT_EQ(GlobalRef::Kind::kLocal, get.ref.kind);
  EXPECT_EQ(0, get.ref.id);
  EXPECT_EQ((CollectionId{CollectionId::Kind::kNode, 0}), plan.CollectionOf(1));
  EXPECT_THAT(plan.node(2).column_types, ElementsAre(DataType::BOOLEAN));
  EXPECT_THAT(plan.dag().ChildrenOf(0), ElementsAre(1, 2));
}

TEST_F(PlanBuilderTest, let_of_get_arranges_what_the_get_reads) {
  ASSERT_OK_AND_ASSIGN(Plan plan, Build(R"(
    forms { result { expr { let {
      name: "l"
      value { get { name: "x" } }
      body { arrange_by { input { get { name: "l" } } keys { columns: [0] } } }
    } } } }
    forms { result { expr { arrange_by {
      input { get { name: "x" } }
      keys { columns: [0] }
    } } } })"));
  // 0: Get x, 1: Get l, 2: ArrangeBy, 3: Let, 4: Get x, 5: ArrangeBy.
  CollectionId x{CollectionId::Kind::kSource, 0};
  EXPECT_EQ(x, plan.CollectionOf(1));
  EXPECT_EQ(1, plan.arrangements().NumArrangements());
  const auto& arrangements = plan.arrangements().ArrangementsOf(x);
  ASSERT_EQ(1, arrangements.size());
  EXPECT_THAT(arrangements[0].key, ElementsAre(0));
  EXPECT_THAT(arrangements[0].consumers, ElementsAre(2, 5));
}

TEST_F(PlanBuilderTest, let_name_is_not_visible_in_its_value) {
  EXPECT_THAT(BuildExpr(R"(let {
      name: "l"
      value { get { name: "l" } }
      body { get { name: "l" } }
    })"),
              HasPlanError(planpb::UNRESOLVED_REFERENCE));
}

TEST_F(PlanBuilderTest, map_sees_earlier_outputs) {
  ASSERT_OK_AND_ASSIGN(Plan plan, BuildExpr(R"(map {
      input { get { name: "x" } }
      exprs { call { function: "add_int64" args { column { index: 0 } } args { column { index: 1 } } } }
      exprs { call { function: "gt" args { column { index: 2 } } args { column { index: 0 } } } }
    })"));
  EXPECT_THAT(plan.node(1).column_types,
              ElementsAre(DataType::INT64, DataType::INT64, DataType::INT64, DataType::BOOLEAN));
}

TEST_F(PlanBuilderTest, map_column_out_of_range) {
  auto plan_or = BuildExpr(R"(map {
      input { get { name: "x" } }
      exprs { column { index: 5 } }
    })");
  EXPECT_THAT(plan_or, HasPlanError(planpb::COLUMN_OUT_OF_RANGE));
  planpb::PlanError error;
  ASSERT_TRUE(GetPlanError(plan_or.status(), &error));
  EXPECT_EQ(1, error.node_id());
  EXPECT_EQ(5, error.column());
}

TEST_F(PlanBuilderTest, filter_predicates_must_be_boolean) {
  EXPECT_OK(BuildExpr(R"(filter {
      input { get { name: "x" } }
      predicates { call { function: "eq" args { column { index: 0 } }
                                         args { literal { type: INT64 int64_value: 1 } } } }
    })"));
  EXPECT_THAT(BuildExpr(R"(filter {
      input { get { name: "x" } }
      predicates { column { index: 0 } }
    })"),
              HasPlanError(planpb::TYPE_MISMATCH));
  EXPECT_THAT(BuildExpr(R"(filter {
      input { get { name: "x" } }
      predicates { call { function: "no_such_fn" args { column { index: 0 } } } }
    })"),
              HasPlanError(planpb::UNKNOWN_FUNCTION));
}

TEST_F(PlanBuilderTest, project_allows_repeats) {
  ASSERT_OK_AND_ASSIGN(Plan plan, BuildExpr(R"(project {
      input { get { name: "x" } } outputs: [1, 1, 0]
    })"));
  EXPECT_EQ(3, plan.node(1).arity());
  EXPECT_THAT(BuildExpr(R"(project { input { get { name: "x" } } outputs: [2] })"),
              HasPlanError(planpb::COLUMN_OUT_OF_RANGE));
}

TEST_F(PlanBuilderTest, arrange_by_dedupes_key_sets) {
  ASSERT_OK_AND_ASSIGN(Plan plan, BuildExpr(R"(arrange_by {
      input { get { name: "x" } }
      keys { columns: [0, 0] }
      keys { columns: [1] }
      keys { columns: [0, 0] }
    })"));
  const auto& arrange = std::get<ArrangeByNode>(plan.node(1).op);
  EXPECT_THAT(arrange.keys, ElementsAre(ElementsAre(0, 0), ElementsAre(1)));

  CollectionId x{CollectionId::Kind::kSource, 0};
  const auto& arrangements = plan.arrangements().ArrangementsOf(x);
  ASSERT_EQ(2, arrangements.size());
  EXPECT_THAT(arrangements[0].key, ElementsAre(0, 0));
  EXPECT_THAT(arrangements[0].consumers, ElementsAre(1));
}

class JoinBuilderTest : public PlanBuilderTest {
 protected:
  static constexpr char kSelfJoin[] = R"(join {
      inputs { get { name: "x" } }
      inputs { get { name: "x" } }
      equivalences { columns: [2, 0] }
      demand { columns: [3, 0, 3] }
      $0
    })";
};

TEST_F(JoinBuilderTest, two_way_join_is_planned) {
  ASSERT_OK_AND_ASSIGN(Plan plan, BuildExpr(absl::Substitute(kSelfJoin, "")));
  const auto& join = std::get<JoinNode>(plan.node(2).op);
  EXPECT_EQ(4, plan.node(2).arity());
  EXPECT_THAT(join.equivalences, ElementsAre(ElementsAre(0, 2)));
  ASSERT_TRUE(join.demand.has_value());
  EXPECT_THAT(*join.demand, ElementsAre(0, 3));

  const auto* delta = std::get_if<DeltaQuery>(&join.implementation);
  ASSERT_NE(nullptr, delta);
  ASSERT_EQ(2, delta->rules.size());
  ASSERT_EQ(1, delta->rules[0].steps.size());
  EXPECT_EQ(1, delta->rules[0].steps[0].input);
  EXPECT_THAT(delta->rules[0].steps[0].key, ElementsAre(0));
  ASSERT_EQ(1, delta->rules[1].steps.size());
  EXPECT_EQ(0, delta->rules[1].steps[0].input);
  EXPECT_THAT(delta->rules[1].steps[0].key, ElementsAre(0));

  // Both probes read source x on the same key and share one arrangement.
  EXPECT_EQ(1, plan.arrangements().NumArrangements());
  const auto& arrangements =
      plan.arrangements().ArrangementsOf(CollectionId{CollectionId::Kind::kSource, 0});
  ASSERT_EQ(1, arrangements.size());
  EXPECT_THAT(arrangements[0].consumers, ElementsAre(2));
}

TEST_F(JoinBuilderTest, unplanned_when_planning_is_off) {
  options_.plan_joins = false;
  ASSERT_OK_AND_ASSIGN(Plan plan, BuildExpr(absl::Substitute(kSelfJoin, "")));
  const auto& join = std::get<JoinNode>(plan.node(2).op);
  EXPECT_TRUE(std::holds_alternative<Unplanned>(join.implementation));
  EXPECT_EQ(0, plan.arrangements().NumArrangements());
}

TEST_F(JoinBuilderTest, explicit_delta_query_is_validated) {
  EXPECT_OK(BuildExpr(absl::Substitute(kSelfJoin, R"(implementation { delta_query {
      rules { steps { input: 1 key: [0] } }
      rules { steps { input: 0 key: [0] } }
    } })")));
  EXPECT_THAT(BuildExpr(absl::Substitute(kSelfJoin, R"(implementation { delta_query {
      rules { steps { input: 1 key: [0] } }
    } })")),
              HasPlanError(planpb::ARITY_MISMATCH));
  EXPECT_THAT(BuildExpr(absl::Substitute(kSelfJoin, R"(implementation { delta_query {
      rules { steps { input: 1 key: [1] } }
      rules { steps { input: 0 key: [0] } }
    } })")),
              HasPlanError(planpb::NO_VALID_JOIN_STRATEGY));
}

TEST_F(JoinBuilderTest, disconnected_inputs_have_no_strategy) {
  auto plan_or = BuildExpr(R"(join {
      inputs { get { name: "x" } }
      inputs { get { name: "x" } }
      inputs { get { name: "x" } }
      equivalences { columns: [0, 2] }
    })");
  EXPECT_THAT(plan_or, HasPlanError(planpb::NO_VALID_JOIN_STRATEGY));
  EXPECT_THAT(plan_or, StatusIs(statuspb::FAILED_PRECONDITION));
}

TEST_F(JoinBuilderTest, malformed_constraints) {
  // Both columns come from the first input.
  EXPECT_THAT(BuildExpr(R"(join {
      inputs { get { name: "x" } }
      inputs { get { name: "x" } }
      equivalences { columns: [0, 1] }
    })"),
              HasPlanError(planpb::MALFORMED_CONSTRAINT));
  EXPECT_THAT(BuildExpr(R"(join {
      inputs { get { name: "x" } }
      inputs { get { name: "x" } }
      equivalences { columns: [0, 7] }
    })"),
              HasPlanError(planpb::MALFORMED_CONSTRAINT));
}

TEST_F(JoinBuilderTest, demand_out_of_range) {
  EXPECT_THAT(BuildExpr(R"(join {
      inputs { get { name: "x" } }
      inputs { get { name: "x" } }
      equivalences { columns: [0, 2] }
      demand { columns: [4] }
    })"),
              HasPlanError(planpb::COLUMN_OUT_OF_RANGE));
}

TEST_F(PlanBuilderTest, reduce_schema_and_group_arrangement) {
  ASSERT_OK_AND_ASSIGN(Plan plan, BuildExpr(R"(reduce {
      input { get { name: "x" } }
      group_key { column { index: 1 } }
      aggregates { function: "sum" column: 0 }
      aggregates { function: "count" column: 0 distinct: true }
    })"));
  const RelationNode& reduce = plan.node(1);
  EXPECT_THAT(reduce.column_types, ElementsAre(DataType::INT64, DataType::INT64, DataType::INT64));
  EXPECT_EQ("Reduce", reduce.OpName());
  const auto& arrangements =
      plan.arrangements().ArrangementsOf(CollectionId{CollectionId::Kind::kSource, 0});
  ASSERT_EQ(1, arrangements.size());
  EXPECT_THAT(arrangements[0].key, ElementsAre(1));
}

TEST_F(PlanBuilderTest, reduce_errors) {
  EXPECT_THAT(BuildExpr(R"(reduce {
      input { get { name: "x" } }
      aggregates { function: "sum" column: 2 }
    })"),
              HasPlanError(planpb::COLUMN_OUT_OF_RANGE));
  EXPECT_THAT(BuildExpr(R"(reduce {
      input { get { name: "x" } }
      aggregates { function: "median" column: 0 }
    })"),
              HasPlanError(planpb::UNKNOWN_FUNCTION));
  EXPECT_THAT(BuildExpr(R"(reduce {
      input { get { name: "x" } }
      group_key { column { index: 3 } }
    })"),
              HasPlanError(planpb::COLUMN_OUT_OF_RANGE));
}

TEST_F(PlanBuilderTest, distinct_is_reduce_without_aggregates) {
  ASSERT_OK_AND_ASSIGN(Plan plan, BuildExpr(R"(reduce {
      input { get { name: "x" } }
      group_key { column { index: 1 } }
    })"));
  EXPECT_EQ("Distinct", plan.node(1).OpName());
  EXPECT_EQ(1, plan.node(1).arity());
}

TEST_F(PlanBuilderTest, top_k_validation) {
  ASSERT_OK_AND_ASSIGN(Plan plan, BuildExpr(R"(top_k {
      input { get { name: "x" } }
      group_key: [1]
      order { column: 0 }
      limit: 5
      offset: 1
    })"));
  const auto& top_k = std::get<TopKNode>(plan.node(1).op);
  EXPECT_EQ(5, top_k.limit.value());
  EXPECT_EQ(1, top_k.offset);

  EXPECT_THAT(BuildExpr(R"(top_k { input { get { name: "x" } } limit: -1 })"),
              HasPlanError(planpb::INVALID_PARAMETER));
  EXPECT_THAT(BuildExpr(R"(top_k { input { get { name: "x" } } offset: -2 })"),
              HasPlanError(planpb::INVALID_PARAMETER));
  EXPECT_THAT(BuildExpr(R"(top_k { input { get { name: "x" } } order { column: 2 } })"),
              HasPlanError(planpb::COLUMN_OUT_OF_RANGE));
}

TEST_F(PlanBuilderTest, union_inputs_must_agree) {
  EXPECT_OK(BuildExpr(R"(union_all {
      inputs { get { name: "x" } }
      inputs { negate { input { get { name: "x" } } } }
    })"));
  EXPECT_THAT(BuildExpr(R"(union_all {
      inputs { get { name: "x" } }
      inputs { project { input { get { name: "x" } } outputs: [0] } }
    })"),
              HasPlanError(planpb::ARITY_MISMATCH));
  EXPECT_THAT(BuildExpr(R"(union_all {
      inputs { get { name: "x" } }
      inputs { constant { column_types: [INT64, STRING] } }
    })"),
              HasPlanError(planpb::TYPE_MISMATCH));
}

TEST_F(PlanBuilderTest, node_ids_follow_construction_order) {
  ASSERT_OK_AND_ASSIGN(Plan plan, BuildExpr(R"(threshold { input { union_all {
      inputs { get { name: "x" } }
      inputs { get { name: "x" } }
    } } })"));
  ASSERT_EQ(4, plan.nodes().size());
  EXPECT_EQ("Union", plan.node(2).OpName());
  EXPECT_THAT(plan.node(2).Inputs(), ElementsAre(0, 1));
  EXPECT_THAT(plan.dag().TopologicalSort(), ElementsAre(0, 1, 2, 3));
}

TEST_F(PlanBuilderTest, folds_constant_results) {
  options_.fold_constants = true;
  ASSERT_OK_AND_ASSIGN(Plan plan, BuildExpr(R"(let {
      name: "c"
      value { constant {
        column_types: [INT64]
        rows { values { literal { type: INT64 int64_value: 3 } } }
        rows { values { literal { type: INT64 int64_value: 1 } } }
        rows { values { literal { type: INT64 int64_value: 2 } } }
      } }
      body { filter {
        input { union_all { inputs { get { name: "c" } } inputs { get { name: "c" } } } }
        predicates { call { function: "gt" args { column { index: 0 } }
                                           args { literal { type: INT64 int64_value: 1 } } } }
      } }
    })"));
  ASSERT_EQ(1, plan.nodes().size());
  const auto& constant = std::get<ConstantNode>(plan.node(0).op);
  std::vector<std::string> rows;
  for (const auto& row : constant.rows) {
    rows.push_back(types::RowToString(row));
  }
  EXPECT_THAT(rows, ElementsAre("(2)", "(2)", "(3)", "(3)"));
}

TEST_F(PlanBuilderTest, results_reading_sources_are_not_folded) {
  options_.fold_constants = true;
  ASSERT_OK_AND_ASSIGN(Plan plan, BuildExpr(R"(negate { input { get { name: "x" } } })"));
  EXPECT_EQ(2, plan.nodes().size());
}

TEST_F(PlanBuilderTest, negative_multiplicities_are_not_folded) {
  options_.fold_constants = true;
  ASSERT_OK_AND_ASSIGN(Plan plan, BuildExpr(R"(negate { input { constant {
      column_types: [INT64]
      rows { values { literal { type: INT64 int64_value: 1 } } }
    } } })"));
  EXPECT_EQ("Negate", plan.node(1).OpName());
}

TEST_F(PlanBuilderTest, folding_keeps_construction_errors) {
  options_.fold_constants = true;
  auto plan_or = BuildExpr(R"(negate { input { constant {
      column_types: [INT64]
      rows { values { column { index: 0 } } }
    } } })");
  EXPECT_THAT(plan_or, HasPlanError(planpb::INVALID_LITERAL_CONTEXT));
}

TEST(BuildPlan, uses_builtin_registry) {
  PlannerOptions options;
  ASSERT_OK_AND_ASSIGN(Plan plan, BuildPlan(RequestFromText(R"(
    forms { source { name: "s" column_types: [FLOAT64] } }
    forms { result { expr { map {
      input { get { name: "s" } }
      exprs { call { function: "neg_float64" args { column { index: 0 } } } }
    } } } })"),
                                            options));
  EXPECT_THAT(plan.sources(), ::testing::SizeIs(1));
  EXPECT_THAT(plan.results()[0].column_types, ElementsAre(DataType::FLOAT64, DataType::FLOAT64));
}

}  // namespace plan
}  // namespace compute
}  // namespace dp
