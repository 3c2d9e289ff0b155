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

#include "src/compute/plan/scalar_expression.h"

#include <google/protobuf/text_format.h>

#include "src/common/testing/testing.h"
#include "src/compute/plan/plan_error.h"

namespace dp {
namespace compute {
namespace plan {

using types::DataType;
using types::Datum;

class ScalarExprTest : public ::testing::Test {
 protected:
  planpb::ScalarExpr ParseExpr(const std::string& text) {
    planpb::ScalarExpr pb;
    CHECK(google::protobuf::TextFormat::ParseFromString(text, &pb)) << text;
    return pb;
  }

  StatusOr<ScalarExpr> Build(const std::string& text) {
    return ScalarExprFromProto(ParseExpr(text), input_types_, FunctionRegistry::Default(), 4);
  }

  std::vector<DataType> input_types_ = {DataType::INT64, DataType::STRING, DataType::BOOLEAN};
};

TEST_F(ScalarExprTest, column_and_literal) {
  ASSERT_OK_AND_ASSIGN(ScalarExpr col, Build("column { index: 1 }"));
  EXPECT_TRUE(col.IsColumn());
  EXPECT_EQ(DataType::STRING, col.type());
  EXPECT_EQ("#1", col.ToString());

  ASSERT_OK_AND_ASSIGN(ScalarExpr lit, Build("literal { type: INT64 int64_value: 5 }"));
  EXPECT_TRUE(lit.IsLiteral());
  EXPECT_EQ("5", lit.ToString());

  ASSERT_OK_AND_ASSIGN(ScalarExpr null_lit, Build("literal { type: STRING is_null: true }"));
  EXPECT_EQ("null", null_lit.ToString());
  EXPECT_EQ(DataType::STRING, null_lit.type());
}

TEST_F(ScalarExprTest, column_out_of_range) {
  auto expr_or_s = Build("column { index: 3 }");
  ASSERT_NOT_OK(expr_or_s);
  planpb::PlanError ctx;
  ASSERT_TRUE(GetPlanError(expr_or_s.status(), &ctx));
  EXPECT_EQ(planpb::COLUMN_OUT_OF_RANGE, ctx.kind());
  EXPECT_EQ(4, ctx.node_id());
  EXPECT_EQ("#3", ctx.token());
}

TEST_F(ScalarExprTest, literal_type_mismatch) {
  auto expr_or_s = Build("literal { type: INT32 string_value: \"a\" }");
  EXPECT_TRUE(IsPlanError(expr_or_s.status(), planpb::TYPE_MISMATCH));
  EXPECT_TRUE(IsPlanError(Build("literal { type: INT32 }").status(), planpb::TYPE_MISMATCH));
}

TEST_F(ScalarExprTest, calls_render_and_evaluate) {
  ASSERT_OK_AND_ASSIGN(ScalarExpr add, Build(R"(
    call {
      function: "add_int64"
      args { column { index: 0 } }
      args { literal { type: INT64 int64_value: 1 } }
    })"));
  EXPECT_EQ("(#0 + 1)", add.ToString());
  EXPECT_EQ(DataType::INT64, add.type());
  EXPECT_OK_AND_EQ(add.Evaluate({int64_t{41}, std::string("x"), true}), Datum(int64_t{42}));

  ASSERT_OK_AND_ASSIGN(ScalarExpr concat, Build(R"(
    call {
      function: "concat"
      args { column { index: 1 } }
      args { literal { type: STRING string_value: "!" } }
    })"));
  EXPECT_EQ("concat(#1, \"!\")", concat.ToString());

  ASSERT_OK_AND_ASSIGN(ScalarExpr neg, Build(R"(
    call { function: "not" args { column { index: 2 } } })"));
  EXPECT_EQ("not(#2)", neg.ToString());

  std::vector<int64_t> columns;
  add.ReferencedColumns(&columns);
  concat.ReferencedColumns(&columns);
  EXPECT_THAT(columns, ::testing::ElementsAre(0, 1));
}

TEST_F(ScalarExprTest, call_errors) {
  EXPECT_TRUE(IsPlanError(Build("call { function: \"nope\" }").status(),
                          planpb::UNKNOWN_FUNCTION));
  EXPECT_TRUE(IsPlanError(
      Build("call { function: \"add_int64\" args { column { index: 1 } } args { column { index: "
            "0 } } }")
          .status(),
      planpb::TYPE_MISMATCH));
  EXPECT_TRUE(IsPlanError(
      Build("call { function: \"add_int64\" args { column { index: 0 } } }").status(),
      planpb::ARITY_MISMATCH));
}

TEST_F(ScalarExprTest, constant_values_must_be_literals) {
  auto col_or_s = ConstantValueFromProto(ParseExpr("column { index: 0 }"), DataType::INT64, 0);
  ASSERT_NOT_OK(col_or_s);
  planpb::PlanError ctx;
  ASSERT_TRUE(GetPlanError(col_or_s.status(), &ctx));
  EXPECT_EQ(planpb::INVALID_LITERAL_CONTEXT, ctx.kind());
  EXPECT_EQ("#0", ctx.token());

  EXPECT_TRUE(IsPlanError(
      ConstantValueFromProto(ParseExpr("call { function: \"add_int64\" }"), DataType::INT64, 0)
          .status(),
      planpb::INVALID_LITERAL_CONTEXT));
}

TEST_F(ScalarExprTest, constant_values_narrow_int64_into_int32) {
  EXPECT_OK_AND_EQ(ConstantValueFromProto(ParseExpr("literal { type: INT64 int64_value: 7 }"),
                                          DataType::INT32, 0),
                   Datum(int32_t{7}));
  EXPECT_TRUE(IsPlanError(
      ConstantValueFromProto(ParseExpr("literal { type: INT64 int64_value: 4294967296 }"),
                             DataType::INT32, 0)
          .status(),
      planpb::TYPE_MISMATCH));
  EXPECT_TRUE(IsPlanError(
      ConstantValueFromProto(ParseExpr("literal { type: INT64 int64_value: 1 }"),
                             DataType::STRING, 0)
          .status(),
      planpb::TYPE_MISMATCH));
}

}  // namespace plan
}  // namespace compute
}  // namespace dp
