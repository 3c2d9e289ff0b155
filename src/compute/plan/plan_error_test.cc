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

#include "src/common/testing/testing.h"

namespace dp {
namespace compute {
namespace plan {

using ::dp::testing::status::StatusIs;

TEST(PlanErrorStatus, CarriesKindAndContext) {
  Status s = PlanErrorStatus(planpb::COLUMN_OUT_OF_RANGE, ColumnErrorContext(3, 7),
                             "column $0 out of range for arity $1", 7, 2);
  EXPECT_THAT(s, StatusIs(statuspb::INVALID_ARGUMENT, "column 7 out of range for arity 2"));
  EXPECT_TRUE(IsPlanError(s, planpb::COLUMN_OUT_OF_RANGE));

  planpb::PlanError ctx;
  ASSERT_TRUE(GetPlanError(s, &ctx));
  EXPECT_EQ(3, ctx.node_id());
  EXPECT_EQ(7, ctx.column());
  EXPECT_EQ("#7", ctx.token());
  EXPECT_FALSE(ctx.has_line());
}

TEST(PlanErrorStatus, CodeMapping) {
  EXPECT_EQ(statuspb::NOT_FOUND, PlanErrorCode(planpb::UNRESOLVED_REFERENCE));
  EXPECT_EQ(statuspb::INVALID_ARGUMENT, PlanErrorCode(planpb::INVALID_LITERAL_CONTEXT));
  EXPECT_EQ(statuspb::INVALID_ARGUMENT, PlanErrorCode(planpb::MALFORMED_CONSTRAINT));
  EXPECT_EQ(statuspb::FAILED_PRECONDITION, PlanErrorCode(planpb::NO_VALID_JOIN_STRATEGY));
  EXPECT_EQ(statuspb::FAILED_PRECONDITION, PlanErrorCode(planpb::CYCLIC_REFERENCE));
  EXPECT_EQ(statuspb::ALREADY_EXISTS, PlanErrorCode(planpb::DUPLICATE_NAME));
}

TEST(PlanErrorStatus, StatusWithoutContext) {
  EXPECT_EQ(planpb::PLAN_ERROR_KIND_UNKNOWN, GetPlanErrorKind(error::Internal("boom")));
  EXPECT_EQ(planpb::PLAN_ERROR_KIND_UNKNOWN, GetPlanErrorKind(Status::OK()));
}

TEST(PlanErrorKindName, CamelCase) {
  EXPECT_EQ("UnresolvedReference", PlanErrorKindName(planpb::UNRESOLVED_REFERENCE));
  EXPECT_EQ("NoValidJoinStrategy", PlanErrorKindName(planpb::NO_VALID_JOIN_STRATEGY));
}

}  // namespace plan
}  // namespace compute
}  // namespace dp
