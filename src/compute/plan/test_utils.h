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

#include <absl/strings/str_cat.h>
#include <google/protobuf/text_format.h>

#include "src/common/testing/testing.h"
#include "src/compute/plan/plan_error.h"
#include "src/compute/planpb/plan.pb.h"

namespace dp {
namespace compute {
namespace plan {
namespace testutils {

inline planpb::PlanRequest RequestFromText(const std::string& text) {
  planpb::PlanRequest request;
  CHECK(google::protobuf::TextFormat::MergeFromString(text, &request))
      << "Failed to parse request:\n"
      << text;
  return request;
}

MATCHER_P(HasPlanError, kind,
          absl::StrCat(negation ? "doesn't fail" : "fails", " with ", PlanErrorKindName(kind))) {
  Status status = ::dp::StatusAdapter(arg);
  *result_listener << "status is " << status.ToString();
  return GetPlanErrorKind(status) == kind;
}

}  // namespace testutils
}  // namespace plan
}  // namespace compute
}  // namespace dp
