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

#include <absl/strings/match.h>
#include <gtest/gtest.h>

#include "src/common/base/error.h"
#include "src/common/base/statuspb/status.pb.h"

namespace dp {
namespace error {

TEST(CodeToString, title_cases_code_names) {
  EXPECT_EQ("Ok", CodeToString(statuspb::OK));
  EXPECT_EQ("Invalid Argument", CodeToString(statuspb::INVALID_ARGUMENT));
  EXPECT_EQ("Not Found", CodeToString(statuspb::NOT_FOUND));
  EXPECT_EQ("Already Exists", CodeToString(statuspb::ALREADY_EXISTS));
  EXPECT_EQ("Internal", CodeToString(statuspb::INTERNAL));
  EXPECT_EQ("Failed Precondition", CodeToString(statuspb::FAILED_PRECONDITION));
}

TEST(CodeToString, unknown_code) {
  EXPECT_TRUE(
      absl::StartsWith(CodeToString(static_cast<statuspb::Code>(1024)), "Unknown error_code"));
}

TEST(ErrorDeclarations, formats_message) {
  Status not_found = NotFound("no source named '$0'", "x");
  EXPECT_TRUE(IsNotFound(not_found));
  EXPECT_FALSE(IsInvalidArgument(not_found));
  EXPECT_EQ("no source named 'x'", not_found.msg());

  Status precondition = FailedPrecondition("$0 of $1 inputs unreachable", 2, 3);
  EXPECT_TRUE(IsFailedPrecondition(precondition));
  EXPECT_EQ("2 of 3 inputs unreachable", precondition.msg());
}

}  // namespace error
}  // namespace dp
