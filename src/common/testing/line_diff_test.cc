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

#include "src/common/testing/line_diff.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace dp {
namespace testing {

using ::testing::Not;
using ::testing::StrEq;

TEST(DiffLinesTest, MarksChangedLines) {
  EXPECT_THAT(DiffLines("a\nf\nc\ne", "a\nb\nc\ne"), StrEq(" a\n-f\n+b\n c\n e"));
}

TEST(DiffLinesTest, EmptyInputs) {
  EXPECT_THAT(DiffLines("", "a\nb"), StrEq("-\n+a\n+b"));
  EXPECT_THAT(DiffLines("a", "a"), StrEq(" a"));
}

TEST(TextEqTest, MatchesExactText) {
  EXPECT_THAT("%0 =\n| Constant\n", TextEq("%0 =\n| Constant\n"));
  EXPECT_THAT("%0 =\n| Constant (1)\n", Not(TextEq("%0 =\n| Constant\n")));
}

}  // namespace testing
}  // namespace dp
