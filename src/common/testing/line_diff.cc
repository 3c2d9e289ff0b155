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

#include <algorithm>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>

namespace dp {
namespace testing {

std::string DiffLines(const std::string& expected, const std::string& actual) {
  std::vector<std::string> lhs = absl::StrSplit(expected, '\n');
  std::vector<std::string> rhs = absl::StrSplit(actual, '\n');

  // suffix[i][j] is the length of the longest common subsequence of lhs[i:] and rhs[j:].
  std::vector<std::vector<size_t>> suffix(lhs.size() + 1, std::vector<size_t>(rhs.size() + 1, 0));
  for (size_t i = lhs.size(); i-- > 0;) {
    for (size_t j = rhs.size(); j-- > 0;) {
      suffix[i][j] = lhs[i] == rhs[j] ? suffix[i + 1][j + 1] + 1
                                       : std::max(suffix[i + 1][j], suffix[i][j + 1]);
    }
  }

  std::vector<std::string> out;
  size_t i = 0;
  size_t j = 0;
  while (i < lhs.size() && j < rhs.size()) {
    if (lhs[i] == rhs[j]) {
      out.push_back(absl::StrCat(" ", lhs[i++]));
      ++j;
    } else if (suffix[i + 1][j] >= suffix[i][j + 1]) {
      out.push_back(absl::StrCat("-", lhs[i++]));
    } else {
      out.push_back(absl::StrCat("+", rhs[j++]));
    }
  }
  while (i < lhs.size()) {
    out.push_back(absl::StrCat("-", lhs[i++]));
  }
  while (j < rhs.size()) {
    out.push_back(absl::StrCat("+", rhs[j++]));
  }
  return absl::StrJoin(out, "\n");
}

bool TextEqMatcher::MatchAndExplain(const std::string& actual, std::ostream* os) const {
  if (actual == expected_) {
    return true;
  }
  if (os != nullptr) {
    *os << "with diff (-expected +actual):\n" << DiffLines(expected_, actual);
  }
  return false;
}

void TextEqMatcher::DescribeTo(std::ostream* os) const { *os << "equals\n" << expected_; }

void TextEqMatcher::DescribeNegationTo(std::ostream* os) const {
  *os << "does not equal\n" << expected_;
}

}  // namespace testing
}  // namespace dp
