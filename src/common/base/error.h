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
#include <string_view>
#include <vector>

#include <absl/strings/ascii.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>
#include <absl/strings/substitute.h>
#include <magic_enum.hpp>

#include "src/common/base/status.h"
#include "src/common/base/statuspb/status.pb.h"

namespace dp {
namespace error {

// Declares error::FUNC(format, args...) and error::IsFUNC(status) for a canonical code.
#define DP_DECLARE_ERROR(FUNC, CONST)                                        \
  template <typename... Args>                                                \
  Status FUNC(std::string_view format, Args... args) {                       \
    return Status(::dp::statuspb::CONST, absl::Substitute(format, args...)); \
  }                                                                          \
  inline bool Is##FUNC(const Status& status) { return status.code() == ::dp::statuspb::CONST; }

DP_DECLARE_ERROR(Unknown, UNKNOWN)
DP_DECLARE_ERROR(InvalidArgument, INVALID_ARGUMENT)
DP_DECLARE_ERROR(NotFound, NOT_FOUND)
DP_DECLARE_ERROR(AlreadyExists, ALREADY_EXISTS)
DP_DECLARE_ERROR(Internal, INTERNAL)
DP_DECLARE_ERROR(Unimplemented, UNIMPLEMENTED)
DP_DECLARE_ERROR(FailedPrecondition, FAILED_PRECONDITION)

#undef DP_DECLARE_ERROR

// INVALID_ARGUMENT -> "Invalid Argument".
inline std::string CodeToString(statuspb::Code code) {
  std::string_view name = magic_enum::enum_name(code);
  if (name.empty()) {
    return "Unknown error_code";
  }
  std::vector<std::string> words = absl::StrSplit(name, '_');
  for (auto& word : words) {
    absl::AsciiStrToLower(&word);
    word[0] = absl::ascii_toupper(word[0]);
  }
  return absl::StrJoin(words, " ");
}

}  // namespace error
}  // namespace dp
