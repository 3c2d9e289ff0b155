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

#include "src/common/base/status.h"

#include <absl/strings/str_cat.h>

#include "src/common/base/error.h"

namespace dp {

Status::Status(statuspb::Code code, std::string msg) {
  DCHECK_NE(code, statuspb::OK) << "Use Status::OK() for success";
  state_ = std::make_shared<const State>(State{code, std::move(msg), nullptr});
}

Status::Status(statuspb::Code code, std::string msg, const google::protobuf::Message& ctx) {
  DCHECK_NE(code, statuspb::OK) << "Use Status::OK() for success";
  auto any = std::make_unique<google::protobuf::Any>();
  any->PackFrom(ctx);
  state_ = std::make_shared<const State>(State{code, std::move(msg), std::move(any)});
}

const std::string& Status::msg() const {
  static const auto* const kEmpty = new std::string;
  return ok() ? *kEmpty : state_->msg;
}

bool Status::operator==(const Status& x) const {
  if (state_ == x.state_) {
    return true;
  }
  if (ok() || x.ok() || code() != x.code() || msg() != x.msg()) {
    return false;
  }
  if (has_context() != x.has_context()) {
    return false;
  }
  return !has_context() || (context()->type_url() == x.context()->type_url() &&
                            context()->value() == x.context()->value());
}

std::string Status::ToString() const {
  if (ok()) {
    return "OK";
  }
  std::string out = absl::StrCat(error::CodeToString(code()), " : ", state_->msg);
  if (has_context()) {
    absl::StrAppend(&out, " Context: ", state_->context->ShortDebugString());
  }
  return out;
}

}  // namespace dp
