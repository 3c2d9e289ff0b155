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

#include <google/protobuf/any.pb.h>
#include <google/protobuf/message.h>

#include <memory>
#include <ostream>
#include <string>
#include <utility>

#include "src/common/base/logging.h"
#include "src/common/base/macros.h"
#include "src/common/base/statuspb/status.pb.h"

namespace dp {

/**
 * Status is the result of an operation that can fail: OK, or a canonical code with a message and
 * an optional protobuf context describing the failure in detail.
 *
 * The error state is immutable and shared between copies, so passing a Status around by value
 * never copies the message or the context.
 */
class DP_MUST_USE_RESULT Status {
 public:
  // Success status.
  Status() = default;
  Status(statuspb::Code code, std::string msg);
  Status(statuspb::Code code, std::string msg, const google::protobuf::Message& ctx);

  static Status OK() { return Status(); }

  bool ok() const { return state_ == nullptr; }

  // Return self, this makes it compatible with StatusOr<>.
  const Status& status() const { return *this; }

  statuspb::Code code() const { return ok() ? statuspb::OK : state_->code; }
  const std::string& msg() const;

  bool has_context() const { return !ok() && state_->context != nullptr; }
  // Null when there is no context.
  const google::protobuf::Any* context() const { return ok() ? nullptr : state_->context.get(); }

  /**
   * Unpacks the context into `out` if it holds a message of type T.
   */
  template <typename T>
  bool ContextAs(T* out) const {
    if (!has_context() || !state_->context->Is<T>()) {
      return false;
    }
    return state_->context->UnpackTo(out);
  }

  bool operator==(const Status& x) const;
  bool operator!=(const Status& x) const { return !(*this == x); }

  std::string ToString() const;

 private:
  struct State {
    statuspb::Code code;
    std::string msg;
    std::unique_ptr<google::protobuf::Any> context;
  };

  // Null if status is OK.
  std::shared_ptr<const State> state_;
};

template <typename T>
inline Status StatusAdapter(const T&) noexcept {
  static_assert(sizeof(T) == 0, "Implement custom status adapter, or include correct .h file.");
  return Status(statuspb::UNIMPLEMENTED, "Should never get here");
}

template <>
inline Status StatusAdapter<Status>(const Status& s) noexcept {
  return s;
}

// This enables GMock to print readable description of the tested value.
inline std::ostream& operator<<(std::ostream& os, const Status& status) {
  return os << status.ToString();
}

}  // namespace dp

#define DP_RETURN_IF_ERROR_IMPL(__status_name__, __status) \
  do {                                                     \
    const auto& __status_name__ = (__status);              \
    if (!__status_name__.ok()) {                           \
      return ::dp::StatusAdapter(__status_name__);         \
    }                                                      \
  } while (false)

// Early-returns the status if it is in error; otherwise, proceeds.
// The argument expression is evaluated exactly once.
#define DP_RETURN_IF_ERROR(__status) \
  DP_RETURN_IF_ERROR_IMPL(DP_CONCAT_NAME(__status__, __COUNTER__), __status)

#define DP_CHECK_OK(val)                                         \
  do {                                                           \
    const auto& __dp_status__ = (val);                           \
    CHECK(__dp_status__.ok()) << "Bad Status: " << __dp_status__; \
  } while (false)
