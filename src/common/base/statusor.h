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

#include <optional>
#include <ostream>
#include <string>
#include <utility>

#include "src/common/base/macros.h"
#include "src/common/base/status.h"

namespace dp {

/**
 * StatusOr<T> holds either a T or the error Status explaining why there is none. T does not need
 * to be default constructible.
 */
template <typename T>
class StatusOr {
  template <typename U>
  friend class StatusOr;

 public:
  StatusOr()
      : status_(statuspb::UNKNOWN,
                "Default constructed StatusOr should not be used, "
                "did you mistakenly return {}?") {}

  StatusOr(const Status& status);  // NOLINT
  StatusOr(const T& value) : value_(value) {}  // NOLINT
  StatusOr(T&& value) : value_(std::move(value)) {}  // NOLINT

  // Allows returning a StatusOr<Derived*> where a StatusOr<Base*> is expected.
  template <typename U>
  StatusOr(StatusOr<U>&& other)  // NOLINT
      : status_(std::move(other.status_)) {
    if (other.value_.has_value()) {
      value_.emplace(std::move(*other.value_));
    }
  }

  const Status& status() const { return status_; }
  bool ok() const { return status_.ok(); }
  statuspb::Code code() const { return status_.code(); }
  const std::string& msg() const { return status_.msg(); }

  const T& ValueOrDie() const {
    DP_CHECK_OK(status_);
    return *value_;
  }
  T& ValueOrDie() {
    DP_CHECK_OK(status_);
    return *value_;
  }

  // Moves the value out; the StatusOr must not be read afterwards.
  T ConsumeValueOrDie() {
    DP_CHECK_OK(status_);
    return std::move(*value_);
  }

  std::string ToString() const { return status_.ToString(); }

 private:
  Status status_;
  std::optional<T> value_;
};

template <typename T>
StatusOr<T>::StatusOr(const Status& status) : status_(status) {
  DCHECK(!status_.ok()) << "Should not pass OK status to constructor";
  if (status_.ok()) {
    status_ = Status(statuspb::INTERNAL, "Status::OK is not a valid StatusOr<T> value");
  }
}

template <typename T>
inline Status StatusAdapter(const StatusOr<T>& s) noexcept {
  return s.status();
}

// This enables GMock to print readable description of the tested value.
template <typename T>
std::ostream& operator<<(std::ostream& os, const StatusOr<T>& status_or) {
  return os << status_or.ToString();
}

}  // namespace dp

#define DP_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                             \
  if (!statusor.ok()) {                                \
    return statusor.status();                          \
  }                                                    \
  lhs = std::move(statusor.ValueOrDie())

// Declares or assigns `lhs` from a StatusOr expression, returning its status on error.
#define DP_ASSIGN_OR_RETURN(lhs, rexpr) \
  DP_ASSIGN_OR_RETURN_IMPL(DP_CONCAT_NAME(__status_or_value__, __COUNTER__), lhs, rexpr)
