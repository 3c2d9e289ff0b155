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

#include "src/shared/types/datum.h"

#include <algorithm>
#include <cmath>
#include <type_traits>

#include <absl/strings/escaping.h>
#include <absl/strings/match.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>

namespace dp {
namespace types {

namespace {

std::string FloatToString(double v) {
  if (std::isnan(v)) {
    return "nan";
  }
  std::string out;
  for (int precision = 15; precision <= 17; ++precision) {
    out = absl::StrFormat("%.*g", precision, v);
    double parsed = 0;
    if (std::isinf(v) || (absl::SimpleAtod(out, &parsed) && parsed == v)) {
      break;
    }
  }
  // Keep floats distinguishable from integers.
  if (!absl::StrContains(out, ".") && !absl::StrContains(out, "e") && std::isfinite(v)) {
    absl::StrAppend(&out, ".0");
  }
  return out;
}

template <typename T>
int Compare3(const T& lhs, const T& rhs) {
  if (lhs < rhs) {
    return -1;
  }
  return rhs < lhs ? 1 : 0;
}

}  // namespace

DataType DatumType(const Datum& d) {
  return std::visit(overloaded{
                        [](std::monostate) { return DataType::DATA_TYPE_UNKNOWN; },
                        [](bool) { return DataType::BOOLEAN; },
                        [](int32_t) { return DataType::INT32; },
                        [](int64_t) { return DataType::INT64; },
                        [](double) { return DataType::FLOAT64; },
                        [](const std::string&) { return DataType::STRING; },
                    },
                    d);
}

bool DatumHasType(const Datum& d, DataType type) { return IsNull(d) || DatumType(d) == type; }

std::string DatumToString(const Datum& d) {
  return std::visit(overloaded{
                        [](std::monostate) -> std::string { return "null"; },
                        [](bool v) -> std::string { return v ? "true" : "false"; },
                        [](int32_t v) { return absl::StrCat(v); },
                        [](int64_t v) { return absl::StrCat(v); },
                        [](double v) { return FloatToString(v); },
                        [](const std::string& v) { return absl::StrCat("\"", absl::CEscape(v), "\""); },
                    },
                    d);
}

std::string RowToString(const Row& row) {
  return absl::StrCat("(",
                      absl::StrJoin(row, ", ",
                                    [](std::string* out, const Datum& d) {
                                      absl::StrAppend(out, DatumToString(d));
                                    }),
                      ")");
}

int CompareDatum(const Datum& lhs, const Datum& rhs) {
  bool lhs_null = IsNull(lhs);
  bool rhs_null = IsNull(rhs);
  if (lhs_null || rhs_null) {
    return static_cast<int>(lhs_null) - static_cast<int>(rhs_null);
  }
  if (lhs.index() != rhs.index()) {
    return Compare3(lhs.index(), rhs.index());
  }
  return std::visit(
      [&rhs](const auto& l) {
        using T = std::decay_t<decltype(l)>;
        const T& r = std::get<T>(rhs);
        if constexpr (std::is_floating_point_v<T>) {
          if (std::isnan(l) || std::isnan(r)) {
            return static_cast<int>(std::isnan(l)) - static_cast<int>(std::isnan(r));
          }
        }
        return Compare3(l, r);
      },
      lhs);
}

int CompareRows(const Row& lhs, const Row& rhs) {
  size_t n = std::min(lhs.size(), rhs.size());
  for (size_t i = 0; i < n; ++i) {
    int c = CompareDatum(lhs[i], rhs[i]);
    if (c != 0) {
      return c;
    }
  }
  return Compare3(lhs.size(), rhs.size());
}

}  // namespace types
}  // namespace dp
