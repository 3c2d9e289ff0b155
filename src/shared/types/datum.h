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

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "src/common/base/base.h"
#include "src/shared/types/types.h"

namespace dp {
namespace types {

/**
 * A single typed value. std::monostate is SQL NULL; the remaining alternatives map one to one
 * onto the non-unknown DataType values.
 */
using Datum = std::variant<std::monostate, bool, int32_t, int64_t, double, std::string>;

using Row = std::vector<Datum>;

inline bool IsNull(const Datum& d) { return std::holds_alternative<std::monostate>(d); }

// Returns the type of a non-null datum, DATA_TYPE_UNKNOWN for null.
DataType DatumType(const Datum& d);

// True if the datum is null or of the given type.
bool DatumHasType(const Datum& d, DataType type);

/**
 * Renders a datum the way plans print literals: null, true, 42, 1.5, "text".
 * Floats use the shortest text that parses back to the same value.
 */
std::string DatumToString(const Datum& d);

// Renders a row as "(1, 2, 3)".
std::string RowToString(const Row& row);

/**
 * Total order over datums. Values of the same type compare naturally, null sorts after every
 * non-null value, and values of different types order by their DataType. NaN equals itself and
 * sorts after every other float.
 * Returns <0, 0 or >0.
 */
int CompareDatum(const Datum& lhs, const Datum& rhs);

// Lexicographic CompareDatum over rows; shorter prefixes sort first.
int CompareRows(const Row& lhs, const Row& rhs);

struct RowLess {
  bool operator()(const Row& lhs, const Row& rhs) const { return CompareRows(lhs, rhs) < 0; }
};

}  // namespace types
}  // namespace dp
