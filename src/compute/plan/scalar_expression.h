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
#include <utility>
#include <variant>
#include <vector>

#include "src/common/base/base.h"
#include "src/compute/plan/func_registry.h"
#include "src/compute/planpb/plan.pb.h"
#include "src/shared/types/datum.h"

namespace dp {
namespace compute {
namespace plan {

class ScalarExpr;

struct Literal {
  types::Datum value;
};

// Zero-based index into the row the expression is evaluated against.
struct ColumnRef {
  int64_t index = 0;
};

struct CallExpr {
  // Owned by the FunctionRegistry, which outlives every plan.
  const ScalarFunction* function = nullptr;
  std::vector<ScalarExpr> args;
};

/**
 * A typed scalar expression: a literal, a column reference or a function call. The type is fixed
 * at construction, so a ScalarExpr is always well typed against the input it was built for.
 */
class ScalarExpr {
 public:
  using Kind = std::variant<Literal, ColumnRef, CallExpr>;

  ScalarExpr() = default;

  static ScalarExpr MakeLiteral(types::Datum value, types::DataType type);
  static ScalarExpr MakeColumn(int64_t index, types::DataType type);
  static ScalarExpr MakeCall(const ScalarFunction* function, std::vector<ScalarExpr> args,
                             types::DataType type);

  const Kind& kind() const { return kind_; }
  types::DataType type() const { return type_; }

  bool IsLiteral() const { return std::holds_alternative<Literal>(kind_); }
  bool IsColumn() const { return std::holds_alternative<ColumnRef>(kind_); }

  // Appends every column this expression reads, in visitation order.
  void ReferencedColumns(std::vector<int64_t>* columns) const;

  // "#0", "5", "(#0 + 1)", "neg_int64(#1)", "coalesce(#0, 1)".
  std::string ToString() const;

  StatusOr<types::Datum> Evaluate(const types::Row& row) const;

 private:
  ScalarExpr(Kind kind, types::DataType type) : kind_(std::move(kind)), type_(type) {}

  Kind kind_;
  types::DataType type_ = types::DataType::DATA_TYPE_UNKNOWN;
};

/**
 * Converts a typed literal. Fails with TypeMismatch if the value does not match the declared type.
 */
StatusOr<ScalarExpr> LiteralFromProto(const planpb::Literal& pb, int64_t node_id);

/**
 * Builds and type checks an expression over a row of `input_types`.
 */
StatusOr<ScalarExpr> ScalarExprFromProto(const planpb::ScalarExpr& pb,
                                         const std::vector<types::DataType>& input_types,
                                         const FunctionRegistry& registry, int64_t node_id);

/**
 * Converts a value that must be a literal, such as a field of a constant row. Column references
 * and calls fail with InvalidLiteralContext. An int64 literal may fill an int32 column when it is
 * in range.
 */
StatusOr<types::Datum> ConstantValueFromProto(const planpb::ScalarExpr& pb,
                                              types::DataType column_type, int64_t node_id);

// Renders a column list as "#0, #2".
std::string ColumnsToString(const std::vector<int64_t>& columns);

}  // namespace plan
}  // namespace compute
}  // namespace dp
