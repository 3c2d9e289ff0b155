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

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "src/common/base/base.h"
#include "src/shared/types/datum.h"
#include "src/shared/types/types.h"

namespace dp {
namespace compute {
namespace plan {

/**
 * How a scalar function is called and rendered.
 */
enum class CallForm { kUnary, kBinary, kVariadic };

using ScalarEvalFn = std::function<StatusOr<types::Datum>(const std::vector<types::Datum>& args)>;
using AggregateEvalFn =
    std::function<StatusOr<types::Datum>(const std::vector<types::Datum>& values)>;

struct ScalarFunction {
  std::string name;
  CallForm form = CallForm::kBinary;
  // One entry per argument, or the element type for variadic functions. DATA_TYPE_UNKNOWN
  // accepts any type, but every such argument of one call must have the same type.
  std::vector<types::DataType> arg_types;
  // DATA_TYPE_UNKNOWN returns the type bound to the wildcard arguments.
  types::DataType return_type = types::DataType::DATA_TYPE_UNKNOWN;
  // Binary functions with an infix symbol render as "(a <infix> b)".
  std::string infix;
  // When set, a null argument yields null without calling eval.
  bool propagates_nulls = true;
  ScalarEvalFn eval;

  StatusOr<types::Datum> Evaluate(const std::vector<types::Datum>& args) const;
};

struct AggregateFunction {
  std::string name;
  // Accepted input types, empty accepts every type.
  std::vector<types::DataType> input_types;
  // DATA_TYPE_UNKNOWN returns the input type.
  types::DataType return_type = types::DataType::DATA_TYPE_UNKNOWN;
  // Called with the non-null input values of one group.
  AggregateEvalFn eval;
};

/**
 * The registry of scalar functions and aggregates that plans may call. Function ids are plain
 * names; each name has exactly one signature.
 */
class FunctionRegistry {
 public:
  // The process-wide registry holding every builtin. Never destroyed.
  static const FunctionRegistry& Default();

  Status RegisterScalar(ScalarFunction fn);
  Status RegisterAggregate(AggregateFunction fn);
  void RegisterScalarOrDie(ScalarFunction fn);
  void RegisterAggregateOrDie(AggregateFunction fn);

  /**
   * Lookups fail with an UnknownFunction plan error naming the function.
   */
  StatusOr<const ScalarFunction*> GetScalar(std::string_view name) const;
  StatusOr<const AggregateFunction*> GetAggregate(std::string_view name) const;

  /**
   * Checks the argument count (ArityMismatch) and types (TypeMismatch) of a call and returns its
   * output type.
   */
  static StatusOr<types::DataType> ResolveCall(const ScalarFunction& fn,
                                               const std::vector<types::DataType>& arg_types);
  static StatusOr<types::DataType> ResolveAggregate(const AggregateFunction& fn,
                                                    types::DataType input_type);

  std::string DebugString() const;

 private:
  std::map<std::string, std::unique_ptr<ScalarFunction>, std::less<>> scalars_;
  std::map<std::string, std::unique_ptr<AggregateFunction>, std::less<>> aggregates_;
};

}  // namespace plan
}  // namespace compute
}  // namespace dp
