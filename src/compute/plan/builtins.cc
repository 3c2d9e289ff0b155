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

#include "src/compute/plan/builtins.h"

#include <limits>
#include <string>
#include <type_traits>
#include <vector>

#include <absl/strings/str_cat.h>

namespace dp {
namespace compute {
namespace plan {

using types::DataType;
using types::Datum;

namespace {

template <typename T>
Status CheckedAdd(T a, T b, T* out) {
  if constexpr (std::is_floating_point_v<T>) {
    *out = a + b;
  } else if (__builtin_add_overflow(a, b, out)) {
    return error::InvalidArgument("integer overflow in $0 + $1", a, b);
  }
  return Status::OK();
}

template <typename T>
Status CheckedSub(T a, T b, T* out) {
  if constexpr (std::is_floating_point_v<T>) {
    *out = a - b;
  } else if (__builtin_sub_overflow(a, b, out)) {
    return error::InvalidArgument("integer overflow in $0 - $1", a, b);
  }
  return Status::OK();
}

template <typename T>
Status CheckedMul(T a, T b, T* out) {
  if constexpr (std::is_floating_point_v<T>) {
    *out = a * b;
  } else if (__builtin_mul_overflow(a, b, out)) {
    return error::InvalidArgument("integer overflow in $0 * $1", a, b);
  }
  return Status::OK();
}

template <typename T>
Status CheckedDiv(T a, T b, T* out) {
  if (b == 0) {
    return error::InvalidArgument("division by zero");
  }
  if constexpr (!std::is_floating_point_v<T>) {
    if (a == std::numeric_limits<T>::min() && b == -1) {
      return error::InvalidArgument("integer overflow in $0 / $1", a, b);
    }
  }
  *out = a / b;
  return Status::OK();
}

template <typename T>
using CheckedBinaryOp = Status (*)(T, T, T*);

template <typename T>
ScalarEvalFn Arithmetic(CheckedBinaryOp<T> op) {
  return [op](const std::vector<Datum>& args) -> StatusOr<Datum> {
    T out{};
    DP_RETURN_IF_ERROR(op(std::get<T>(args[0]), std::get<T>(args[1]), &out));
    return Datum(out);
  };
}

template <typename T>
ScalarEvalFn Negate() {
  return [](const std::vector<Datum>& args) -> StatusOr<Datum> {
    T out{};
    DP_RETURN_IF_ERROR(CheckedSub<T>(T{0}, std::get<T>(args[0]), &out));
    return Datum(out);
  };
}

template <typename T>
void RegisterArithmeticOrDie(FunctionRegistry* registry, DataType type) {
  std::string suffix(types::DataTypeName(type));
  registry->RegisterScalarOrDie({absl::StrCat("add_", suffix), CallForm::kBinary, {type, type},
                                 type, "+", true, Arithmetic<T>(&CheckedAdd<T>)});
  registry->RegisterScalarOrDie({absl::StrCat("sub_", suffix), CallForm::kBinary, {type, type},
                                 type, "-", true, Arithmetic<T>(&CheckedSub<T>)});
  registry->RegisterScalarOrDie({absl::StrCat("mul_", suffix), CallForm::kBinary, {type, type},
                                 type, "*", true, Arithmetic<T>(&CheckedMul<T>)});
  registry->RegisterScalarOrDie({absl::StrCat("div_", suffix), CallForm::kBinary, {type, type},
                                 type, "/", true, Arithmetic<T>(&CheckedDiv<T>)});
  registry->RegisterScalarOrDie(
      {absl::StrCat("neg_", suffix), CallForm::kUnary, {type}, type, "", true, Negate<T>()});
}

ScalarEvalFn Comparison(std::function<bool(int)> accept) {
  return [accept](const std::vector<Datum>& args) -> StatusOr<Datum> {
    return Datum(accept(types::CompareDatum(args[0], args[1])));
  };
}

// SQL three-valued logic: `dominant` decides the result on its own, null is returned if any
// argument is null otherwise.
ScalarEvalFn ThreeValuedLogic(bool dominant) {
  return [dominant](const std::vector<Datum>& args) -> StatusOr<Datum> {
    bool saw_null = false;
    for (const auto& arg : args) {
      if (types::IsNull(arg)) {
        saw_null = true;
      } else if (std::get<bool>(arg) == dominant) {
        return Datum(dominant);
      }
    }
    return saw_null ? Datum{} : Datum(!dominant);
  };
}

template <typename T>
StatusOr<Datum> AddAs(const Datum& lhs, const Datum& rhs) {
  T out{};
  DP_RETURN_IF_ERROR(CheckedAdd<T>(std::get<T>(lhs), std::get<T>(rhs), &out));
  return Datum(out);
}

StatusOr<Datum> SumValues(const std::vector<Datum>& values) {
  if (values.empty()) {
    return Datum{};
  }
  Datum acc = values[0];
  for (size_t i = 1; i < values.size(); ++i) {
    switch (types::DatumType(acc)) {
      case DataType::INT32: {
        DP_ASSIGN_OR_RETURN(acc, AddAs<int32_t>(acc, values[i]));
        break;
      }
      case DataType::INT64: {
        DP_ASSIGN_OR_RETURN(acc, AddAs<int64_t>(acc, values[i]));
        break;
      }
      case DataType::FLOAT64: {
        DP_ASSIGN_OR_RETURN(acc, AddAs<double>(acc, values[i]));
        break;
      }
      default:
        return error::Internal("sum over non-numeric value $0", types::DatumToString(acc));
    }
  }
  return acc;
}

// Returns the extreme value, where `sign` selects min (-1) or max (1).
AggregateEvalFn Extreme(int sign) {
  return [sign](const std::vector<Datum>& values) -> StatusOr<Datum> {
    if (values.empty()) {
      return Datum{};
    }
    const Datum* best = &values[0];
    for (const auto& v : values) {
      if (types::CompareDatum(v, *best) * sign > 0) {
        best = &v;
      }
    }
    return *best;
  };
}

}  // namespace

void RegisterMathOpsOrDie(FunctionRegistry* registry) {
  CHECK(registry != nullptr);
  RegisterArithmeticOrDie<int32_t>(registry, DataType::INT32);
  RegisterArithmeticOrDie<int64_t>(registry, DataType::INT64);
  RegisterArithmeticOrDie<double>(registry, DataType::FLOAT64);
}

void RegisterComparisonOpsOrDie(FunctionRegistry* registry) {
  CHECK(registry != nullptr);
  auto any = DataType::DATA_TYPE_UNKNOWN;
  auto ret = DataType::BOOLEAN;
  registry->RegisterScalarOrDie({"eq", CallForm::kBinary, {any, any}, ret, "=", true,
                                 Comparison([](int c) { return c == 0; })});
  registry->RegisterScalarOrDie({"neq", CallForm::kBinary, {any, any}, ret, "!=", true,
                                 Comparison([](int c) { return c != 0; })});
  registry->RegisterScalarOrDie({"lt", CallForm::kBinary, {any, any}, ret, "<", true,
                                 Comparison([](int c) { return c < 0; })});
  registry->RegisterScalarOrDie({"lte", CallForm::kBinary, {any, any}, ret, "<=", true,
                                 Comparison([](int c) { return c <= 0; })});
  registry->RegisterScalarOrDie({"gt", CallForm::kBinary, {any, any}, ret, ">", true,
                                 Comparison([](int c) { return c > 0; })});
  registry->RegisterScalarOrDie({"gte", CallForm::kBinary, {any, any}, ret, ">=", true,
                                 Comparison([](int c) { return c >= 0; })});
}

void RegisterLogicalOpsOrDie(FunctionRegistry* registry) {
  CHECK(registry != nullptr);
  auto b = DataType::BOOLEAN;
  registry->RegisterScalarOrDie(
      {"and", CallForm::kBinary, {b, b}, b, "AND", false, ThreeValuedLogic(false)});
  registry->RegisterScalarOrDie(
      {"or", CallForm::kBinary, {b, b}, b, "OR", false, ThreeValuedLogic(true)});
  registry->RegisterScalarOrDie(
      {"not", CallForm::kUnary, {b}, b, "", true, [](const std::vector<Datum>& args) {
         return StatusOr<Datum>(Datum(!std::get<bool>(args[0])));
       }});
  registry->RegisterScalarOrDie({"is_null", CallForm::kUnary, {DataType::DATA_TYPE_UNKNOWN}, b,
                                 "", false, [](const std::vector<Datum>& args) {
                                   return StatusOr<Datum>(Datum(types::IsNull(args[0])));
                                 }});
  registry->RegisterScalarOrDie({"coalesce", CallForm::kVariadic, {DataType::DATA_TYPE_UNKNOWN},
                                 DataType::DATA_TYPE_UNKNOWN, "", false,
                                 [](const std::vector<Datum>& args) -> StatusOr<Datum> {
                                   for (const auto& arg : args) {
                                     if (!types::IsNull(arg)) {
                                       return arg;
                                     }
                                   }
                                   return Datum{};
                                 }});
}

void RegisterStringOpsOrDie(FunctionRegistry* registry) {
  CHECK(registry != nullptr);
  registry->RegisterScalarOrDie({"concat", CallForm::kVariadic, {DataType::STRING},
                                 DataType::STRING, "", true,
                                 [](const std::vector<Datum>& args) -> StatusOr<Datum> {
                                   std::string out;
                                   for (const auto& arg : args) {
                                     absl::StrAppend(&out, std::get<std::string>(arg));
                                   }
                                   return Datum(std::move(out));
                                 }});
}

void RegisterAggregatesOrDie(FunctionRegistry* registry) {
  CHECK(registry != nullptr);
  registry->RegisterAggregateOrDie(
      {"count", {}, DataType::INT64, [](const std::vector<Datum>& values) -> StatusOr<Datum> {
         return Datum(static_cast<int64_t>(values.size()));
       }});
  registry->RegisterAggregateOrDie(
      {"sum", {DataType::INT32, DataType::INT64, DataType::FLOAT64}, DataType::DATA_TYPE_UNKNOWN,
       &SumValues});
  registry->RegisterAggregateOrDie({"min", {}, DataType::DATA_TYPE_UNKNOWN, Extreme(-1)});
  registry->RegisterAggregateOrDie({"max", {}, DataType::DATA_TYPE_UNKNOWN, Extreme(1)});
  registry->RegisterAggregateOrDie(
      {"any", {DataType::BOOLEAN}, DataType::BOOLEAN, ThreeValuedLogic(true)});
  registry->RegisterAggregateOrDie(
      {"all", {DataType::BOOLEAN}, DataType::BOOLEAN, ThreeValuedLogic(false)});
}

void RegisterBuiltinsOrDie(FunctionRegistry* registry) {
  RegisterMathOpsOrDie(registry);
  RegisterComparisonOpsOrDie(registry);
  RegisterLogicalOpsOrDie(registry);
  RegisterStringOpsOrDie(registry);
  RegisterAggregatesOrDie(registry);
}

}  // namespace plan
}  // namespace compute
}  // namespace dp
