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

#include "src/compute/plan/scalar_expression.h"

#include <limits>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/strings/substitute.h>

#include "src/compute/plan/plan_error.h"

namespace dp {
namespace compute {
namespace plan {

using types::DataType;
using types::Datum;

ScalarExpr ScalarExpr::MakeLiteral(Datum value, DataType type) {
  return ScalarExpr(Literal{std::move(value)}, type);
}

ScalarExpr ScalarExpr::MakeColumn(int64_t index, DataType type) {
  return ScalarExpr(ColumnRef{index}, type);
}

ScalarExpr ScalarExpr::MakeCall(const ScalarFunction* function, std::vector<ScalarExpr> args,
                                DataType type) {
  DCHECK(function != nullptr);
  return ScalarExpr(CallExpr{function, std::move(args)}, type);
}

void ScalarExpr::ReferencedColumns(std::vector<int64_t>* columns) const {
  std::visit(overloaded{
                 [](const Literal&) {},
                 [columns](const ColumnRef& col) { columns->push_back(col.index); },
                 [columns](const CallExpr& call) {
                   for (const auto& arg : call.args) {
                     arg.ReferencedColumns(columns);
                   }
                 },
             },
             kind_);
}

std::string ScalarExpr::ToString() const {
  return std::visit(
      overloaded{
          [](const Literal& lit) { return types::DatumToString(lit.value); },
          [](const ColumnRef& col) { return absl::StrCat("#", col.index); },
          [](const CallExpr& call) {
            const ScalarFunction& fn = *call.function;
            if (fn.form == CallForm::kBinary && !fn.infix.empty()) {
              return absl::Substitute("($0 $1 $2)", call.args[0].ToString(), fn.infix,
                                      call.args[1].ToString());
            }
            return absl::StrCat(fn.name, "(",
                                absl::StrJoin(call.args, ", ",
                                              [](std::string* out, const ScalarExpr& arg) {
                                                absl::StrAppend(out, arg.ToString());
                                              }),
                                ")");
          },
      },
      kind_);
}

StatusOr<Datum> ScalarExpr::Evaluate(const types::Row& row) const {
  if (const auto* lit = std::get_if<Literal>(&kind_)) {
    return lit->value;
  }
  if (const auto* col = std::get_if<ColumnRef>(&kind_)) {
    DCHECK_LT(col->index, static_cast<int64_t>(row.size()));
    return row[col->index];
  }
  const auto& call = std::get<CallExpr>(kind_);
  std::vector<Datum> args;
  args.reserve(call.args.size());
  for (const auto& arg : call.args) {
    DP_ASSIGN_OR_RETURN(Datum value, arg.Evaluate(row));
    args.push_back(std::move(value));
  }
  return call.function->Evaluate(args);
}

StatusOr<ScalarExpr> LiteralFromProto(const planpb::Literal& pb, int64_t node_id) {
  DataType type = pb.type();
  if (type == DataType::DATA_TYPE_UNKNOWN) {
    return PlanErrorStatus(planpb::TYPE_MISMATCH, NodeErrorContext(node_id),
                           "literal has no type");
  }
  if (pb.is_null()) {
    return ScalarExpr::MakeLiteral(Datum{}, type);
  }
  Datum value;
  switch (pb.value_case()) {
    case planpb::Literal::kBoolValue:
      value = pb.bool_value();
      break;
    case planpb::Literal::kInt32Value:
      value = pb.int32_value();
      break;
    case planpb::Literal::kInt64Value:
      value = pb.int64_value();
      break;
    case planpb::Literal::kFloat64Value:
      value = pb.float64_value();
      break;
    case planpb::Literal::kStringValue:
      value = pb.string_value();
      break;
    case planpb::Literal::VALUE_NOT_SET:
      return PlanErrorStatus(planpb::TYPE_MISMATCH, NodeErrorContext(node_id),
                             "non-null $0 literal has no value", types::DataTypeName(type));
  }
  if (types::DatumType(value) != type) {
    return PlanErrorStatus(planpb::TYPE_MISMATCH,
                           TokenErrorContext(node_id, types::DatumToString(value)),
                           "literal $0 is not of type $1", types::DatumToString(value),
                           types::DataTypeName(type));
  }
  return ScalarExpr::MakeLiteral(std::move(value), type);
}

StatusOr<ScalarExpr> ScalarExprFromProto(const planpb::ScalarExpr& pb,
                                         const std::vector<DataType>& input_types,
                                         const FunctionRegistry& registry, int64_t node_id) {
  switch (pb.kind_case()) {
    case planpb::ScalarExpr::kLiteral:
      return LiteralFromProto(pb.literal(), node_id);
    case planpb::ScalarExpr::kColumn: {
      int64_t index = pb.column().index();
      if (index < 0 || index >= static_cast<int64_t>(input_types.size())) {
        return PlanErrorStatus(planpb::COLUMN_OUT_OF_RANGE, ColumnErrorContext(node_id, index),
                               "column #$0 out of range for arity $1", index,
                               input_types.size());
      }
      return ScalarExpr::MakeColumn(index, input_types[index]);
    }
    case planpb::ScalarExpr::kCall: {
      DP_ASSIGN_OR_RETURN(const ScalarFunction* fn, registry.GetScalar(pb.call().function()));
      std::vector<ScalarExpr> args;
      std::vector<DataType> arg_types;
      for (const auto& arg_pb : pb.call().args()) {
        DP_ASSIGN_OR_RETURN(ScalarExpr arg,
                            ScalarExprFromProto(arg_pb, input_types, registry, node_id));
        arg_types.push_back(arg.type());
        args.push_back(std::move(arg));
      }
      DP_ASSIGN_OR_RETURN(DataType type, FunctionRegistry::ResolveCall(*fn, arg_types));
      return ScalarExpr::MakeCall(fn, std::move(args), type);
    }
    case planpb::ScalarExpr::KIND_NOT_SET:
      break;
  }
  return PlanErrorStatus(planpb::TYPE_MISMATCH, NodeErrorContext(node_id),
                         "scalar expression has no kind");
}

StatusOr<Datum> ConstantValueFromProto(const planpb::ScalarExpr& pb, DataType column_type,
                                       int64_t node_id) {
  if (pb.has_column()) {
    std::string token = absl::StrCat("#", pb.column().index());
    return PlanErrorStatus(planpb::INVALID_LITERAL_CONTEXT, TokenErrorContext(node_id, token),
                           "column reference $0 used where a literal is required", token);
  }
  if (pb.has_call()) {
    return PlanErrorStatus(planpb::INVALID_LITERAL_CONTEXT,
                           TokenErrorContext(node_id, pb.call().function()),
                           "call to '$0' used where a literal is required", pb.call().function());
  }
  if (!pb.has_literal()) {
    return PlanErrorStatus(planpb::TYPE_MISMATCH, NodeErrorContext(node_id),
                           "scalar expression has no kind");
  }
  DP_ASSIGN_OR_RETURN(ScalarExpr lit, LiteralFromProto(pb.literal(), node_id));
  Datum value = std::get<Literal>(lit.kind()).value;
  if (lit.type() == column_type) {
    return value;
  }
  if (lit.type() == DataType::INT64 && column_type == DataType::INT32) {
    if (types::IsNull(value)) {
      return value;
    }
    int64_t v = std::get<int64_t>(value);
    if (v >= std::numeric_limits<int32_t>::min() && v <= std::numeric_limits<int32_t>::max()) {
      return Datum(static_cast<int32_t>(v));
    }
  }
  std::string token = types::DatumToString(value);
  return PlanErrorStatus(planpb::TYPE_MISMATCH, TokenErrorContext(node_id, token),
                         "value $0 of type $1 does not fit a $2 column", token,
                         types::DataTypeName(lit.type()), types::DataTypeName(column_type));
}

std::string ColumnsToString(const std::vector<int64_t>& columns) {
  return absl::StrJoin(columns, ", ", [](std::string* out, int64_t c) {
    absl::StrAppend(out, "#", c);
  });
}

}  // namespace plan
}  // namespace compute
}  // namespace dp
