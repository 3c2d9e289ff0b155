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

#include "src/compute/plan/constant_evaluator.h"

#include <algorithm>
#include <utility>

#include <absl/strings/substitute.h>

namespace dp {
namespace compute {
namespace plan {

using types::Datum;
using types::Row;

namespace {

void Add(Multiset* out, Row row, int64_t multiplicity) {
  auto it = out->find(row);
  if (it == out->end()) {
    if (multiplicity != 0) {
      out->emplace(std::move(row), multiplicity);
    }
    return;
  }
  it->second += multiplicity;
  if (it->second == 0) {
    out->erase(it);
  }
}

Row ProjectRow(const Row& row, const std::vector<int64_t>& columns) {
  Row out;
  out.reserve(columns.size());
  for (int64_t c : columns) {
    out.push_back(row[c]);
  }
  return out;
}

Status CheckPositive(const Multiset& rows, std::string_view op) {
  for (const auto& [row, multiplicity] : rows) {
    if (multiplicity < 0) {
      return error::FailedPrecondition("$0 over row $1 with negative multiplicity $2", op,
                                       types::RowToString(row), multiplicity);
    }
  }
  return Status::OK();
}

}  // namespace

StatusOr<std::vector<Row>> ConstantEvaluator::ToRows(const Multiset& rows) {
  DP_RETURN_IF_ERROR(CheckPositive(rows, "Constant"));
  std::vector<Row> out;
  for (const auto& [row, multiplicity] : rows) {
    for (int64_t i = 0; i < multiplicity; ++i) {
      out.push_back(row);
    }
  }
  return out;
}

StatusOr<Multiset> ConstantEvaluator::Evaluate(int64_t id) {
  auto it = memo_.find(id);
  if (it != memo_.end()) {
    return it->second;
  }
  DP_ASSIGN_OR_RETURN(Multiset rows, EvaluateNode(plan_->node(id)));
  memo_[id] = rows;
  return rows;
}

StatusOr<Multiset> ConstantEvaluator::EvaluateNode(const RelationNode& node) {
  Multiset out;
  if (const auto* constant = std::get_if<ConstantNode>(&node.op)) {
    for (const auto& row : constant->rows) {
      Add(&out, row, 1);
    }
    return out;
  }
  if (const auto* get = std::get_if<GetNode>(&node.op)) {
    switch (get->ref.kind) {
      case GlobalRef::Kind::kLocal:
        return Evaluate(get->ref.id);
      case GlobalRef::Kind::kView:
        return Evaluate(plan_->results()[get->ref.id].root);
      case GlobalRef::Kind::kSource:
        break;
    }
    return error::FailedPrecondition("cannot evaluate source '$0'", get->name);
  }
  if (const auto* let = std::get_if<LetNode>(&node.op)) {
    return Evaluate(let->body);
  }
  if (const auto* map = std::get_if<MapNode>(&node.op)) {
    DP_ASSIGN_OR_RETURN(Multiset input, Evaluate(map->input));
    for (const auto& [row, multiplicity] : input) {
      Row extended = row;
      for (const auto& expr : map->exprs) {
        DP_ASSIGN_OR_RETURN(Datum value, expr.Evaluate(extended));
        extended.push_back(std::move(value));
      }
      Add(&out, std::move(extended), multiplicity);
    }
    return out;
  }
  if (const auto* filter = std::get_if<FilterNode>(&node.op)) {
    DP_ASSIGN_OR_RETURN(Multiset input, Evaluate(filter->input));
    for (const auto& [row, multiplicity] : input) {
      bool keep = true;
      for (const auto& predicate : filter->predicates) {
        DP_ASSIGN_OR_RETURN(Datum value, predicate.Evaluate(row));
        // Null is not true.
        if (types::IsNull(value) || !std::get<bool>(value)) {
          keep = false;
          break;
        }
      }
      if (keep) {
        Add(&out, row, multiplicity);
      }
    }
    return out;
  }
  if (const auto* project = std::get_if<ProjectNode>(&node.op)) {
    DP_ASSIGN_OR_RETURN(Multiset input, Evaluate(project->input));
    for (const auto& [row, multiplicity] : input) {
      Add(&out, ProjectRow(row, project->outputs), multiplicity);
    }
    return out;
  }
  if (const auto* arrange = std::get_if<ArrangeByNode>(&node.op)) {
    return Evaluate(arrange->input);
  }
  if (const auto* join = std::get_if<JoinNode>(&node.op)) {
    return EvaluateJoin(*join);
  }
  if (const auto* reduce = std::get_if<ReduceNode>(&node.op)) {
    return EvaluateReduce(*reduce);
  }
  if (const auto* top_k = std::get_if<TopKNode>(&node.op)) {
    return EvaluateTopK(*top_k);
  }
  if (const auto* u = std::get_if<UnionNode>(&node.op)) {
    for (int64_t input_id : u->inputs) {
      DP_ASSIGN_OR_RETURN(Multiset input, Evaluate(input_id));
      for (const auto& [row, multiplicity] : input) {
        Add(&out, row, multiplicity);
      }
    }
    return out;
  }
  if (const auto* negate = std::get_if<NegateNode>(&node.op)) {
    DP_ASSIGN_OR_RETURN(Multiset input, Evaluate(negate->input));
    for (const auto& [row, multiplicity] : input) {
      Add(&out, row, -multiplicity);
    }
    return out;
  }
  const auto& threshold = std::get<ThresholdNode>(node.op);
  DP_ASSIGN_OR_RETURN(Multiset input, Evaluate(threshold.input));
  for (const auto& [row, multiplicity] : input) {
    if (multiplicity > 0) {
      Add(&out, row, multiplicity);
    }
  }
  return out;
}

StatusOr<Multiset> ConstantEvaluator::EvaluateJoin(const JoinNode& join) {
  Multiset product;
  product.emplace(Row{}, 1);
  for (int64_t input_id : join.inputs) {
    DP_ASSIGN_OR_RETURN(Multiset input, Evaluate(input_id));
    Multiset next;
    for (const auto& [prefix, lhs_mult] : product) {
      for (const auto& [row, rhs_mult] : input) {
        Row combined = prefix;
        combined.insert(combined.end(), row.begin(), row.end());
        Add(&next, std::move(combined), lhs_mult * rhs_mult);
      }
    }
    product = std::move(next);
  }

  Multiset out;
  for (const auto& [row, multiplicity] : product) {
    bool matches = true;
    for (const auto& cls : join.equivalences) {
      const Datum& first = row[cls[0]];
      for (int64_t c : cls) {
        // Null never equals anything, itself included.
        if (types::IsNull(row[c]) || types::CompareDatum(row[c], first) != 0) {
          matches = false;
          break;
        }
      }
      if (!matches) {
        break;
      }
    }
    if (matches) {
      Add(&out, row, multiplicity);
    }
  }
  return out;
}

StatusOr<Multiset> ConstantEvaluator::EvaluateReduce(const ReduceNode& reduce) {
  DP_ASSIGN_OR_RETURN(Multiset input, Evaluate(reduce.input));
  DP_RETURN_IF_ERROR(CheckPositive(input, "Reduce"));

  std::map<Row, std::vector<std::pair<const Row*, int64_t>>, types::RowLess> groups;
  for (const auto& [row, multiplicity] : input) {
    Row key;
    for (const auto& expr : reduce.group_key) {
      DP_ASSIGN_OR_RETURN(Datum value, expr.Evaluate(row));
      key.push_back(std::move(value));
    }
    groups[std::move(key)].emplace_back(&row, multiplicity);
  }

  Multiset out;
  for (const auto& [key, members] : groups) {
    Row result = key;
    for (const auto& agg : reduce.aggregates) {
      std::vector<Datum> values;
      for (const auto& [row, multiplicity] : members) {
        const Datum& value = (*row)[agg.column];
        if (types::IsNull(value)) {
          continue;
        }
        // A distinct aggregate sees each value once.
        int64_t copies = agg.distinct ? 1 : multiplicity;
        for (int64_t i = 0; i < copies; ++i) {
          values.push_back(value);
        }
      }
      if (agg.distinct) {
        std::sort(values.begin(), values.end(), [](const Datum& a, const Datum& b) {
          return types::CompareDatum(a, b) < 0;
        });
        values.erase(std::unique(values.begin(), values.end(),
                                 [](const Datum& a, const Datum& b) {
                                   return types::CompareDatum(a, b) == 0;
                                 }),
                     values.end());
      }
      DP_ASSIGN_OR_RETURN(Datum value, agg.function->eval(values));
      result.push_back(std::move(value));
    }
    Add(&out, std::move(result), 1);
  }
  return out;
}

StatusOr<Multiset> ConstantEvaluator::EvaluateTopK(const TopKNode& top_k) {
  DP_ASSIGN_OR_RETURN(Multiset input, Evaluate(top_k.input));
  DP_RETURN_IF_ERROR(CheckPositive(input, "TopK"));

  std::map<Row, std::vector<const Row*>, types::RowLess> groups;
  for (const auto& [row, multiplicity] : input) {
    auto& members = groups[ProjectRow(row, top_k.group_key)];
    for (int64_t i = 0; i < multiplicity; ++i) {
      members.push_back(&row);
    }
  }

  auto before = [&top_k](const Row* a, const Row* b) {
    for (const auto& key : top_k.order) {
      int c = types::CompareDatum((*a)[key.column], (*b)[key.column]);
      if (c != 0) {
        return key.descending ? c > 0 : c < 0;
      }
    }
    return false;
  };

  Multiset out;
  for (auto& [key, members] : groups) {
    std::stable_sort(members.begin(), members.end(), before);
    auto first = std::min<size_t>(static_cast<size_t>(top_k.offset), members.size());
    auto last = members.size();
    if (top_k.limit.has_value()) {
      last = std::min<size_t>(last, first + static_cast<size_t>(*top_k.limit));
    }
    for (size_t i = first; i < last; ++i) {
      Add(&out, *members[i], 1);
    }
  }
  return out;
}

}  // namespace plan
}  // namespace compute
}  // namespace dp
