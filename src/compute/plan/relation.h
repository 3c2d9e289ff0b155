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
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "src/compute/plan/func_registry.h"
#include "src/compute/plan/scalar_expression.h"
#include "src/shared/types/datum.h"

namespace dp {
namespace compute {
namespace plan {

/**
 * What a Get reads: a declared source (by index), a named result (by result index) or a
 * let-bound value (by the id of the value's root node).
 */
struct GlobalRef {
  enum class Kind { kSource, kView, kLocal };
  Kind kind = Kind::kSource;
  int64_t id = 0;
};

struct ConstantNode {
  std::vector<types::Row> rows;
};

struct GetNode {
  GlobalRef ref;
  std::string name;
};

struct LetNode {
  std::string name;
  int64_t value = 0;
  int64_t body = 0;
};

struct MapNode {
  int64_t input = 0;
  // Expression i sees the input columns followed by the outputs of expressions 0..i-1.
  std::vector<ScalarExpr> exprs;
};

struct FilterNode {
  int64_t input = 0;
  std::vector<ScalarExpr> predicates;
};

struct ProjectNode {
  int64_t input = 0;
  std::vector<int64_t> outputs;
};

struct ArrangeByNode {
  int64_t input = 0;
  // Distinct key-sets in request order. A key-set may repeat a column.
  std::vector<std::vector<int64_t>> keys;
};

// Probe of `input` on its arrangement keyed by `key`, columns local to that input.
struct DeltaStep {
  int64_t input = 0;
  std::vector<int64_t> key;
};

// How the join output changes when input `source` changes.
struct DeltaRule {
  int64_t source = 0;
  std::vector<DeltaStep> steps;
};

struct Unplanned {};

struct DeltaQuery {
  // Exactly one rule per input, rule i for input i.
  std::vector<DeltaRule> rules;
};

using JoinImplementation = std::variant<Unplanned, DeltaQuery>;

struct JoinNode {
  std::vector<int64_t> inputs;
  // Canonical equivalence classes over the concatenated input columns.
  std::vector<std::vector<int64_t>> equivalences;
  // Sorted and deduplicated; nullopt when no demand was given.
  std::optional<std::vector<int64_t>> demand;
  JoinImplementation implementation;
};

struct AggregateExpr {
  const AggregateFunction* function = nullptr;
  int64_t column = 0;
  bool distinct = false;
  types::DataType type = types::DataType::DATA_TYPE_UNKNOWN;

  // "sum(#1)", "count(distinct #2)".
  std::string ToString() const;
};

// A Reduce without aggregates is a Distinct over its group key.
struct ReduceNode {
  int64_t input = 0;
  std::vector<ScalarExpr> group_key;
  std::vector<AggregateExpr> aggregates;

  bool IsDistinct() const { return aggregates.empty(); }
};

struct OrderKey {
  int64_t column = 0;
  bool descending = false;
};

struct TopKNode {
  int64_t input = 0;
  std::vector<int64_t> group_key;
  std::vector<OrderKey> order;
  // nullopt is unbounded.
  std::optional<int64_t> limit;
  int64_t offset = 0;
};

struct UnionNode {
  std::vector<int64_t> inputs;
};

struct NegateNode {
  int64_t input = 0;
};

struct ThresholdNode {
  int64_t input = 0;
};

using RelationOp =
    std::variant<ConstantNode, GetNode, LetNode, MapNode, FilterNode, ProjectNode, ArrangeByNode,
                 JoinNode, ReduceNode, TopKNode, UnionNode, NegateNode, ThresholdNode>;

/**
 * One node of a plan. Nodes are owned by their Plan and refer to each other by id.
 */
struct RelationNode {
  int64_t id = 0;
  std::vector<types::DataType> column_types;
  RelationOp op;

  int64_t arity() const { return static_cast<int64_t>(column_types.size()); }

  // Ids of the nodes this node owns as inputs, in order. A Let lists its value then its body.
  std::vector<int64_t> Inputs() const;

  std::string_view OpName() const;
};

}  // namespace plan
}  // namespace compute
}  // namespace dp
