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

#include <map>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "src/common/base/base.h"
#include "src/compute/plan/plan.h"
#include "src/shared/types/datum.h"

namespace dp {
namespace compute {
namespace plan {

// Rows with their multiplicities. Entries with multiplicity zero are never stored.
using Multiset = std::map<types::Row, int64_t, types::RowLess>;

/**
 * Reference semantics for plans whose leaves are constants. Evaluates a node of a plan to the
 * multiset of rows it describes. Gets of sources cannot be evaluated; Gets of views and lets are
 * followed. Rows that TopK treats as ties keep no particular order.
 */
class ConstantEvaluator {
 public:
  explicit ConstantEvaluator(const Plan* plan) : plan_(plan) {}

  StatusOr<Multiset> Evaluate(int64_t id);

  // Lists every row once per unit of multiplicity, in row order. Fails on negative multiplicities.
  static StatusOr<std::vector<types::Row>> ToRows(const Multiset& rows);

 private:
  StatusOr<Multiset> EvaluateNode(const RelationNode& node);
  StatusOr<Multiset> EvaluateJoin(const JoinNode& join);
  StatusOr<Multiset> EvaluateReduce(const ReduceNode& reduce);
  StatusOr<Multiset> EvaluateTopK(const TopKNode& top_k);

  const Plan* plan_;
  // Results of let values and views, which may be read many times.
  absl::flat_hash_map<int64_t, Multiset> memo_;
};

}  // namespace plan
}  // namespace compute
}  // namespace dp
