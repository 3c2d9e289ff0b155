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
#include <vector>

#include "src/common/base/base.h"
#include "src/compute/plan/relation.h"
#include "src/compute/planpb/plan.pb.h"
#include "src/shared/types/types.h"

namespace dp {
namespace compute {
namespace plan {

/**
 * Converts between columns of the concatenated join row and (input, local column) pairs.
 */
class JoinInputMapper {
 public:
  explicit JoinInputMapper(const std::vector<int64_t>& arities);

  int64_t num_inputs() const { return static_cast<int64_t>(offsets_.size()) - 1; }
  int64_t total_arity() const { return offsets_.back(); }

  int64_t InputOf(int64_t column) const;
  int64_t LocalOf(int64_t column) const { return column - offsets_[InputOf(column)]; }
  int64_t GlobalOf(int64_t input, int64_t local) const { return offsets_[input] + local; }
  int64_t ArityOf(int64_t input) const { return offsets_[input + 1] - offsets_[input]; }

 private:
  // offsets_[i] is the first global column of input i; the last entry is the total arity.
  std::vector<int64_t> offsets_;
};

/**
 * Chooses and validates delta-query strategies for one join.
 *
 * Planning is deterministic: it only depends on the canonical equivalence classes and the input
 * order. For the rule of input s, the bound set starts as {s}. At each step the candidates are the
 * unvisited inputs sharing a class with the bound set; a candidate's key holds, per such class in
 * canonical order, its smallest local column in the class. The candidate with the longest key
 * wins, ties going to the lowest input index.
 */
class JoinPlanner {
 public:
  // `node_id` is only used to give errors context.
  JoinPlanner(std::vector<std::vector<types::DataType>> input_types, int64_t node_id);

  /**
   * Validates the declared classes and returns them in canonical form: classes sharing a column
   * merged, columns sorted and deduplicated, classes ordered by their smallest column.
   */
  StatusOr<std::vector<std::vector<int64_t>>> CanonicalizeEquivalences(
      const std::vector<std::vector<int64_t>>& classes) const;

  // Plans one rule per input. `equivalences` must be canonical.
  StatusOr<DeltaQuery> PlanDeltaQuery(const std::vector<std::vector<int64_t>>& equivalences) const;

  // Checks a caller-provided strategy against canonical `equivalences`.
  StatusOr<DeltaQuery> ValidateDeltaQuery(
      const planpb::DeltaQuerySpec& spec,
      const std::vector<std::vector<int64_t>>& equivalences) const;

  const JoinInputMapper& mapper() const { return mapper_; }

 private:
  StatusOr<DeltaRule> PlanRule(int64_t source,
                               const std::vector<std::vector<int64_t>>& equivalences) const;

  // True if some member of the class belongs to an input marked in `bound`.
  bool ClassIsBound(const std::vector<int64_t>& cls, const std::vector<bool>& bound) const;

  std::vector<std::vector<types::DataType>> input_types_;
  JoinInputMapper mapper_;
  int64_t node_id_;
};

}  // namespace plan
}  // namespace compute
}  // namespace dp
