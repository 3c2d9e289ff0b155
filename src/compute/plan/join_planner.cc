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

#include "src/compute/plan/join_planner.h"

#include <algorithm>
#include <map>
#include <numeric>
#include <utility>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/strings/substitute.h>

#include "src/compute/plan/plan_error.h"

namespace dp {
namespace compute {
namespace plan {

namespace {

std::vector<int64_t> Arities(const std::vector<std::vector<types::DataType>>& input_types) {
  std::vector<int64_t> arities;
  arities.reserve(input_types.size());
  for (const auto& types : input_types) {
    arities.push_back(static_cast<int64_t>(types.size()));
  }
  return arities;
}

std::string ClassToString(const std::vector<int64_t>& cls) {
  return absl::StrCat("(= ", absl::StrJoin(cls, " ", [](std::string* out, int64_t c) {
                        absl::StrAppend(out, "#", c);
                      }),
                      ")");
}

int64_t FindRoot(std::vector<int64_t>* parent, int64_t x) {
  while ((*parent)[x] != x) {
    (*parent)[x] = (*parent)[(*parent)[x]];
    x = (*parent)[x];
  }
  return x;
}

}  // namespace

JoinInputMapper::JoinInputMapper(const std::vector<int64_t>& arities) {
  offsets_.reserve(arities.size() + 1);
  offsets_.push_back(0);
  for (int64_t arity : arities) {
    offsets_.push_back(offsets_.back() + arity);
  }
}

int64_t JoinInputMapper::InputOf(int64_t column) const {
  DCHECK(column >= 0 && column < total_arity()) << column;
  // First offset strictly greater than the column, minus one. Empty inputs are skipped.
  auto it = std::upper_bound(offsets_.begin(), offsets_.end(), column);
  return static_cast<int64_t>(it - offsets_.begin()) - 1;
}

JoinPlanner::JoinPlanner(std::vector<std::vector<types::DataType>> input_types, int64_t node_id)
    : input_types_(std::move(input_types)), mapper_(Arities(input_types_)), node_id_(node_id) {}

StatusOr<std::vector<std::vector<int64_t>>> JoinPlanner::CanonicalizeEquivalences(
    const std::vector<std::vector<int64_t>>& classes) const {
  int64_t total = mapper_.total_arity();
  std::vector<int64_t> parent(total);
  std::iota(parent.begin(), parent.end(), 0);
  std::vector<bool> constrained(total, false);

  for (const auto& cls : classes) {
    std::vector<int64_t> inputs;
    for (int64_t c : cls) {
      if (c < 0 || c >= total) {
        return PlanErrorStatus(planpb::MALFORMED_CONSTRAINT, ColumnErrorContext(node_id_, c),
                               "equivalence $0 references #$1 outside join arity $2",
                               ClassToString(cls), c, total);
      }
      inputs.push_back(mapper_.InputOf(c));
    }
    SortAndDedup(&inputs);
    if (inputs.size() < 2) {
      return PlanErrorStatus(planpb::MALFORMED_CONSTRAINT,
                             TokenErrorContext(node_id_, ClassToString(cls)),
                             "equivalence $0 must reference at least two inputs",
                             ClassToString(cls));
    }
    types::DataType type = input_types_[mapper_.InputOf(cls[0])][mapper_.LocalOf(cls[0])];
    for (int64_t c : cls) {
      types::DataType other = input_types_[mapper_.InputOf(c)][mapper_.LocalOf(c)];
      if (other != type) {
        return PlanErrorStatus(planpb::TYPE_MISMATCH, ColumnErrorContext(node_id_, c),
                               "equivalence $0 equates $1 with $2", ClassToString(cls),
                               types::DataTypeName(type), types::DataTypeName(other));
      }
      constrained[c] = true;
      int64_t a = FindRoot(&parent, cls[0]);
      int64_t b = FindRoot(&parent, c);
      parent[std::max(a, b)] = std::min(a, b);
    }
  }

  // Roots are the smallest member of each class, so visiting columns in order yields classes
  // ordered by smallest column with sorted members.
  std::vector<std::vector<int64_t>> canonical;
  std::map<int64_t, size_t> class_of_root;
  for (int64_t c = 0; c < total; ++c) {
    if (!constrained[c]) {
      continue;
    }
    int64_t root = FindRoot(&parent, c);
    auto [it, inserted] = class_of_root.emplace(root, canonical.size());
    if (inserted) {
      canonical.emplace_back();
    }
    canonical[it->second].push_back(c);
  }
  return canonical;
}

bool JoinPlanner::ClassIsBound(const std::vector<int64_t>& cls,
                               const std::vector<bool>& bound) const {
  return std::any_of(cls.begin(), cls.end(),
                     [&](int64_t c) { return bound[mapper_.InputOf(c)]; });
}

StatusOr<DeltaRule> JoinPlanner::PlanRule(
    int64_t source, const std::vector<std::vector<int64_t>>& equivalences) const {
  int64_t n = mapper_.num_inputs();
  std::vector<bool> bound(n, false);
  bound[source] = true;

  DeltaRule rule;
  rule.source = source;
  while (static_cast<int64_t>(rule.steps.size()) < n - 1) {
    int64_t best = -1;
    std::vector<int64_t> best_key;
    for (int64_t j = 0; j < n; ++j) {
      if (bound[j]) {
        continue;
      }
      std::vector<int64_t> key;
      for (const auto& cls : equivalences) {
        if (!ClassIsBound(cls, bound)) {
          continue;
        }
        // Members are sorted, so the first member in j is its smallest local column.
        auto it = std::find_if(cls.begin(), cls.end(),
                               [&](int64_t c) { return mapper_.InputOf(c) == j; });
        if (it != cls.end()) {
          key.push_back(mapper_.LocalOf(*it));
        }
      }
      if (!key.empty() && key.size() > best_key.size()) {
        best = j;
        best_key = std::move(key);
      }
    }
    if (best < 0) {
      std::vector<int64_t> unreachable;
      for (int64_t j = 0; j < n; ++j) {
        if (!bound[j]) {
          unreachable.push_back(j);
        }
      }
      return PlanErrorStatus(planpb::NO_VALID_JOIN_STRATEGY, NodeErrorContext(node_id_),
                             "join has no valid incremental strategy: a change to input $0 cannot "
                             "reach input(s) $1 through an equivalence",
                             source, absl::StrJoin(unreachable, ", "));
    }
    VLOG(2) << absl::Substitute("delta rule $0: probe input $1 on ($2)", source, best,
                                ColumnsToString(best_key));
    bound[best] = true;
    rule.steps.push_back(DeltaStep{best, std::move(best_key)});
  }
  return rule;
}

StatusOr<DeltaQuery> JoinPlanner::PlanDeltaQuery(
    const std::vector<std::vector<int64_t>>& equivalences) const {
  DeltaQuery query;
  for (int64_t source = 0; source < mapper_.num_inputs(); ++source) {
    DP_ASSIGN_OR_RETURN(DeltaRule rule, PlanRule(source, equivalences));
    query.rules.push_back(std::move(rule));
  }
  return query;
}

StatusOr<DeltaQuery> JoinPlanner::ValidateDeltaQuery(
    const planpb::DeltaQuerySpec& spec,
    const std::vector<std::vector<int64_t>>& equivalences) const {
  int64_t n = mapper_.num_inputs();
  if (spec.rules_size() != n) {
    return PlanErrorStatus(planpb::ARITY_MISMATCH, NodeErrorContext(node_id_),
                           "delta query has $0 rules for a join of $1 inputs", spec.rules_size(),
                           n);
  }

  DeltaQuery query;
  for (int64_t source = 0; source < n; ++source) {
    const auto& rule_pb = spec.rules(source);
    if (rule_pb.steps_size() != n - 1) {
      return PlanErrorStatus(planpb::NO_VALID_JOIN_STRATEGY, NodeErrorContext(node_id_),
                             "delta rule for input $0 must visit $1 other inputs, visits $2",
                             source, n - 1, rule_pb.steps_size());
    }
    std::vector<bool> bound(n, false);
    bound[source] = true;
    DeltaRule rule;
    rule.source = source;
    for (const auto& step_pb : rule_pb.steps()) {
      int64_t j = step_pb.input();
      if (j < 0 || j >= n || bound[j]) {
        return PlanErrorStatus(planpb::NO_VALID_JOIN_STRATEGY, NodeErrorContext(node_id_),
                               "delta rule for input $0 visits input $1 out of range or twice",
                               source, j);
      }
      if (step_pb.key().empty()) {
        return PlanErrorStatus(planpb::NO_VALID_JOIN_STRATEGY, NodeErrorContext(node_id_),
                               "delta rule for input $0 probes input $1 without a key", source, j);
      }
      for (int64_t k : step_pb.key()) {
        if (k < 0 || k >= mapper_.ArityOf(j)) {
          return PlanErrorStatus(planpb::COLUMN_OUT_OF_RANGE, ColumnErrorContext(node_id_, k),
                                 "key column #$0 out of range for input $1 of arity $2", k, j,
                                 mapper_.ArityOf(j));
        }
        int64_t global = mapper_.GlobalOf(j, k);
        bool is_bound = std::any_of(equivalences.begin(), equivalences.end(), [&](const auto& cls) {
          return std::binary_search(cls.begin(), cls.end(), global) && ClassIsBound(cls, bound);
        });
        if (!is_bound) {
          return PlanErrorStatus(planpb::NO_VALID_JOIN_STRATEGY, ColumnErrorContext(node_id_, k),
                                 "delta rule for input $0 probes input $1 on #$2, which no "
                                 "visited input constrains",
                                 source, j, k);
        }
      }
      bound[j] = true;
      rule.steps.push_back(DeltaStep{j, {step_pb.key().begin(), step_pb.key().end()}});
    }
    query.rules.push_back(std::move(rule));
  }
  return query;
}

}  // namespace plan
}  // namespace compute
}  // namespace dp
