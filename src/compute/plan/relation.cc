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

#include "src/compute/plan/relation.h"

#include <absl/strings/substitute.h>

#include "src/common/base/base.h"

namespace dp {
namespace compute {
namespace plan {

std::string AggregateExpr::ToString() const {
  return absl::Substitute("$0($1#$2)", function->name, distinct ? "distinct " : "", column);
}

std::vector<int64_t> RelationNode::Inputs() const {
  return std::visit(overloaded{
                        [](const ConstantNode&) { return std::vector<int64_t>{}; },
                        [](const GetNode&) { return std::vector<int64_t>{}; },
                        [](const LetNode& let) { return std::vector<int64_t>{let.value, let.body}; },
                        [](const JoinNode& join) { return join.inputs; },
                        [](const UnionNode& u) { return u.inputs; },
                        [](const auto& unary) { return std::vector<int64_t>{unary.input}; },
                    },
                    op);
}

std::string_view RelationNode::OpName() const {
  return std::visit(overloaded{
                        [](const ConstantNode&) { return "Constant"; },
                        [](const GetNode&) { return "Get"; },
                        [](const LetNode&) { return "Let"; },
                        [](const MapNode&) { return "Map"; },
                        [](const FilterNode&) { return "Filter"; },
                        [](const ProjectNode&) { return "Project"; },
                        [](const ArrangeByNode&) { return "ArrangeBy"; },
                        [](const JoinNode&) { return "Join"; },
                        [](const ReduceNode& reduce) {
                          return reduce.IsDistinct() ? "Distinct" : "Reduce";
                        },
                        [](const TopKNode&) { return "TopK"; },
                        [](const UnionNode&) { return "Union"; },
                        [](const NegateNode&) { return "Negate"; },
                        [](const ThresholdNode&) { return "Threshold"; },
                    },
                    op);
}

}  // namespace plan
}  // namespace compute
}  // namespace dp
