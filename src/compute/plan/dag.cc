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

#include "src/compute/plan/dag.h"

#include <set>

#include <absl/strings/str_join.h>
#include <absl/strings/substitute.h>

namespace dp {
namespace compute {
namespace plan {

void DAG::AddNode(int64_t node) {
  DCHECK(!HasNode(node)) << absl::Substitute("Node: $0 already exists", node);
  nodes_.push_back(node);
  forward_edges_by_node_[node] = {};
  reverse_edges_by_node_[node] = {};
}

bool DAG::HasNode(int64_t node) const {
  return forward_edges_by_node_.find(node) != forward_edges_by_node_.end();
}

void DAG::AddEdge(int64_t from_node, int64_t to_node) {
  CHECK(HasNode(from_node)) << "from_node does not exist: " << from_node;
  CHECK(HasNode(to_node)) << "to_node does not exist: " << to_node;

  forward_edges_by_node_[from_node].push_back(to_node);
  reverse_edges_by_node_[to_node].push_back(from_node);
}

const std::vector<int64_t>& DAG::ChildrenOf(int64_t node) const {
  auto it = forward_edges_by_node_.find(node);
  CHECK(it != forward_edges_by_node_.end()) << "Node does not exist: " << node;
  return it->second;
}

const std::vector<int64_t>& DAG::ParentsOf(int64_t node) const {
  auto it = reverse_edges_by_node_.find(node);
  CHECK(it != reverse_edges_by_node_.end()) << "Node does not exist: " << node;
  return it->second;
}

std::vector<int64_t> DAG::TopologicalSort() const {
  std::vector<int64_t> ordered;
  ordered.reserve(nodes_.size());
  std::set<int64_t> ready;
  std::map<int64_t, size_t> visited_count;

  for (auto node : nodes_) {
    if (reverse_edges_by_node_.at(node).empty()) {
      ready.insert(node);
    }
  }

  while (!ready.empty()) {
    int64_t front_val = *ready.begin();
    ready.erase(ready.begin());
    ordered.push_back(front_val);

    for (auto dep : forward_edges_by_node_.at(front_val)) {
      // Parallel edges are counted once per edge on both sides.
      if (++visited_count[dep] == reverse_edges_by_node_.at(dep).size()) {
        ready.insert(dep);
      }
    }
  }
  return ordered;
}

std::string DAG::DebugString() const {
  std::string debug_string;
  for (const auto& node : nodes_) {
    debug_string += absl::Substitute("{$0} : [$1]\n", node,
                                     absl::StrJoin(forward_edges_by_node_.at(node), ", "));
  }
  return debug_string;
}

}  // namespace plan
}  // namespace compute
}  // namespace dp
