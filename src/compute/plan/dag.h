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
#include <string>
#include <vector>

#include "src/common/base/base.h"

namespace dp {
namespace compute {
namespace plan {

/**
 * A directed graph over int64 ids. Edges point in data-flow direction, from an input to the node
 * that consumes it. Nodes and edges keep insertion order so every traversal is deterministic.
 */
class DAG {
 public:
  void AddNode(int64_t node);
  bool HasNode(int64_t node) const;

  // Adds an edge from `from_node` to `to_node`. Both must exist.
  void AddEdge(int64_t from_node, int64_t to_node);

  // Consumers of the node, in edge insertion order.
  const std::vector<int64_t>& ChildrenOf(int64_t node) const;
  // Inputs of the node, in edge insertion order.
  const std::vector<int64_t>& ParentsOf(int64_t node) const;

  /**
   * Kahn's algorithm. Among the nodes ready at any point the smallest id goes first. Nodes that
   * sit on or downstream of a cycle are left out, so a result shorter than nodes() means the
   * graph is cyclic.
   */
  std::vector<int64_t> TopologicalSort() const;

  std::string DebugString() const;

  const std::vector<int64_t>& nodes() const { return nodes_; }

 private:
  std::vector<int64_t> nodes_;
  std::map<int64_t, std::vector<int64_t>> forward_edges_by_node_;
  std::map<int64_t, std::vector<int64_t>> reverse_edges_by_node_;
};

}  // namespace plan
}  // namespace compute
}  // namespace dp
