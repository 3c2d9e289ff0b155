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
#include "src/compute/plan/arrangements.h"
#include "src/compute/plan/dag.h"
#include "src/compute/plan/relation.h"
#include "src/shared/types/types.h"

namespace dp {
namespace compute {
namespace plan {

struct Source {
  std::string name;
  std::vector<types::DataType> column_types;
};

// A top-level result. Anonymous results have an empty name.
struct Result {
  std::string name;
  int64_t root = 0;
  std::vector<types::DataType> column_types;
};

/**
 * An immutable plan graph. Nodes live in one table indexed by their id; ids are dense and
 * assigned in construction order, so a node's inputs always have smaller ids than the node.
 * Plans are produced by PlanBuilder.
 */
class Plan {
 public:
  const RelationNode& node(int64_t id) const;
  const std::vector<RelationNode>& nodes() const { return nodes_; }
  const std::vector<Source>& sources() const { return sources_; }
  const std::vector<Result>& results() const { return results_; }
  const ArrangementRegistry& arrangements() const { return arrangements_; }

  // Edges run from each input to its consumer, and from a let-bound value to the Gets reading it.
  const DAG& dag() const { return dag_; }

  // The collection a node stands for when it is arranged. A Get resolves to what it reads,
  // following lets whose value is itself a Get.
  CollectionId CollectionOf(int64_t id) const;

  std::string DebugString() const;

 private:
  friend class PlanBuilder;

  int64_t NextNodeId() const { return static_cast<int64_t>(nodes_.size()); }
  int64_t AddNode(std::vector<types::DataType> column_types, RelationOp op);

  std::vector<RelationNode> nodes_;
  std::vector<Source> sources_;
  std::vector<Result> results_;
  ArrangementRegistry arrangements_;
  DAG dag_;
};

}  // namespace plan
}  // namespace compute
}  // namespace dp
