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

#include "src/compute/plan/plan.h"

#include <absl/strings/str_join.h>
#include <absl/strings/substitute.h>

namespace dp {
namespace compute {
namespace plan {

const RelationNode& Plan::node(int64_t id) const {
  CHECK(id >= 0 && id < NextNodeId()) << "Node does not exist: " << id;
  return nodes_[id];
}

int64_t Plan::AddNode(std::vector<types::DataType> column_types, RelationOp op) {
  int64_t id = NextNodeId();
  nodes_.push_back(RelationNode{id, std::move(column_types), std::move(op)});
  const RelationNode& node = nodes_.back();

  dag_.AddNode(id);
  for (int64_t input : node.Inputs()) {
    DCHECK_LT(input, id);
    dag_.AddEdge(input, id);
  }
  if (const auto* get = std::get_if<GetNode>(&node.op)) {
    if (get->ref.kind == GlobalRef::Kind::kLocal) {
      dag_.AddEdge(get->ref.id, id);
    }
  }
  VLOG(1) << absl::Substitute("Built node $0: $1 $2", id, node.OpName(),
                              types::SchemaToString(node.column_types));
  return id;
}

CollectionId Plan::CollectionOf(int64_t id) const {
  if (const auto* get = std::get_if<GetNode>(&node(id).op)) {
    switch (get->ref.kind) {
      case GlobalRef::Kind::kSource:
        return CollectionId{CollectionId::Kind::kSource, get->ref.id};
      case GlobalRef::Kind::kView:
        return CollectionId{CollectionId::Kind::kView, get->ref.id};
      case GlobalRef::Kind::kLocal:
        // A let bound to a plain Get stands for what that Get reads.
        return CollectionOf(get->ref.id);
    }
  }
  return CollectionId{CollectionId::Kind::kNode, id};
}

std::string Plan::DebugString() const {
  std::vector<std::string> lines;
  for (const auto& source : sources_) {
    lines.push_back(
        absl::Substitute("source $0 $1", source.name, types::SchemaToString(source.column_types)));
  }
  for (const auto& node : nodes_) {
    lines.push_back(absl::Substitute("node $0: $1 [$2] $3", node.id, node.OpName(),
                                     absl::StrJoin(node.Inputs(), ", "),
                                     types::SchemaToString(node.column_types)));
  }
  for (const auto& result : results_) {
    lines.push_back(absl::Substitute("result $0 = node $1",
                                     result.name.empty() ? "<anonymous>" : result.name,
                                     result.root));
  }
  if (arrangements_.NumArrangements() > 0) {
    lines.push_back(arrangements_.DebugString());
  }
  return absl::StrJoin(lines, "\n");
}

}  // namespace plan
}  // namespace compute
}  // namespace dp
