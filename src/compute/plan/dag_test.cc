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

#include "src/common/testing/testing.h"

namespace dp {
namespace compute {
namespace plan {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

class DAGTest : public ::testing::Test {
 protected:
  void SetUp() override {
    for (int64_t node : {5, 8, 3, 6, 20}) {
      dag_.AddNode(node);
    }
    dag_.AddEdge(5, 8);
    dag_.AddEdge(5, 3);
    dag_.AddEdge(8, 3);
    dag_.AddEdge(3, 6);
  }
  DAG dag_;
};

TEST_F(DAGTest, basic_test) {
  EXPECT_THAT(dag_.nodes(), ElementsAre(5, 8, 3, 6, 20));
  EXPECT_THAT(dag_.ChildrenOf(5), ElementsAre(8, 3));
  EXPECT_THAT(dag_.ParentsOf(3), ElementsAre(5, 8));
  EXPECT_THAT(dag_.ParentsOf(20), IsEmpty());
  EXPECT_TRUE(dag_.HasNode(5));
  EXPECT_FALSE(dag_.HasNode(36));
}

TEST_F(DAGTest, topological_sort_prefers_smallest_ready_id) {
  EXPECT_THAT(dag_.TopologicalSort(), ElementsAre(5, 8, 3, 6, 20));
}

TEST_F(DAGTest, cycle_leaves_nodes_unsorted) {
  dag_.AddEdge(6, 5);
  EXPECT_THAT(dag_.TopologicalSort(), ElementsAre(20));
}

TEST_F(DAGTest, self_loop) {
  dag_.AddEdge(20, 20);
  EXPECT_THAT(dag_.TopologicalSort(), ElementsAre(5, 8, 3, 6));
}

TEST_F(DAGTest, parallel_edges) {
  DAG dag;
  dag.AddNode(1);
  dag.AddNode(0);
  dag.AddEdge(1, 0);
  dag.AddEdge(1, 0);
  EXPECT_THAT(dag.TopologicalSort(), ElementsAre(1, 0));
}

TEST_F(DAGTest, debug_string) {
  EXPECT_EQ("{5} : [8, 3]\n{8} : [3]\n{3} : [6]\n{6} : []\n{20} : []\n", dag_.DebugString());
}

using DAGDeathTest = DAGTest;
TEST_F(DAGDeathTest, check_add_duplicate) { EXPECT_DEBUG_DEATH(dag_.AddNode(5), ".*"); }

}  // namespace plan
}  // namespace compute
}  // namespace dp
