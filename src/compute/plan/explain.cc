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

#include "src/compute/plan/explain.h"

#include <utility>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/strings/substitute.h>

namespace dp {
namespace compute {
namespace plan {

namespace {

std::string ExprList(const std::vector<ScalarExpr>& exprs) {
  return absl::StrJoin(exprs, ", ", [](std::string* out, const ScalarExpr& expr) {
    absl::StrAppend(out, expr.ToString());
  });
}

std::string KeyString(const std::vector<int64_t>& key) {
  return absl::StrCat("(", ColumnsToString(key), ")");
}

std::string OperatorLine(std::string_view op, std::string_view args) {
  return args.empty() ? absl::StrCat("| ", op) : absl::StrCat("| ", op, " ", args);
}

/**
 * Renders one result. Blocks are appended to out_ as soon as they are complete, so every block
 * comes after the blocks it references.
 */
class ResultExplainer {
 public:
  ResultExplainer(const Plan& plan, const PlannerOptions& options)
      : plan_(plan), options_(options) {}

  std::string Render(int64_t root) {
    std::vector<std::string> lines = Pipeline(root);
    EmitBlock(absl::StrCat("%", next_block_, " ="), lines);
    return std::move(out_);
  }

 private:
  // Emits the pipeline ending at `id` as a block of its own and returns its number.
  int64_t EmitSubplan(int64_t id) {
    std::vector<std::string> lines = Pipeline(id);
    int64_t block = next_block_;
    EmitBlock(absl::StrCat("%", block, " ="), lines);
    return block;
  }

  void EmitLetValue(const LetNode& let) {
    std::vector<std::string> lines = Pipeline(let.value);
    int64_t block = next_block_;
    int64_t local = next_let_++;
    EmitBlock(absl::Substitute("%$0 = Let l$1 =", block, local), lines);
    let_blocks_[let.value] = {block, local};
  }

  void EmitBlock(const std::string& header, const std::vector<std::string>& lines) {
    if (next_block_ > 0) {
      out_ += "\n";
    }
    ++next_block_;
    absl::StrAppend(&out_, header, "\n");
    for (const auto& line : lines) {
      absl::StrAppend(&out_, line, "\n");
    }
  }

  // Lines of the operators from the start of the current block up to `id`.
  std::vector<std::string> Pipeline(int64_t id) {
    const RelationNode& node = plan_.node(id);
    std::vector<std::string> lines;
    std::visit(
        overloaded{
            [&](const ConstantNode& constant) {
              lines.push_back(OperatorLine(
                  "Constant",
                  absl::StrJoin(constant.rows, " ", [](std::string* out, const types::Row& row) {
                    absl::StrAppend(out, types::RowToString(row));
                  })));
            },
            [&](const GetNode& get) {
              if (get.ref.kind != GlobalRef::Kind::kLocal) {
                lines.push_back(OperatorLine("Get", get.name));
                return;
              }
              auto it = let_blocks_.find(get.ref.id);
              DCHECK(it != let_blocks_.end()) << "Get of a let value that was not rendered";
              lines.push_back(OperatorLine(
                  "Get", absl::Substitute("%$0 (l$1)", it->second.first, it->second.second)));
            },
            [&](const LetNode& let) {
              EmitLetValue(let);
              lines = Pipeline(let.body);
            },
            [&](const MapNode& map) {
              lines = Pipeline(map.input);
              lines.push_back(OperatorLine("Map", ExprList(map.exprs)));
            },
            [&](const FilterNode& filter) {
              lines = Pipeline(filter.input);
              lines.push_back(OperatorLine("Filter", ExprList(filter.predicates)));
            },
            [&](const ProjectNode& project) {
              lines = Pipeline(project.input);
              lines.push_back(OperatorLine("Project", KeyString(project.outputs)));
            },
            [&](const ArrangeByNode& arrange) {
              lines = Pipeline(arrange.input);
              lines.push_back(OperatorLine(
                  "ArrangeBy",
                  absl::StrJoin(arrange.keys, " ",
                                [](std::string* out, const std::vector<int64_t>& key) {
                                  absl::StrAppend(out, KeyString(key));
                                })));
            },
            [&](const JoinNode& join) { lines = JoinLines(join); },
            [&](const ReduceNode& reduce) {
              lines = Pipeline(reduce.input);
              lines.push_back(OperatorLine(
                  node.OpName(), absl::StrCat("group=(", ExprList(reduce.group_key), ")")));
              for (const auto& agg : reduce.aggregates) {
                lines.push_back(absl::StrCat("| | agg ", agg.ToString()));
              }
            },
            [&](const TopKNode& top_k) {
              lines = Pipeline(top_k.input);
              std::string order = absl::StrJoin(
                  top_k.order, ", ", [](std::string* out, const OrderKey& key) {
                    absl::StrAppend(out, "#", key.column, key.descending ? " desc" : " asc");
                  });
              std::string args = absl::Substitute("group=$0 order=($1)",
                                                  KeyString(top_k.group_key), order);
              if (top_k.limit.has_value()) {
                absl::StrAppend(&args, " limit=", *top_k.limit);
              }
              absl::StrAppend(&args, " offset=", top_k.offset);
              lines.push_back(OperatorLine("TopK", args));
            },
            [&](const UnionNode& u) {
              std::vector<std::string> blocks;
              for (int64_t input : u.inputs) {
                blocks.push_back(absl::StrCat("%", EmitSubplan(input)));
              }
              lines.push_back(OperatorLine("Union", absl::StrJoin(blocks, " ")));
            },
            [&](const NegateNode& negate) {
              lines = Pipeline(negate.input);
              lines.push_back(OperatorLine("Negate", ""));
            },
            [&](const ThresholdNode& threshold) {
              lines = Pipeline(threshold.input);
              lines.push_back(OperatorLine("Threshold", ""));
            },
        },
        node.op);
    return lines;
  }

  std::vector<std::string> JoinLines(const JoinNode& join) {
    std::vector<int64_t> blocks;
    for (int64_t input : join.inputs) {
      blocks.push_back(EmitSubplan(input));
    }
    auto block_ref = [&blocks](int64_t input) { return absl::StrCat("%", blocks[input]); };

    std::vector<std::string> args;
    for (size_t i = 0; i < blocks.size(); ++i) {
      args.push_back(block_ref(i));
    }
    for (const auto& cls : join.equivalences) {
      args.push_back(absl::StrCat(
          "(=",
          absl::StrJoin(cls, "",
                        [](std::string* out, int64_t c) { absl::StrAppend(out, " #", c); }),
          ")"));
    }

    std::vector<std::string> lines;
    lines.push_back(OperatorLine("Join", absl::StrJoin(args, " ")));
    std::visit(overloaded{
                   [&](const Unplanned&) {
                     lines.push_back("| | implementation = Unimplemented");
                   },
                   [&](const DeltaQuery& delta) {
                     lines.push_back("| | implementation = DeltaQuery");
                     for (const auto& rule : delta.rules) {
                       std::string line = absl::StrCat("| |   delta ", block_ref(rule.source));
                       for (const auto& step : rule.steps) {
                         absl::StrAppend(&line, " ", block_ref(step.input), ".",
                                         KeyString(step.key));
                       }
                       lines.push_back(std::move(line));
                     }
                   },
               },
               join.implementation);
    if (options_.explain_demand && join.demand.has_value()) {
      lines.push_back(absl::StrCat("| | demand = ", KeyString(*join.demand)));
    }
    return lines;
  }

  const Plan& plan_;
  const PlannerOptions& options_;
  std::string out_;
  int64_t next_block_ = 0;
  int64_t next_let_ = 0;
  // Block and let number of each rendered let value, by the value's node id.
  absl::flat_hash_map<int64_t, std::pair<int64_t, int64_t>> let_blocks_;
};

}  // namespace

std::string ExplainResult(const Plan& plan, size_t index, const PlannerOptions& options) {
  CHECK_LT(index, plan.results().size());
  ResultExplainer explainer(plan, options);
  return explainer.Render(plan.results()[index].root);
}

std::string Explain(const Plan& plan, const PlannerOptions& options) {
  std::vector<std::string> results;
  for (size_t i = 0; i < plan.results().size(); ++i) {
    results.push_back(ExplainResult(plan, i, options));
  }
  return absl::StrJoin(results, "\n");
}

}  // namespace plan
}  // namespace compute
}  // namespace dp
