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

#include "src/compute/plan/arrangements.h"

#include <algorithm>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/strings/substitute.h>

#include "src/compute/plan/scalar_expression.h"

namespace dp {
namespace compute {
namespace plan {

std::string CollectionId::DebugString() const {
  switch (kind) {
    case Kind::kSource:
      return absl::StrCat("source ", id);
    case Kind::kView:
      return absl::StrCat("view ", id);
    case Kind::kNode:
      return absl::StrCat("node ", id);
  }
  return "";
}

size_t ArrangementRegistry::Request(const CollectionId& collection,
                                    const std::vector<int64_t>& key, int64_t consumer) {
  auto it = arrangements_.find(collection);
  if (it == arrangements_.end()) {
    collections_.push_back(collection);
    it = arrangements_.emplace(collection, std::vector<Arrangement>{}).first;
  }
  auto& entries = it->second;
  for (size_t i = 0; i < entries.size(); ++i) {
    if (entries[i].key != key) {
      continue;
    }
    auto& consumers = entries[i].consumers;
    if (std::find(consumers.begin(), consumers.end(), consumer) == consumers.end()) {
      consumers.push_back(consumer);
    }
    return i;
  }
  VLOG(1) << absl::Substitute("New arrangement ($0) on $1 for node $2", ColumnsToString(key),
                              collection.DebugString(), consumer);
  entries.push_back(Arrangement{key, {consumer}});
  return entries.size() - 1;
}

const std::vector<Arrangement>& ArrangementRegistry::ArrangementsOf(
    const CollectionId& collection) const {
  static const auto* empty = new std::vector<Arrangement>();
  auto it = arrangements_.find(collection);
  return it == arrangements_.end() ? *empty : it->second;
}

size_t ArrangementRegistry::NumArrangements() const {
  size_t n = 0;
  for (const auto& [collection, entries] : arrangements_) {
    n += entries.size();
  }
  return n;
}

std::string ArrangementRegistry::DebugString() const {
  std::vector<std::string> lines;
  for (const auto& collection : collections_) {
    for (const auto& entry : arrangements_.at(collection)) {
      lines.push_back(absl::Substitute("$0: ($1) <- [$2]", collection.DebugString(),
                                       ColumnsToString(entry.key),
                                       absl::StrJoin(entry.consumers, ", ")));
    }
  }
  return absl::StrJoin(lines, "\n");
}

}  // namespace plan
}  // namespace compute
}  // namespace dp
