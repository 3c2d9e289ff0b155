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
#include <utility>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "src/common/base/base.h"

namespace dp {
namespace compute {
namespace plan {

/**
 * A collection that can be arranged: a source, a named result, or a plan node. Gets resolve to
 * the collection they read so every reader of the same data shares its arrangements.
 */
struct CollectionId {
  enum class Kind { kSource, kView, kNode };
  Kind kind = Kind::kNode;
  int64_t id = 0;

  bool operator==(const CollectionId& other) const {
    return kind == other.kind && id == other.id;
  }

  template <typename H>
  friend H AbslHashValue(H h, const CollectionId& c) {
    return H::combine(std::move(h), c.kind, c.id);
  }

  std::string DebugString() const;
};

struct Arrangement {
  std::vector<int64_t> key;
  // Ids of the nodes that requested this key, in request order, without repeats.
  std::vector<int64_t> consumers;
};

/**
 * Tracks the key-sets requested on each collection. Requesting a key that already exists on a
 * collection joins the existing entry. Collections and keys keep first-request order.
 */
class ArrangementRegistry {
 public:
  // Returns the position of the key among the collection's arrangements.
  size_t Request(const CollectionId& collection, const std::vector<int64_t>& key,
                 int64_t consumer);

  // Empty if nothing was requested on the collection.
  const std::vector<Arrangement>& ArrangementsOf(const CollectionId& collection) const;

  const std::vector<CollectionId>& collections() const { return collections_; }

  size_t NumArrangements() const;

  std::string DebugString() const;

 private:
  std::vector<CollectionId> collections_;
  absl::flat_hash_map<CollectionId, std::vector<Arrangement>> arrangements_;
};

}  // namespace plan
}  // namespace compute
}  // namespace dp
