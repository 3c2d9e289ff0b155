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
#include <string_view>
#include <vector>

#include "src/common/base/base.h"
#include "src/shared/types/typespb/types.pb.h"

namespace dp {
namespace types {

/**
 * Returns the name a type is written with in plans and in the text DSL (e.g. "int64").
 */
std::string_view DataTypeName(DataType type);

/**
 * Parses a type name as written by DataTypeName.
 */
StatusOr<DataType> ParseDataType(std::string_view name);

// True for int32, int64 and float64.
bool IsNumeric(DataType type);

// Renders a schema as "[int64, string]".
std::string SchemaToString(const std::vector<DataType>& types);

}  // namespace types
}  // namespace dp
