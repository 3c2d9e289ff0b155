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

#include "src/shared/types/types.h"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <magic_enum.hpp>

namespace dp {
namespace types {

std::string_view DataTypeName(DataType type) {
  switch (type) {
    case DataType::BOOLEAN:
      return "bool";
    case DataType::INT32:
      return "int32";
    case DataType::INT64:
      return "int64";
    case DataType::FLOAT64:
      return "float64";
    case DataType::STRING:
      return "string";
    default:
      return "unknown";
  }
}

StatusOr<DataType> ParseDataType(std::string_view name) {
  for (auto type : magic_enum::enum_values<DataType>()) {
    if (type != DataType::DATA_TYPE_UNKNOWN && DataTypeName(type) == name) {
      return type;
    }
  }
  return error::InvalidArgument("unknown data type '$0'", name);
}

bool IsNumeric(DataType type) {
  return type == DataType::INT32 || type == DataType::INT64 || type == DataType::FLOAT64;
}

std::string SchemaToString(const std::vector<DataType>& types) {
  return absl::StrCat("[",
                      absl::StrJoin(types, ", ",
                                    [](std::string* out, DataType type) {
                                      absl::StrAppend(out, DataTypeName(type));
                                    }),
                      "]");
}

}  // namespace types
}  // namespace dp
