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

#include "src/compute/plan/func_registry.h"

namespace dp {
namespace compute {
namespace plan {

void RegisterMathOpsOrDie(FunctionRegistry* registry);
void RegisterComparisonOpsOrDie(FunctionRegistry* registry);
void RegisterLogicalOpsOrDie(FunctionRegistry* registry);
void RegisterStringOpsOrDie(FunctionRegistry* registry);
void RegisterAggregatesOrDie(FunctionRegistry* registry);

// Registers all of the above.
void RegisterBuiltinsOrDie(FunctionRegistry* registry);

}  // namespace plan
}  // namespace compute
}  // namespace dp
