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

// Warn if a result is unused.
#ifdef __clang__
#define DP_MUST_USE_RESULT __attribute__((warn_unused_result))
#else
#define DP_MUST_USE_RESULT
#endif

#define DP_CONCAT_NAME_INNER(x, y) x##y
#define DP_CONCAT_NAME(x, y) DP_CONCAT_NAME_INNER(x, y)

// Wraps third-party includes that do not build cleanly under our warning flags.
// clang-format off
#if defined(__clang__)
#define DP_SUPPRESS_WARNINGS_START() \
  _Pragma("clang diagnostic push")   \
  _Pragma("clang diagnostic ignored \"-Weverything\"")
#define DP_SUPPRESS_WARNINGS_END() _Pragma("clang diagnostic pop")
#else
#define DP_SUPPRESS_WARNINGS_START() \
  _Pragma("GCC diagnostic push")     \
  _Pragma("GCC diagnostic ignored \"-Wunused-parameter\"")
#define DP_SUPPRESS_WARNINGS_END() _Pragma("GCC diagnostic pop")
#endif
// clang-format on
