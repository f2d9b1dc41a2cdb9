/*
 * SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <stdarg.h>

#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

namespace lptrace {

/**
 * @brief printf-style formatting into a std::string of any length
 */
inline std::string format_string(const char* fmt, ...)
{
  va_list args;
  va_start(args, fmt);
  va_list args_copy;
  va_copy(args_copy, args);
  const int size = vsnprintf(nullptr, 0, fmt, args_copy);
  va_end(args_copy);
  if (size <= 0) {
    va_end(args);
    return std::string();
  }
  std::vector<char> buffer(size + 1);
  vsnprintf(buffer.data(), buffer.size(), fmt, args);
  va_end(args);
  return std::string(buffer.data(), size);
}

/**
 * @brief Shortest readable rendering of a value for trace text, e.g. 160, 3.2, -0.5.
 * Values within 1e-12 of zero print as 0 so that rounding noise never shows up as -0.
 */
template <typename f_t>
std::string format_value(f_t value)
{
  if (std::abs(value) < 1e-12) { return "0"; }
  return format_string("%.6g", static_cast<double>(value));
}

}  // namespace lptrace
