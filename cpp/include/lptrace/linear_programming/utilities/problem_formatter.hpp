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

#include <lptrace/linear_programming/optimization_problem.hpp>

#include <string>
#include <vector>

namespace lptrace::linear_programming {

/**
 * @brief Renders sum_j coefficients[j] * names[j], e.g. "3x1 - x2 + 0.5x3".
 * Zero terms are left out; an all-zero expression renders as "0".
 */
template <typename f_t>
std::string format_expression(const std::vector<f_t>& coefficients,
                              const std::vector<std::string>& names);

/** @return e.g. "2x1 + x2 <= 100" */
template <typename f_t>
std::string format_constraint(const constraint_t<f_t>& constraint,
                              const std::vector<std::string>& names);

/**
 * @brief Human readable formulation:
 *
 *   Maximize Z = 3x1 + 2x2
 *   Subject to:
 *     2x1 + x2 <= 100
 *     x1 + 2x2 <= 80
 *     x1, x2 >= 0
 */
template <typename i_t, typename f_t>
std::string format_problem(const optimization_problem_t<i_t, f_t>& problem);

}  // namespace lptrace::linear_programming
