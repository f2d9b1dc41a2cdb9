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
#include <lptrace/linear_programming/solver_settings.hpp>
#include <lptrace/linear_programming/solver_solution.hpp>

namespace lptrace::linear_programming::graphical {

/**
 * @brief Corner point method for problems with exactly two decision variables.
 *
 * Intersects every pair of boundary lines, keeps the feasible intersections as vertices and
 * evaluates the objective at each of them.
 *
 * @throw lptrace::logic_error (ValidationError) if the problem does not have two variables.
 */
template <typename i_t, typename f_t>
solution_t<i_t, f_t> solve_corner_points(const optimization_problem_t<i_t, f_t>& problem,
                                         const solver_settings_t<i_t, f_t>& settings);

}  // namespace lptrace::linear_programming::graphical
