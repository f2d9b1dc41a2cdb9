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

namespace lptrace::linear_programming::tableau_simplex {

/**
 * @brief Big-M method: artificial variables for >= and = rows, penalized by M in the objective.
 *
 * Accepts any mix of <=, >= and = rows. The problem is reported infeasible when an artificial
 * variable is still basic with a positive value at the optimal tableau.
 */
template <typename i_t, typename f_t>
solution_t<i_t, f_t> solve_big_m_tableau(const optimization_problem_t<i_t, f_t>& problem,
                                         const solver_settings_t<i_t, f_t>& settings);

}  // namespace lptrace::linear_programming::tableau_simplex
