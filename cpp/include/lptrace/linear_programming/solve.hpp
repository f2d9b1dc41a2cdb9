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

#include <lptrace/linear_programming/constants.h>
#include <lptrace/linear_programming/optimization_problem.hpp>
#include <lptrace/linear_programming/solver_settings.hpp>
#include <lptrace/linear_programming/solver_solution.hpp>

#include <cstdint>
#include <string>

namespace lptrace::linear_programming {

enum class method_t : int8_t {
  SIMPLEX   = LPTRACE_METHOD_SIMPLEX,
  BIG_M     = LPTRACE_METHOD_BIG_M,
  GRAPHICAL = LPTRACE_METHOD_GRAPHICAL,
};

/** @return "Simplex", "Big-M" or "Graphical" */
std::string method_to_string(method_t method);

/**
 * @brief Solves an LP with only <= rows after sign normalization by the tableau simplex method.
 *
 * The returned solution owns the full trace: standard form, initial tableau, one step per pivot
 * and the terminal step. Unbounded problems and the iteration limit are reported through the
 * solution status.
 *
 * @param[in] problem A validated problem
 * @param[in] settings Tolerances and limits
 * @throw lptrace::logic_error (ValidationError) if a >= or = row remains after rows with a
 * negative right-hand side are multiplied by -1. Such problems need the Big-M method.
 * @return solution_t
 */
template <typename i_t, typename f_t>
solution_t<i_t, f_t> solve_simplex(const optimization_problem_t<i_t, f_t>& problem,
                                   const solver_settings_t<i_t, f_t>& settings);

/**
 * @brief Solves an LP with any mix of <=, >= and = rows by the Big-M method.
 *
 * @param[in] problem A validated problem
 * @param[in] settings Tolerances, limits and the M heuristic
 * @return solution_t, INFEASIBLE when an artificial variable stays positive at optimality
 */
template <typename i_t, typename f_t>
solution_t<i_t, f_t> solve_big_m(const optimization_problem_t<i_t, f_t>& problem,
                                 const solver_settings_t<i_t, f_t>& settings);

/**
 * @brief Solves a two variable LP by enumerating the corner points of the feasible region.
 *
 * Steps carry geometry_t plotting data instead of tableaux.
 *
 * @throw lptrace::logic_error (ValidationError) if the problem does not have exactly 2 variables
 */
template <typename i_t, typename f_t>
solution_t<i_t, f_t> solve_graphical(const optimization_problem_t<i_t, f_t>& problem,
                                     const solver_settings_t<i_t, f_t>& settings);

/**
 * @brief Runs the engine selected by method after checking its preconditions.
 */
template <typename i_t, typename f_t>
solution_t<i_t, f_t> solve(const optimization_problem_t<i_t, f_t>& problem,
                           method_t method,
                           const solver_settings_t<i_t, f_t>& settings);

/** @return true if a >= or = row survives right-hand side sign normalization */
template <typename i_t, typename f_t>
bool requires_big_m(const optimization_problem_t<i_t, f_t>& problem);

/**
 * @brief BIG_M when requires_big_m, otherwise GRAPHICAL for two variables and SIMPLEX beyond.
 */
template <typename i_t, typename f_t>
method_t recommend_method(const optimization_problem_t<i_t, f_t>& problem);

}  // namespace lptrace::linear_programming
