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

#include <linear_programming/utilities/step_trace.hpp>
#include <tableau_simplex/standard_form.hpp>
#include <tableau_simplex/tableau.hpp>

#include <optional>

namespace lptrace::linear_programming::tableau_simplex {

enum class iteration_status_t {
  OPTIMAL         = 0,
  UNBOUNDED       = 1,
  ITERATION_LIMIT = 2,
};

template <typename i_t>
struct iteration_info_t {
  i_t iterations{0};
  // Entering column without a positive entry when the status is UNBOUNDED
  i_t unbounded_col{-1};
  // A ratio test had a tie or a zero minimum ratio
  bool degenerate{false};
};

/** @return a snapshot of tableau when the trace records tableaux, nullopt otherwise */
template <typename i_t, typename f_t>
std::optional<tableau_snapshot_t<i_t, f_t>> maybe_snapshot(const step_trace_t<i_t, f_t>& trace,
                                                           const tableau_t<i_t, f_t>& tableau);

template <typename f_t>
struct pricing_tolerances_t {
  // Constant part of the Z-row
  f_t cost{0.0};
  // M coefficients, zero without a penalty row
  f_t penalty{0.0};
};

/**
 * @brief Reduced cost tolerances.
 *
 * The constant part uses PivotTolerance scaled by the largest objective coefficient, so M never
 * widens it. The M part uses PivotTolerance scaled by the largest penalty row entry of tableau,
 * which must already have its basic artificial columns eliminated.
 */
template <typename i_t, typename f_t>
pricing_tolerances_t<f_t> pricing_tolerances(const standard_form_t<i_t, f_t>& form,
                                             const tableau_t<i_t, f_t>& tableau,
                                             const solver_settings_t<i_t, f_t>& settings);

/**
 * @brief Primal simplex on a feasible tableau.
 *
 * Pivots until no column prices out below the pricing tolerances, the entering column has no
 * positive entry, or the iteration limit is hit. One step per pivot is appended to trace.
 */
template <typename i_t, typename f_t>
iteration_status_t simplex_iterations(tableau_t<i_t, f_t>& tableau,
                                      const solver_settings_t<i_t, f_t>& settings,
                                      const pricing_tolerances_t<f_t>& pricing,
                                      step_trace_t<i_t, f_t>& trace,
                                      iteration_info_t<i_t>& info);

/**
 * @brief Reads the decision variables off an optimal tableau and fills the solution, including
 * slacks, degeneracy, alternative optima and the closing step.
 */
template <typename i_t, typename f_t>
void set_optimal_solution(const optimization_problem_t<i_t, f_t>& problem,
                          const standard_form_t<i_t, f_t>& form,
                          const tableau_t<i_t, f_t>& tableau,
                          const solver_settings_t<i_t, f_t>& settings,
                          const pricing_tolerances_t<f_t>& pricing,
                          const iteration_info_t<i_t>& info,
                          step_trace_t<i_t, f_t>& trace,
                          solution_t<i_t, f_t>& solution);

/**
 * @brief Fills a non-optimal solution after an unbounded column or the iteration limit.
 */
template <typename i_t, typename f_t>
void set_terminal_solution(iteration_status_t status,
                           const tableau_t<i_t, f_t>& tableau,
                           const iteration_info_t<i_t>& info,
                           step_trace_t<i_t, f_t>& trace,
                           solution_t<i_t, f_t>& solution);

}  // namespace lptrace::linear_programming::tableau_simplex
