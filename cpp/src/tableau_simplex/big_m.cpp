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

#include <tableau_simplex/big_m.hpp>

#include <linear_programming/utilities/step_trace.hpp>
#include <tableau_simplex/simplex_iterations.hpp>
#include <tableau_simplex/standard_form.hpp>
#include <tableau_simplex/tableau.hpp>
#include <utilities/logger.hpp>
#include <utilities/string_utils.hpp>

#include <algorithm>
#include <cmath>

namespace lptrace::linear_programming::tableau_simplex {

namespace {

// Index of the first artificial column basic at a positive value, -1 if none
template <typename i_t, typename f_t>
i_t positive_artificial_row(const tableau_t<i_t, f_t>& tableau, f_t tol)
{
  for (i_t i = 0; i < tableau.num_rows(); ++i) {
    if (tableau.column_kinds[tableau.basis[i]] == column_kind_t::ARTIFICIAL &&
        tableau.rhs(i) > tol) {
      return i;
    }
  }
  return -1;
}

}  // namespace

template <typename i_t, typename f_t>
solution_t<i_t, f_t> solve_big_m_tableau(const optimization_problem_t<i_t, f_t>& problem,
                                         const solver_settings_t<i_t, f_t>& settings)
{
  const standard_form_t<i_t, f_t> form = to_standard_form(problem);

  f_t max_abs_objective = 0.0;
  for (f_t c_j : problem.get_objective()) {
    max_abs_objective = std::max(max_abs_objective, std::abs(c_j));
  }
  // Smallest nonzero coefficient over the rows that get an artificial column
  f_t min_abs_coefficient = 1.0;
  for (i_t i = 0; i < form.num_rows; ++i) {
    if (form.relation[i] == relation_t::LESS_EQUAL) { continue; }
    for (i_t j = 0; j < form.num_decision_cols; ++j) {
      const f_t a_ij = std::abs(form.coefficient(i, j));
      if (a_ij > 0.0) { min_abs_coefficient = std::min(min_abs_coefficient, a_ij); }
    }
  }
  const f_t big_m = settings.effective_big_m(max_abs_objective, min_abs_coefficient);

  LPTRACE_LOG_DEBUG("Big-M: %d constraints, %d variables, M %e",
                    problem.get_n_constraints(),
                    problem.get_n_variables(),
                    big_m);

  step_trace_t<i_t, f_t> trace(settings.get_record_tableaux());
  tableau_t<i_t, f_t> tableau = build_initial_tableau(form, big_m);

  std::string standard_form_text = describe_standard_form(problem, form, tableau);
  if (needs_artificials(form)) {
    standard_form_text += format_string(
      "\nArtificial variables are penalized with M = %s in the objective (-M per unit in the "
      "maximize form).",
      format_value(big_m).c_str());
  }
  trace.add_step("Standard Form", std::move(standard_form_text));

  std::string basis_text;
  for (i_t i = 0; i < tableau.num_rows(); ++i) {
    basis_text += (i == 0 ? "" : ", ") + tableau.row_label(i);
  }
  trace.add_step("Initial Tableau",
                 format_string("Slack and artificial variables (%s) form the initial basis. "
                               "Artificial columns carry +M in the Z-row.",
                               basis_text.c_str()),
                 maybe_snapshot(trace, tableau));

  // Basic artificial columns must be zero in the Z-row before pricing
  std::string eliminated;
  for (i_t i = 0; i < tableau.num_rows(); ++i) {
    const i_t col = tableau.basis[i];
    if (tableau.column_kinds[col] != column_kind_t::ARTIFICIAL) { continue; }
    const f_t factor = tableau.penalty(col);
    tableau.add_to_penalty_row(i, -factor);
    tableau.penalty(col) = 0.0;
    eliminated += format_string("%sZ-row - %s * row %s",
                                eliminated.empty() ? "" : ", ",
                                format_value(factor * big_m).c_str(),
                                tableau.column_labels[col].c_str());
  }
  if (!eliminated.empty()) {
    trace.add_step("Eliminate Artificial Variables from Z-row",
                   format_string("Each basic artificial variable must have a zero Z-row "
                                 "coefficient, so its row times M is subtracted from the Z-row: "
                                 "%s.",
                                 eliminated.c_str()),
                   maybe_snapshot(trace, tableau));
  }

  const auto pricing = pricing_tolerances(form, tableau, settings);
  iteration_info_t<i_t> info;
  const iteration_status_t status = simplex_iterations(tableau, settings, pricing, trace, info);

  solution_t<i_t, f_t> solution;
  if (status == iteration_status_t::OPTIMAL) {
    f_t max_rhs = 0.0;
    for (f_t b_i : form.rhs) {
      max_rhs = std::max(max_rhs, b_i);
    }
    const f_t artificial_tol = settings.get_feasibility_tolerance() * (1.0 + max_rhs);
    const i_t row            = positive_artificial_row(tableau, artificial_tol);
    if (row != -1) {
      const std::string& label = tableau.column_labels[tableau.basis[row]];
      solution.status          = solve_status_t::INFEASIBLE;
      solution.iterations      = info.iterations;
      solution.degenerate      = info.degenerate;
      solution.message         = format_string(
        "The problem is infeasible: artificial variable %s remains in the optimal basis with "
        "value %s.",
        label.c_str(),
        format_value(tableau.rhs(row)).c_str());
      trace.add_step("Infeasible",
                     format_string("The Z-row has no negative entry, but artificial variable %s "
                                   "is still basic at %s. No point satisfies every constraint.",
                                   label.c_str(),
                                   format_value(tableau.rhs(row)).c_str()),
                     maybe_snapshot(trace, tableau));
      LPTRACE_LOG_INFO("Big-M: infeasible after %d pivots", info.iterations);
    } else {
      set_optimal_solution(problem, form, tableau, settings, pricing, info, trace, solution);
      LPTRACE_LOG_INFO("Big-M: optimal objective %.6g after %d pivots",
                       solution.objective_value.value(),
                       info.iterations);
    }
  } else {
    set_terminal_solution(status, tableau, info, trace, solution);
    LPTRACE_LOG_INFO("Big-M: %s after %d pivots",
                     status_to_string(solution.status).c_str(),
                     info.iterations);
  }
  solution.steps = trace.release();
  return solution;
}

#if LPTRACE_INSTANTIATE_DOUBLE
template solution_t<int, double> solve_big_m_tableau(
  const optimization_problem_t<int, double>& problem,
  const solver_settings_t<int, double>& settings);
#endif

}  // namespace lptrace::linear_programming::tableau_simplex
