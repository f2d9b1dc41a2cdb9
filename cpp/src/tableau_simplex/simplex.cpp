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

#include <tableau_simplex/simplex.hpp>

#include <lptrace/error.hpp>

#include <linear_programming/utilities/step_trace.hpp>
#include <tableau_simplex/simplex_iterations.hpp>
#include <tableau_simplex/standard_form.hpp>
#include <tableau_simplex/tableau.hpp>
#include <utilities/logger.hpp>
#include <utilities/string_utils.hpp>

namespace lptrace::linear_programming::tableau_simplex {

template <typename i_t, typename f_t>
solution_t<i_t, f_t> solve_simplex_tableau(const optimization_problem_t<i_t, f_t>& problem,
                                           const solver_settings_t<i_t, f_t>& settings)
{
  const standard_form_t<i_t, f_t> form = to_standard_form(problem);
  for (i_t i = 0; i < form.num_rows; ++i) {
    lptrace_expects(form.relation[i] == relation_t::LESS_EQUAL,
                    error_type_t::ValidationError,
                    "Constraint %d is a %s constraint after sign normalization; the Simplex "
                    "method needs a slack basis, use the Big-M method instead",
                    i + 1,
                    relation_to_string(form.relation[i]).c_str());
  }

  LPTRACE_LOG_DEBUG("Simplex: %d constraints, %d variables",
                    problem.get_n_constraints(),
                    problem.get_n_variables());

  step_trace_t<i_t, f_t> trace(settings.get_record_tableaux());
  tableau_t<i_t, f_t> tableau = build_initial_tableau(form, f_t(0.0));

  trace.add_step("Standard Form", describe_standard_form(problem, form, tableau));

  std::string basis_text;
  for (i_t i = 0; i < tableau.num_rows(); ++i) {
    basis_text += (i == 0 ? "" : ", ") + tableau.row_label(i);
  }
  trace.add_step("Initial Tableau",
                 format_string("The slack variables (%s) form the initial basis with the "
                               "decision variables at zero. The Z-row holds the negated "
                               "objective coefficients.",
                               basis_text.c_str()),
                 maybe_snapshot(trace, tableau));

  const auto pricing = pricing_tolerances(form, tableau, settings);
  iteration_info_t<i_t> info;
  const iteration_status_t status = simplex_iterations(tableau, settings, pricing, trace, info);

  solution_t<i_t, f_t> solution;
  if (status == iteration_status_t::OPTIMAL) {
    set_optimal_solution(problem, form, tableau, settings, pricing, info, trace, solution);
    LPTRACE_LOG_INFO("Simplex: optimal objective %.6g after %d pivots",
                     solution.objective_value.value(),
                     info.iterations);
  } else {
    set_terminal_solution(status, tableau, info, trace, solution);
    LPTRACE_LOG_INFO("Simplex: %s after %d pivots",
                     status_to_string(solution.status).c_str(),
                     info.iterations);
  }
  solution.steps = trace.release();
  return solution;
}

#if LPTRACE_INSTANTIATE_DOUBLE
template solution_t<int, double> solve_simplex_tableau(
  const optimization_problem_t<int, double>& problem,
  const solver_settings_t<int, double>& settings);
#endif

}  // namespace lptrace::linear_programming::tableau_simplex
