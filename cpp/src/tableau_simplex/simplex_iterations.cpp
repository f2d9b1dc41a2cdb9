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

#include <tableau_simplex/simplex_iterations.hpp>

#include <utilities/logger.hpp>
#include <utilities/string_utils.hpp>

#include <algorithm>
#include <cmath>

namespace lptrace::linear_programming::tableau_simplex {

namespace {

template <typename i_t, typename f_t>
std::string describe_ratio_test(const tableau_t<i_t, f_t>& tableau, i_t enter, f_t tol)
{
  std::string text;
  for (i_t i = 0; i < tableau.num_rows(); ++i) {
    const f_t a_ij = tableau(i, enter);
    if (a_ij <= tol) {
      text += format_string("  %s: entry %s, skipped\n",
                            tableau.row_label(i).c_str(),
                            format_value(a_ij).c_str());
      continue;
    }
    text += format_string("  %s: %s / %s = %s\n",
                          tableau.row_label(i).c_str(),
                          format_value(tableau.rhs(i)).c_str(),
                          format_value(a_ij).c_str(),
                          format_value(tableau.rhs(i) / a_ij).c_str());
  }
  return text;
}

}  // namespace

template <typename i_t, typename f_t>
std::optional<tableau_snapshot_t<i_t, f_t>> maybe_snapshot(const step_trace_t<i_t, f_t>& trace,
                                                           const tableau_t<i_t, f_t>& tableau)
{
  if (!trace.records_tableaux()) { return std::nullopt; }
  return tableau.snapshot();
}

template <typename i_t, typename f_t>
pricing_tolerances_t<f_t> pricing_tolerances(const standard_form_t<i_t, f_t>& form,
                                             const tableau_t<i_t, f_t>& tableau,
                                             const solver_settings_t<i_t, f_t>& settings)
{
  const f_t pivot_tol = settings.get_pivot_tolerance();

  f_t max_abs_cost = 1.0;
  for (f_t c_j : form.objective) {
    max_abs_cost = std::max(max_abs_cost, std::abs(c_j));
  }

  pricing_tolerances_t<f_t> tolerances;
  tolerances.cost = pivot_tol * max_abs_cost;
  if (tableau.has_penalty_row()) {
    f_t max_abs_penalty = 1.0;
    for (i_t j = 0; j < tableau.num_vars(); ++j) {
      max_abs_penalty = std::max(max_abs_penalty, std::abs(tableau.penalty(j)));
    }
    tolerances.penalty = pivot_tol * max_abs_penalty;
  }
  return tolerances;
}

template <typename i_t, typename f_t>
iteration_status_t simplex_iterations(tableau_t<i_t, f_t>& tableau,
                                      const solver_settings_t<i_t, f_t>& settings,
                                      const pricing_tolerances_t<f_t>& pricing,
                                      step_trace_t<i_t, f_t>& trace,
                                      iteration_info_t<i_t>& info)
{
  const f_t pivot_tol = settings.get_pivot_tolerance();
  const i_t iteration_limit =
    settings.effective_iteration_limit(tableau.num_rows(), tableau.num_vars());

  while (true) {
    const i_t enter = tableau.select_entering(pricing.cost, pricing.penalty);
    if (enter == -1) { return iteration_status_t::OPTIMAL; }

    const auto ratio = tableau.ratio_test(enter, pivot_tol);
    if (ratio.row == -1) {
      info.unbounded_col = enter;
      return iteration_status_t::UNBOUNDED;
    }
    if (info.iterations >= iteration_limit) {
      LPTRACE_LOG_WARN("Iteration limit %d reached", iteration_limit);
      return iteration_status_t::ITERATION_LIMIT;
    }

    const std::string entering_label = tableau.column_labels[enter];
    const std::string leaving_label  = tableau.row_label(ratio.row);
    const f_t pivot_element          = tableau(ratio.row, enter);
    const bool degenerate_pivot      = ratio.tie || std::abs(ratio.ratio) <= pivot_tol;
    info.degenerate                  = info.degenerate || degenerate_pivot;

    std::string explanation = format_string(
      "%s has the most negative coefficient in the Z-row (%s), so it enters the basis.\n"
      "Ratio test (RHS / positive entry of the %s column):\n",
      entering_label.c_str(),
      format_value(tableau.z_entry(enter)).c_str(),
      entering_label.c_str());
    explanation += describe_ratio_test(tableau, enter, pivot_tol);
    explanation += format_string(
      "The minimum ratio %s is in row %s, so %s leaves the basis. Pivot element: %s.",
      format_value(ratio.ratio).c_str(),
      leaving_label.c_str(),
      leaving_label.c_str(),
      format_value(pivot_element).c_str());
    if (ratio.tie) {
      explanation += "\nThe minimum ratio is tied; the lowest row is chosen and the next basic "
                     "solution is degenerate.";
    } else if (degenerate_pivot) {
      explanation +=
        "\nThe minimum ratio is zero: this is a degenerate pivot and Z does not change.";
    }

    tableau.pivot(ratio.row, enter);
    ++info.iterations;
    LPTRACE_LOG_DEBUG("Pivot %d: enter %s leave %s ratio %e Z %e",
                      info.iterations,
                      entering_label.c_str(),
                      leaving_label.c_str(),
                      ratio.ratio,
                      tableau.z_entry(tableau.num_vars()));

    trace.add_step(format_string("Pivot %d: enter %s, leave %s",
                                 info.iterations,
                                 entering_label.c_str(),
                                 leaving_label.c_str()),
                   std::move(explanation),
                   maybe_snapshot(trace, tableau));
  }
}

template <typename i_t, typename f_t>
void set_optimal_solution(const optimization_problem_t<i_t, f_t>& problem,
                          const standard_form_t<i_t, f_t>& form,
                          const tableau_t<i_t, f_t>& tableau,
                          const solver_settings_t<i_t, f_t>& settings,
                          const pricing_tolerances_t<f_t>& pricing,
                          const iteration_info_t<i_t>& info,
                          step_trace_t<i_t, f_t>& trace,
                          solution_t<i_t, f_t>& solution)
{
  const i_t n       = problem.get_n_variables();
  const f_t tol     = settings.get_feasibility_tolerance();
  const i_t z       = tableau.objective_row();
  const auto& names = problem.get_variable_names();

  std::vector<f_t> x(n, 0.0);
  for (i_t j = 0; j < n; ++j) {
    f_t value = form.split_free ? tableau.column_value(2 * j) - tableau.column_value(2 * j + 1)
                                : tableau.column_value(j);
    if (std::abs(value) <= tol) { value = 0.0; }
    x[j] = value;
  }

  solution.status = solve_status_t::OPTIMAL;
  solution.variables.clear();
  for (i_t j = 0; j < n; ++j) {
    solution.variables.emplace_back(names[j], x[j]);
  }
  solution.objective_value = problem.evaluate_objective(x);
  solution.iterations      = info.iterations;

  solution.constraint_slacks = problem.compute_slacks(x, tol);

  bool zero_basic = false;
  for (i_t i = 0; i < tableau.num_rows(); ++i) {
    if (std::abs(tableau.rhs(i)) <= tol) { zero_basic = true; }
  }
  solution.degenerate = info.degenerate || zero_basic;

  std::string alternative_col;
  for (i_t j = 0; j < tableau.num_vars(); ++j) {
    if (tableau.column_kinds[j] == column_kind_t::ARTIFICIAL) { continue; }
    if (tableau.basic_row(j) != -1) { continue; }
    // x- is the negated x+ column: zero reduced cost whenever its partner is basic
    if (tableau.twin[j] != -1 && tableau.basic_row(tableau.twin[j]) != -1) { continue; }
    if (tableau.has_penalty_row() && std::abs(tableau.penalty(j)) > pricing.penalty) {
      continue;
    }
    if (std::abs(tableau(z, j)) <= pricing.cost) {
      alternative_col = tableau.column_labels[j];
      break;
    }
  }
  solution.alternative_optima = !alternative_col.empty();

  std::string explanation =
    "No entry of the Z-row is negative, so the current basic feasible solution is optimal.\n";
  for (i_t j = 0; j < n; ++j) {
    explanation += format_string("%s = %s\n", names[j].c_str(), format_value(x[j]).c_str());
  }
  if (form.obj_scale < 0.0) {
    explanation += format_string("The Z-row holds -Z = %s; negating gives Z = %s.",
                                 format_value(tableau.rhs(z)).c_str(),
                                 format_value(solution.objective_value.value()).c_str());
  } else {
    explanation += format_string("Z = %s", format_value(solution.objective_value.value()).c_str());
  }
  if (solution.degenerate) {
    explanation += "\nThe solution is degenerate: a ratio test was tied or zero, or a basic "
                   "variable is zero.";
  }
  if (solution.alternative_optima) {
    explanation += format_string(
      "\nAlternative optima exist: non-basic variable %s has a zero Z-row coefficient.",
      alternative_col.c_str());
  }

  trace.add_step("Optimal Solution", std::move(explanation), maybe_snapshot(trace, tableau));
}

template <typename i_t, typename f_t>
void set_terminal_solution(iteration_status_t status,
                           const tableau_t<i_t, f_t>& tableau,
                           const iteration_info_t<i_t>& info,
                           step_trace_t<i_t, f_t>& trace,
                           solution_t<i_t, f_t>& solution)
{
  solution.variables.clear();
  solution.objective_value.reset();
  solution.iterations = info.iterations;
  solution.degenerate = info.degenerate;

  if (status == iteration_status_t::UNBOUNDED) {
    const std::string& label = tableau.column_labels[info.unbounded_col];
    solution.status          = solve_status_t::UNBOUNDED;
    solution.message         = format_string(
      "The problem is unbounded: %s can increase without limit because no entry of its column "
      "is positive.",
      label.c_str());
    trace.add_step("Unbounded",
                   format_string("%s would enter the basis (Z-row coefficient %s) but the ratio "
                                 "test has no candidate row. Increasing %s never makes a basic "
                                 "variable negative, so Z improves without bound.",
                                 label.c_str(),
                                 format_value(tableau.z_entry(info.unbounded_col)).c_str(),
                                 label.c_str()));
  } else {
    solution.status  = solve_status_t::ERROR;
    solution.message = format_string("iteration limit exceeded after %d pivots", info.iterations);
    trace.add_step("Iteration Limit",
                   "The pivot limit was reached before an optimal tableau was found; the inputs "
                   "are likely degenerate and cycling.");
  }
}

#if LPTRACE_INSTANTIATE_DOUBLE

template std::optional<tableau_snapshot_t<int, double>> maybe_snapshot(
  const step_trace_t<int, double>& trace, const tableau_t<int, double>& tableau);

template pricing_tolerances_t<double> pricing_tolerances(
  const standard_form_t<int, double>& form,
  const tableau_t<int, double>& tableau,
  const solver_settings_t<int, double>& settings);

template iteration_status_t simplex_iterations(tableau_t<int, double>& tableau,
                                               const solver_settings_t<int, double>& settings,
                                               const pricing_tolerances_t<double>& pricing,
                                               step_trace_t<int, double>& trace,
                                               iteration_info_t<int>& info);

template void set_optimal_solution(const optimization_problem_t<int, double>& problem,
                                   const standard_form_t<int, double>& form,
                                   const tableau_t<int, double>& tableau,
                                   const solver_settings_t<int, double>& settings,
                                   const pricing_tolerances_t<double>& pricing,
                                   const iteration_info_t<int>& info,
                                   step_trace_t<int, double>& trace,
                                   solution_t<int, double>& solution);

template void set_terminal_solution(iteration_status_t status,
                                    const tableau_t<int, double>& tableau,
                                    const iteration_info_t<int>& info,
                                    step_trace_t<int, double>& trace,
                                    solution_t<int, double>& solution);

#endif

}  // namespace lptrace::linear_programming::tableau_simplex
