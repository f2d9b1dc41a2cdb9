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

#include <lptrace/error.hpp>
#include <lptrace/linear_programming/solve.hpp>

#include <graphical/corner_point.hpp>
#include <tableau_simplex/big_m.hpp>
#include <tableau_simplex/simplex.hpp>
#include <utilities/logger.hpp>

namespace lptrace::linear_programming {

std::string method_to_string(method_t method)
{
  switch (method) {
    case method_t::SIMPLEX: return "Simplex";
    case method_t::BIG_M: return "Big-M";
    case method_t::GRAPHICAL: return "Graphical";
  }
  return "Unknown";
}

template <typename i_t, typename f_t>
solution_t<i_t, f_t> solve_simplex(const optimization_problem_t<i_t, f_t>& problem,
                                   const solver_settings_t<i_t, f_t>& settings)
{
  return tableau_simplex::solve_simplex_tableau(problem, settings);
}

template <typename i_t, typename f_t>
solution_t<i_t, f_t> solve_big_m(const optimization_problem_t<i_t, f_t>& problem,
                                 const solver_settings_t<i_t, f_t>& settings)
{
  return tableau_simplex::solve_big_m_tableau(problem, settings);
}

template <typename i_t, typename f_t>
solution_t<i_t, f_t> solve_graphical(const optimization_problem_t<i_t, f_t>& problem,
                                     const solver_settings_t<i_t, f_t>& settings)
{
  return graphical::solve_corner_points(problem, settings);
}

template <typename i_t, typename f_t>
solution_t<i_t, f_t> solve(const optimization_problem_t<i_t, f_t>& problem,
                           method_t method,
                           const solver_settings_t<i_t, f_t>& settings)
{
  LPTRACE_LOG_INFO("Solving a problem with %d constraints and %d variables using the %s method",
                   problem.get_n_constraints(),
                   problem.get_n_variables(),
                   method_to_string(method).c_str());
  switch (method) {
    case method_t::SIMPLEX:
      lptrace_expects(!requires_big_m(problem),
                      error_type_t::ValidationError,
                      "The Simplex method needs <= constraints with non-negative right-hand "
                      "sides; use the Big-M method for >= and = constraints");
      return solve_simplex(problem, settings);
    case method_t::BIG_M: return solve_big_m(problem, settings);
    case method_t::GRAPHICAL:
      lptrace_expects(problem.get_n_variables() == 2,
                      error_type_t::ValidationError,
                      "The graphical method needs exactly 2 variables, the problem has %d",
                      problem.get_n_variables());
      return solve_graphical(problem, settings);
  }
  LPTRACE_FAIL("Unknown solution method %d", static_cast<int>(method));
}

template <typename i_t, typename f_t>
bool requires_big_m(const optimization_problem_t<i_t, f_t>& problem)
{
  for (const auto& row : problem.get_constraints()) {
    const relation_t relation = row.rhs < 0.0 ? flip_relation(row.relation) : row.relation;
    if (relation != relation_t::LESS_EQUAL) { return true; }
  }
  return false;
}

template <typename i_t, typename f_t>
method_t recommend_method(const optimization_problem_t<i_t, f_t>& problem)
{
  if (requires_big_m(problem)) { return method_t::BIG_M; }
  if (problem.get_n_variables() == 2) { return method_t::GRAPHICAL; }
  return method_t::SIMPLEX;
}

#if LPTRACE_INSTANTIATE_DOUBLE

template solution_t<int, double> solve_simplex(const optimization_problem_t<int, double>& problem,
                                               const solver_settings_t<int, double>& settings);

template solution_t<int, double> solve_big_m(const optimization_problem_t<int, double>& problem,
                                             const solver_settings_t<int, double>& settings);

template solution_t<int, double> solve_graphical(
  const optimization_problem_t<int, double>& problem,
  const solver_settings_t<int, double>& settings);

template solution_t<int, double> solve(const optimization_problem_t<int, double>& problem,
                                       method_t method,
                                       const solver_settings_t<int, double>& settings);

template bool requires_big_m(const optimization_problem_t<int, double>& problem);

template method_t recommend_method(const optimization_problem_t<int, double>& problem);

#endif

}  // namespace lptrace::linear_programming
