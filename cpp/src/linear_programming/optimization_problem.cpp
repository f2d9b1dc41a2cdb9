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
#include <lptrace/linear_programming/optimization_problem.hpp>

#include <cmath>
#include <utility>

namespace lptrace::linear_programming {

std::string relation_to_string(relation_t relation)
{
  switch (relation) {
    case relation_t::LESS_EQUAL: return "<=";
    case relation_t::GREATER_EQUAL: return ">=";
    case relation_t::EQUAL: return "=";
  }
  return "?";
}

relation_t flip_relation(relation_t relation)
{
  switch (relation) {
    case relation_t::LESS_EQUAL: return relation_t::GREATER_EQUAL;
    case relation_t::GREATER_EQUAL: return relation_t::LESS_EQUAL;
    case relation_t::EQUAL: return relation_t::EQUAL;
  }
  return relation;
}

template <typename i_t, typename f_t>
optimization_problem_t<i_t, f_t>::optimization_problem_t(objective_sense_t sense,
                                                         std::vector<f_t> objective,
                                                         std::vector<constraint_t<f_t>> constraints,
                                                         bool non_negative)
  : sense_(sense),
    objective_(std::move(objective)),
    constraints_(std::move(constraints)),
    non_negative_(non_negative)
{
  lptrace_expects(!objective_.empty(), error_type_t::ValidationError, "Empty objective function");
  lptrace_expects(
    !constraints_.empty(), error_type_t::ValidationError, "At least one constraint is required");

  const i_t n = get_n_variables();
  for (i_t j = 0; j < n; ++j) {
    lptrace_expects(std::isfinite(objective_[j]),
                    error_type_t::ValidationError,
                    "Objective coefficient %d is not a finite number",
                    j + 1);
  }

  for (i_t i = 0; i < get_n_constraints(); ++i) {
    const auto& row = constraints_[i];
    lptrace_expects(static_cast<i_t>(row.coefficients.size()) == n,
                    error_type_t::ValidationError,
                    "Constraint %d has %d variables, expected %d",
                    i + 1,
                    static_cast<int>(row.coefficients.size()),
                    n);
    for (i_t j = 0; j < n; ++j) {
      lptrace_expects(std::isfinite(row.coefficients[j]),
                      error_type_t::ValidationError,
                      "Coefficient %d of constraint %d is not a finite number",
                      j + 1,
                      i + 1);
    }
    lptrace_expects(std::isfinite(row.rhs),
                    error_type_t::ValidationError,
                    "Right-hand side of constraint %d is not a finite number",
                    i + 1);
    lptrace_expects(row.relation == relation_t::LESS_EQUAL ||
                      row.relation == relation_t::GREATER_EQUAL ||
                      row.relation == relation_t::EQUAL,
                    error_type_t::ValidationError,
                    "Constraint %d has an unknown relation",
                    i + 1);
  }
}

template <typename i_t, typename f_t>
std::string optimization_problem_t<i_t, f_t>::get_variable_name(i_t j) const
{
  return "x" + std::to_string(j + 1);
}

template <typename i_t, typename f_t>
std::vector<std::string> optimization_problem_t<i_t, f_t>::get_variable_names() const
{
  std::vector<std::string> names;
  names.reserve(objective_.size());
  for (i_t j = 0; j < get_n_variables(); ++j) {
    names.push_back(get_variable_name(j));
  }
  return names;
}

template <typename i_t, typename f_t>
f_t optimization_problem_t<i_t, f_t>::evaluate_objective(const std::vector<f_t>& x) const
{
  f_t obj = 0.0;
  for (i_t j = 0; j < get_n_variables(); ++j) {
    obj += objective_[j] * x[j];
  }
  return obj;
}

template <typename i_t, typename f_t>
f_t optimization_problem_t<i_t, f_t>::evaluate_row(i_t i, const std::vector<f_t>& x) const
{
  const auto& coefficients = constraints_[i].coefficients;
  f_t lhs                  = 0.0;
  for (i_t j = 0; j < get_n_variables(); ++j) {
    lhs += coefficients[j] * x[j];
  }
  return lhs;
}

template <typename i_t, typename f_t>
std::vector<f_t> optimization_problem_t<i_t, f_t>::compute_slacks(const std::vector<f_t>& x,
                                                                  f_t tol) const
{
  std::vector<f_t> slacks(constraints_.size(), 0.0);
  for (i_t i = 0; i < get_n_constraints(); ++i) {
    const f_t lhs = evaluate_row(i, x);
    const f_t rhs = constraints_[i].rhs;
    f_t slack     = 0.0;
    switch (constraints_[i].relation) {
      case relation_t::LESS_EQUAL: slack = rhs - lhs; break;
      case relation_t::GREATER_EQUAL: slack = lhs - rhs; break;
      case relation_t::EQUAL: slack = std::abs(lhs - rhs); break;
    }
    if (std::abs(slack) <= tol * (1.0 + std::abs(rhs))) { slack = 0.0; }
    slacks[i] = slack;
  }
  return slacks;
}

template <typename i_t, typename f_t>
bool optimization_problem_t<i_t, f_t>::is_feasible(const std::vector<f_t>& x, f_t tol) const
{
  if (non_negative_) {
    for (i_t j = 0; j < get_n_variables(); ++j) {
      if (x[j] < -tol) { return false; }
    }
  }
  for (i_t i = 0; i < get_n_constraints(); ++i) {
    const f_t lhs     = evaluate_row(i, x);
    const f_t rhs     = constraints_[i].rhs;
    const f_t row_tol = tol * (1.0 + std::abs(rhs));
    switch (constraints_[i].relation) {
      case relation_t::LESS_EQUAL:
        if (lhs > rhs + row_tol) { return false; }
        break;
      case relation_t::GREATER_EQUAL:
        if (lhs < rhs - row_tol) { return false; }
        break;
      case relation_t::EQUAL:
        if (std::abs(lhs - rhs) > row_tol) { return false; }
        break;
    }
  }
  return true;
}

template <typename i_t, typename f_t>
optimization_problem_t<i_t, f_t> normalize(objective_sense_t sense,
                                           const std::vector<f_t>& objective,
                                           const std::vector<constraint_t<f_t>>& constraints,
                                           bool non_negative)
{
  return optimization_problem_t<i_t, f_t>(sense, objective, constraints, non_negative);
}

#if LPTRACE_INSTANTIATE_DOUBLE

template class optimization_problem_t<int, double>;

template optimization_problem_t<int, double> normalize<int, double>(
  objective_sense_t sense,
  const std::vector<double>& objective,
  const std::vector<constraint_t<double>>& constraints,
  bool non_negative);

#endif

}  // namespace lptrace::linear_programming
