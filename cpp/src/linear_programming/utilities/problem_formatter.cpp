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

#include <lptrace/linear_programming/utilities/problem_formatter.hpp>

#include <utilities/string_utils.hpp>

#include <cmath>

namespace lptrace::linear_programming {

template <typename f_t>
std::string format_expression(const std::vector<f_t>& coefficients,
                              const std::vector<std::string>& names)
{
  std::string text;
  for (std::size_t j = 0; j < coefficients.size(); ++j) {
    const f_t a_j = coefficients[j];
    if (a_j == 0.0) { continue; }
    if (text.empty()) {
      if (a_j < 0.0) { text += "-"; }
    } else {
      text += a_j < 0.0 ? " - " : " + ";
    }
    const f_t magnitude = std::abs(a_j);
    if (magnitude != 1.0) { text += format_value(magnitude); }
    text += names[j];
  }
  return text.empty() ? std::string("0") : text;
}

template <typename f_t>
std::string format_constraint(const constraint_t<f_t>& constraint,
                              const std::vector<std::string>& names)
{
  return format_expression(constraint.coefficients, names) + " " +
         relation_to_string(constraint.relation) + " " + format_value(constraint.rhs);
}

template <typename i_t, typename f_t>
std::string format_problem(const optimization_problem_t<i_t, f_t>& problem)
{
  const auto names = problem.get_variable_names();

  std::string text = problem.is_maximize() ? "Maximize" : "Minimize";
  text += " Z = " + format_expression(problem.get_objective(), names) + "\n";
  text += "Subject to:\n";
  for (const auto& constraint : problem.get_constraints()) {
    text += "  " + format_constraint(constraint, names) + "\n";
  }

  std::string all_names;
  for (const auto& name : names) {
    all_names += (all_names.empty() ? "" : ", ") + name;
  }
  text += "  " + all_names + (problem.is_non_negative() ? " >= 0" : " unrestricted in sign");
  return text;
}

#if LPTRACE_INSTANTIATE_DOUBLE

template std::string format_expression(const std::vector<double>& coefficients,
                                       const std::vector<std::string>& names);

template std::string format_constraint(const constraint_t<double>& constraint,
                                       const std::vector<std::string>& names);

template std::string format_problem(const optimization_problem_t<int, double>& problem);

#endif

}  // namespace lptrace::linear_programming
