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

#include <lp_parser/parser.hpp>

#include <lp_parser.hpp>

#include <lptrace/error.hpp>

#include <fstream>
#include <sstream>

namespace lptrace::lp_parser {

template <typename f_t>
std::vector<f_t> parse_coefficients(const std::string& text)
{
  std::vector<f_t> values;
  std::string bad_entry;
  lptrace_expects(read_coefficients(text, values, bad_entry),
                  error_type_t::ValidationError,
                  "Invalid number format: '%s'",
                  bad_entry.c_str());
  return values;
}

linear_programming::relation_t parse_relation(const std::string& text)
{
  linear_programming::relation_t relation;
  lptrace_expects(read_relation(text, relation),
                  error_type_t::ValidationError,
                  "Unknown relation '%s', use <=, >= or =",
                  text.c_str());
  return relation;
}

template <typename i_t, typename f_t>
lp_data_model_t<i_t, f_t> parse_lp_string(const std::string& text)
{
  lp_data_model_t<i_t, f_t> problem;
  lp_parser_t<i_t, f_t> parser(problem, text);
  return problem;
}

template <typename i_t, typename f_t>
lp_data_model_t<i_t, f_t> parse_lp(const std::string& lp_file_path)
{
  std::ifstream file(lp_file_path);
  lptrace_expects(file.is_open(),
                  error_type_t::RuntimeError,
                  "Error opening problem file %s",
                  lp_file_path.c_str());
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse_lp_string<i_t, f_t>(buffer.str());
}

template <typename i_t, typename f_t>
i_t validate_problem_input(const lp_data_model_t<i_t, f_t>& model)
{
  const auto& objective = model.get_objective_coefficients();
  lptrace_expects(!objective.empty(), error_type_t::ValidationError, "Empty objective function");
  lptrace_expects(model.get_n_constraints() > 0,
                  error_type_t::ValidationError,
                  "At least one constraint is required");

  const i_t n_variables = static_cast<i_t>(objective.size());
  const auto& rows      = model.get_constraint_coefficients();
  for (i_t i = 0; i < model.get_n_constraints(); ++i) {
    const i_t n_row = static_cast<i_t>(rows[i].size());
    lptrace_expects(
      n_row > 0, error_type_t::ValidationError, "Empty coefficients in constraint %d", i + 1);
    lptrace_expects(n_row == n_variables,
                    error_type_t::ValidationError,
                    "Constraint %d has %d variables, expected %d",
                    i + 1,
                    n_row,
                    n_variables);
  }
  return n_variables;
}

template <typename i_t, typename f_t>
linear_programming::optimization_problem_t<i_t, f_t> to_optimization_problem(
  const lp_data_model_t<i_t, f_t>& model)
{
  validate_problem_input(model);

  std::vector<linear_programming::constraint_t<f_t>> constraints;
  for (i_t i = 0; i < model.get_n_constraints(); ++i) {
    constraints.push_back({model.get_constraint_coefficients()[i],
                           model.get_relations()[i],
                           model.get_constraint_bounds()[i]});
  }
  const auto sense = model.get_maximize() ? linear_programming::objective_sense_t::MAXIMIZE
                                          : linear_programming::objective_sense_t::MINIMIZE;
  return linear_programming::normalize<i_t, f_t>(
    sense, model.get_objective_coefficients(), constraints, model.get_non_negative());
}

template std::vector<double> parse_coefficients(const std::string& text);

template lp_data_model_t<int, double> parse_lp_string(const std::string& text);

template lp_data_model_t<int, double> parse_lp(const std::string& lp_file_path);

template int validate_problem_input(const lp_data_model_t<int, double>& model);

template linear_programming::optimization_problem_t<int, double> to_optimization_problem(
  const lp_data_model_t<int, double>& model);

}  // namespace lptrace::lp_parser
