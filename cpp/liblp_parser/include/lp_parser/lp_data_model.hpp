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

#include <string>
#include <vector>

namespace lptrace::lp_parser {

/**
 * @brief A linear program as read from text, before validation.
 *
 * The model holds exactly what the input contained: rows may have a different number of
 * coefficients than the objective and the objective may be missing. `validate_problem_input`
 * checks the model and `to_optimization_problem` turns it into a solver problem.
 *
 * @tparam i_t Integer type for indices
 * @tparam f_t Floating point type for coefficients
 */
template <typename i_t, typename f_t>
class lp_data_model_t {
 public:
  lp_data_model_t() = default;

  /**
   * @brief Set the name of the problem.
   *
   * @param[in] name Problem name; empty when the input has no name line.
   */
  void set_problem_name(const std::string& name);
  /**
   * @brief Set the optimization direction.
   *
   * @param[in] maximize true to maximize the objective, false to minimize it.
   */
  void set_maximize(bool maximize);
  /**
   * @brief Set the objective function coefficients c_j, one per decision variable.
   *
   * @param[in] objective_coefficients Objective coefficients in variable order.
   */
  void set_objective_coefficients(std::vector<f_t> objective_coefficients);
  /**
   * @brief Append the constraint row coefficients (relation) rhs.
   */
  void add_constraint(std::vector<f_t> coefficients,
                      linear_programming::relation_t relation,
                      f_t rhs);
  /**
   * @brief Set whether every decision variable is restricted to x_j >= 0.
   */
  void set_non_negative(bool non_negative);

  const std::string& get_problem_name() const;
  bool get_maximize() const;
  const std::vector<f_t>& get_objective_coefficients() const;
  const std::vector<std::vector<f_t>>& get_constraint_coefficients() const;
  const std::vector<linear_programming::relation_t>& get_relations() const;
  const std::vector<f_t>& get_constraint_bounds() const;
  bool get_non_negative() const;

  i_t get_n_constraints() const;

 private:
  std::string problem_name_;
  bool maximize_{true};
  std::vector<f_t> objective_coefficients_;
  std::vector<std::vector<f_t>> constraint_coefficients_;
  std::vector<linear_programming::relation_t> relations_;
  std::vector<f_t> constraint_bounds_;
  bool non_negative_{true};
};

}  // namespace lptrace::lp_parser
