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

#include <cstdint>
#include <string>
#include <vector>

namespace lptrace::linear_programming {

enum class objective_sense_t : int8_t {
  MAXIMIZE = LPTRACE_MAXIMIZE,
  MINIMIZE = LPTRACE_MINIMIZE,
};

enum class relation_t : char {
  LESS_EQUAL    = LPTRACE_LESS_EQUAL,
  GREATER_EQUAL = LPTRACE_GREATER_EQUAL,
  EQUAL         = LPTRACE_EQUAL,
};

/** @return "<=", ">=" or "=" */
std::string relation_to_string(relation_t relation);

/** @return the relation obtained by multiplying both sides by -1 */
relation_t flip_relation(relation_t relation);

/**
 * @brief A single linear constraint `coefficients . x (relation) rhs`
 *
 * @tparam f_t Floating point type.
 */
template <typename f_t>
struct constraint_t {
  std::vector<f_t> coefficients;
  relation_t relation;
  f_t rhs;
};

/**
 * @brief A validated linear program in canonical form.
 *
 * The problem is immutable once constructed. Decision variable j is named `x{j+1}`.
 *
 * @tparam i_t Integer type. Currently only int is supported.
 * @tparam f_t Floating point type. Currently only double is supported.
 */
template <typename i_t, typename f_t>
class optimization_problem_t {
 public:
  /**
   * @brief Builds and validates a problem.
   *
   * @throw lptrace::logic_error (ValidationError) if the objective or the constraint list is
   * empty, if a constraint does not have exactly one coefficient per objective entry, or if a
   * coefficient or right-hand side is not a finite number.
   */
  optimization_problem_t(objective_sense_t sense,
                         std::vector<f_t> objective,
                         std::vector<constraint_t<f_t>> constraints,
                         bool non_negative = true);

  objective_sense_t get_sense() const noexcept { return sense_; }
  bool is_maximize() const noexcept { return sense_ == objective_sense_t::MAXIMIZE; }
  const std::vector<f_t>& get_objective() const noexcept { return objective_; }
  const std::vector<constraint_t<f_t>>& get_constraints() const noexcept { return constraints_; }
  bool is_non_negative() const noexcept { return non_negative_; }

  i_t get_n_variables() const noexcept { return static_cast<i_t>(objective_.size()); }
  i_t get_n_constraints() const noexcept { return static_cast<i_t>(constraints_.size()); }

  /** @return the display name of decision variable j (0-based), i.e. "x1" for j = 0 */
  std::string get_variable_name(i_t j) const;
  std::vector<std::string> get_variable_names() const;

  /** @return objective value of the point x (one entry per decision variable) */
  f_t evaluate_objective(const std::vector<f_t>& x) const;

  /** @return coefficients . x for constraint i */
  f_t evaluate_row(i_t i, const std::vector<f_t>& x) const;

  /**
   * @brief Slack of every constraint at x in its original orientation: rhs - lhs for <=,
   * lhs - rhs for >= and |lhs - rhs| for =. Slacks within tol * (1 + |rhs|) are set to zero.
   */
  std::vector<f_t> compute_slacks(const std::vector<f_t>& x, f_t tol) const;

  /** @return true if x satisfies every constraint within tol * (1 + |rhs|), and x >= -tol when
   * the variables are non-negative */
  bool is_feasible(const std::vector<f_t>& x, f_t tol) const;

 private:
  objective_sense_t sense_;
  std::vector<f_t> objective_;
  std::vector<constraint_t<f_t>> constraints_;
  bool non_negative_;
};

/**
 * @brief Builds a problem from raw coefficient arrays.
 *
 * Pure construction: no input is repaired. Dimension mismatches, empty input and non-finite
 * values are reported as ValidationError for the caller to surface.
 */
template <typename i_t, typename f_t>
optimization_problem_t<i_t, f_t> normalize(objective_sense_t sense,
                                           const std::vector<f_t>& objective,
                                           const std::vector<constraint_t<f_t>>& constraints,
                                           bool non_negative = true);

}  // namespace lptrace::linear_programming
