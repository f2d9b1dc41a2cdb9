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

#include <tableau_simplex/tableau.hpp>

#include <string>
#include <vector>

namespace lptrace::linear_programming::tableau_simplex {

/**
 * @brief The problem after right-hand side sign normalization and free variable splitting.
 *
 * Rows keep the original constraint order. Every rhs is non-negative. The objective is
 * maximize-normalized: `objective = obj_scale * c` where obj_scale is -1 for minimize.
 */
template <typename i_t, typename f_t>
struct standard_form_t {
  i_t num_rows{0};
  // Number of decision columns, 2 * n when the variables are free
  i_t num_decision_cols{0};
  f_t obj_scale{1.0};
  bool split_free{false};
  std::vector<f_t> objective;
  // Row-major, num_rows x num_decision_cols
  std::vector<f_t> A;
  std::vector<f_t> rhs;
  std::vector<relation_t> relation;
  // True if the row was multiplied by -1
  std::vector<bool> negated;
  std::vector<std::string> decision_labels;

  f_t coefficient(i_t i, i_t j) const { return A[i * num_decision_cols + j]; }
};

template <typename i_t, typename f_t>
standard_form_t<i_t, f_t> to_standard_form(const optimization_problem_t<i_t, f_t>& problem);

/** @return true if a >= or = row survives sign normalization */
template <typename i_t, typename f_t>
bool needs_artificials(const standard_form_t<i_t, f_t>& form);

/**
 * @brief Builds the initial tableau.
 *
 * Columns are ordered decision, then slack or surplus per row, then artificial per row. The
 * objective row holds the negated maximize-normalized objective. When the form needs
 * artificials, a penalty row is added with a coefficient of one (+M) for every artificial
 * column; no elimination is applied yet.
 *
 * @param big_m Value of M shown in snapshots. Only used when the form needs artificials.
 */
template <typename i_t, typename f_t>
tableau_t<i_t, f_t> build_initial_tableau(const standard_form_t<i_t, f_t>& form, f_t big_m);

/** @return a textual description of the added slack, surplus and artificial variables */
template <typename i_t, typename f_t>
std::string describe_standard_form(const optimization_problem_t<i_t, f_t>& problem,
                                   const standard_form_t<i_t, f_t>& form,
                                   const tableau_t<i_t, f_t>& tableau);

}  // namespace lptrace::linear_programming::tableau_simplex
