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

#include <lptrace/linear_programming/solver_solution.hpp>

#include <string>
#include <vector>

namespace lptrace::linear_programming::tableau_simplex {

template <typename i_t, typename f_t>
struct ratio_test_t {
  // Leaving row, -1 if the entering column has no positive entry
  i_t row{-1};
  f_t ratio{0.0};
  // Another row reached the same minimum ratio
  bool tie{false};
};

/**
 * @brief Dense simplex tableau with m constraint rows and one objective row.
 *
 * Row m is the objective (Z) row in maximize-normalized form: the tableau is optimal when no
 * entry of row m is negative. Column num_vars() is the right-hand side.
 *
 * With artificial columns the Z-row is kept in two parts: row m holds the constant part and the
 * penalty row holds the coefficients of M. Entries are compared on the M part first and on the
 * constant part on ties, so the outcome does not depend on the magnitude of M. Snapshots show
 * the combined row, constant + M * penalty.
 *
 * Invariant: the column of basis[i] is the i-th unit vector after every pivot.
 */
template <typename i_t, typename f_t>
class tableau_t {
 public:
  tableau_t(i_t num_rows, i_t num_vars);

  i_t num_rows() const { return m_; }
  i_t num_vars() const { return n_; }
  i_t objective_row() const { return m_; }

  f_t& operator()(i_t i, i_t j) { return values_[i * (n_ + 1) + j]; }
  const f_t& operator()(i_t i, i_t j) const { return values_[i * (n_ + 1) + j]; }
  f_t& rhs(i_t i) { return values_[i * (n_ + 1) + n_]; }
  const f_t& rhs(i_t i) const { return values_[i * (n_ + 1) + n_]; }

  /** row dst += factor * row src, right-hand side included */
  void add_row_multiple(i_t dst, i_t src, f_t factor);

  /** Adds an all-zero penalty row whose entries are multiplied by big_m for display. */
  void add_penalty_row(f_t big_m);
  bool has_penalty_row() const { return !penalty_.empty(); }
  f_t& penalty(i_t j) { return penalty_[j]; }
  const f_t& penalty(i_t j) const { return penalty_[j]; }

  /** penalty row += factor * row src, right-hand side included */
  void add_to_penalty_row(i_t src, f_t factor);

  /** @return the combined Z-row entry of column j, j == num_vars() for the right-hand side */
  f_t z_entry(i_t j) const;

  /**
   * @brief Entering column: the most negative objective row entry below -tol.
   * Ties go to the lowest column index.
   *
   * With a penalty row, columns whose M coefficient is below -penalty_tol come first, ordered
   * by M coefficient and then by constant part. Otherwise only columns with an M coefficient
   * within penalty_tol of zero are priced on the constant part.
   *
   * @return the entering column, or -1 if the tableau is optimal
   */
  i_t select_entering(f_t tol, f_t penalty_tol = 0.0) const;

  /**
   * @brief Minimum ratio rhs / entry over rows whose entry in col exceeds tol.
   * Ties go to the lowest row index.
   */
  ratio_test_t<i_t, f_t> ratio_test(i_t col, f_t tol) const;

  /**
   * @brief Makes col basic in row: scales the pivot row to a unit pivot, then eliminates col
   * from every other row including the objective and penalty rows.
   */
  void pivot(i_t row, i_t col);

  /** @return the row in which column j is basic, or -1 */
  i_t basic_row(i_t j) const;

  /** @return the current value of column j: its row's rhs if basic, else zero */
  f_t column_value(i_t j) const;

  /** @return the label of the variable basic in row i, "Z" for the objective row */
  std::string row_label(i_t i) const;

  tableau_snapshot_t<i_t, f_t> snapshot() const;

  std::vector<i_t> basis;
  std::vector<std::string> column_labels;
  std::vector<column_kind_t> column_kinds;
  // Partner column of a split free variable (x+ / x-), -1 otherwise
  std::vector<i_t> twin;

 private:
  i_t m_;
  i_t n_;
  std::vector<f_t> values_;
  // Coefficients of M in the Z-row, empty without artificial columns
  std::vector<f_t> penalty_;
  f_t big_m_{0.0};
};

}  // namespace lptrace::linear_programming::tableau_simplex
