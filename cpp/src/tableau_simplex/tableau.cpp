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

#include <tableau_simplex/tableau.hpp>

#include <lptrace/error.hpp>

#include <cmath>

namespace lptrace::linear_programming::tableau_simplex {

template <typename i_t, typename f_t>
tableau_t<i_t, f_t>::tableau_t(i_t num_rows, i_t num_vars)
  : basis(num_rows, -1),
    column_labels(num_vars),
    column_kinds(num_vars, column_kind_t::DECISION),
    twin(num_vars, -1),
    m_(num_rows),
    n_(num_vars),
    values_((num_rows + 1) * (num_vars + 1), 0.0)
{
}

template <typename i_t, typename f_t>
void tableau_t<i_t, f_t>::add_row_multiple(i_t dst, i_t src, f_t factor)
{
  if (factor == 0.0) { return; }
  for (i_t j = 0; j <= n_; ++j) {
    (*this)(dst, j) += factor * (*this)(src, j);
  }
}

template <typename i_t, typename f_t>
void tableau_t<i_t, f_t>::add_penalty_row(f_t big_m)
{
  penalty_.assign(n_ + 1, 0.0);
  big_m_ = big_m;
}

template <typename i_t, typename f_t>
void tableau_t<i_t, f_t>::add_to_penalty_row(i_t src, f_t factor)
{
  if (factor == 0.0) { return; }
  for (i_t j = 0; j <= n_; ++j) {
    penalty_[j] += factor * (*this)(src, j);
  }
}

template <typename i_t, typename f_t>
f_t tableau_t<i_t, f_t>::z_entry(i_t j) const
{
  const f_t constant = (*this)(m_, j);
  return has_penalty_row() ? constant + big_m_ * penalty_[j] : constant;
}

template <typename i_t, typename f_t>
i_t tableau_t<i_t, f_t>::select_entering(f_t tol, f_t penalty_tol) const
{
  if (has_penalty_row()) {
    i_t enter = -1;
    for (i_t j = 0; j < n_; ++j) {
      const f_t p_j = penalty_[j];
      if (p_j >= -penalty_tol) { continue; }
      if (enter == -1) {
        enter = j;
        continue;
      }
      const f_t p_best = penalty_[enter];
      if (p_j < p_best - penalty_tol ||
          (p_j <= p_best + penalty_tol && (*this)(m_, j) < (*this)(m_, enter) - tol)) {
        enter = j;
      }
    }
    if (enter != -1) { return enter; }
  }

  i_t enter   = -1;
  f_t min_val = -tol;
  for (i_t j = 0; j < n_; ++j) {
    if (has_penalty_row() && std::abs(penalty_[j]) > penalty_tol) { continue; }
    const f_t d_j = (*this)(m_, j);
    // Strict comparison keeps the lowest index on ties
    if (d_j < min_val) {
      min_val = d_j;
      enter   = j;
    }
  }
  return enter;
}

template <typename i_t, typename f_t>
ratio_test_t<i_t, f_t> tableau_t<i_t, f_t>::ratio_test(i_t col, f_t tol) const
{
  ratio_test_t<i_t, f_t> result;
  for (i_t i = 0; i < m_; ++i) {
    const f_t a_ij = (*this)(i, col);
    if (a_ij <= tol) { continue; }
    const f_t ratio = rhs(i) / a_ij;
    if (result.row == -1) {
      result.row   = i;
      result.ratio = ratio;
      continue;
    }
    const f_t tie_tol = tol * (1.0 + std::abs(result.ratio));
    if (ratio < result.ratio - tie_tol) {
      result.row   = i;
      result.ratio = ratio;
      result.tie   = false;
    } else if (std::abs(ratio - result.ratio) <= tie_tol) {
      result.tie = true;
    }
  }
  return result;
}

template <typename i_t, typename f_t>
void tableau_t<i_t, f_t>::pivot(i_t row, i_t col)
{
  const f_t pivot_element = (*this)(row, col);
  LPTRACE_EXPECTS(pivot_element != 0.0, "Pivot on a zero element at row %d column %d", row, col);

  for (i_t j = 0; j <= n_; ++j) {
    (*this)(row, j) /= pivot_element;
  }
  (*this)(row, col) = 1.0;

  for (i_t i = 0; i <= m_; ++i) {
    if (i == row) { continue; }
    const f_t factor = (*this)(i, col);
    if (factor == 0.0) { continue; }
    add_row_multiple(i, row, -factor);
    // Exact zero so the entering column is a unit vector
    (*this)(i, col) = 0.0;
  }
  if (has_penalty_row() && penalty_[col] != 0.0) {
    add_to_penalty_row(row, -penalty_[col]);
    penalty_[col] = 0.0;
  }
  basis[row] = col;
}

template <typename i_t, typename f_t>
i_t tableau_t<i_t, f_t>::basic_row(i_t j) const
{
  for (i_t i = 0; i < m_; ++i) {
    if (basis[i] == j) { return i; }
  }
  return -1;
}

template <typename i_t, typename f_t>
f_t tableau_t<i_t, f_t>::column_value(i_t j) const
{
  const i_t i = basic_row(j);
  return i == -1 ? 0.0 : rhs(i);
}

template <typename i_t, typename f_t>
std::string tableau_t<i_t, f_t>::row_label(i_t i) const
{
  if (i == m_) { return "Z"; }
  return basis[i] >= 0 ? column_labels[basis[i]] : std::string("?");
}

template <typename i_t, typename f_t>
tableau_snapshot_t<i_t, f_t> tableau_t<i_t, f_t>::snapshot() const
{
  tableau_snapshot_t<i_t, f_t> snap;
  snap.num_rows      = m_ + 1;
  snap.num_cols      = n_ + 1;
  snap.values        = values_;
  if (has_penalty_row()) {
    for (i_t j = 0; j <= n_; ++j) {
      snap.values[m_ * (n_ + 1) + j] = z_entry(j);
    }
  }
  snap.column_labels = column_labels;
  snap.column_labels.push_back("RHS");
  snap.row_labels.reserve(m_ + 1);
  for (i_t i = 0; i <= m_; ++i) {
    snap.row_labels.push_back(row_label(i));
  }
  snap.basis        = basis;
  snap.column_kinds = column_kinds;
  return snap;
}

#if LPTRACE_INSTANTIATE_DOUBLE
template class tableau_t<int, double>;
#endif

}  // namespace lptrace::linear_programming::tableau_simplex
