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

#include <lptrace/linear_programming/solver_solution.hpp>

#include <cmath>

namespace lptrace::linear_programming {

std::string status_to_string(solve_status_t status)
{
  switch (status) {
    case solve_status_t::OPTIMAL: return "optimal";
    case solve_status_t::UNBOUNDED: return "unbounded";
    case solve_status_t::INFEASIBLE: return "infeasible";
    case solve_status_t::ERROR: return "error";
  }
  return "error";
}

template <typename i_t, typename f_t>
bool tableau_snapshot_t<i_t, f_t>::is_unit_column(i_t col, i_t row, f_t tol) const
{
  for (i_t i = 0; i < num_rows; ++i) {
    const f_t expected = (i == row) ? 1.0 : 0.0;
    if (std::abs((*this)(i, col) - expected) > tol) { return false; }
  }
  return true;
}

template <typename i_t, typename f_t>
std::optional<f_t> solution_t<i_t, f_t>::value_of(const std::string& name) const
{
  for (const auto& [var_name, value] : variables) {
    if (var_name == name) { return value; }
  }
  return std::nullopt;
}

template <typename i_t, typename f_t>
std::vector<f_t> solution_t<i_t, f_t>::get_primal_solution() const
{
  std::vector<f_t> x;
  x.reserve(variables.size());
  for (const auto& entry : variables) {
    x.push_back(entry.second);
  }
  return x;
}

template <typename i_t, typename f_t>
i_t solution_t<i_t, f_t>::binding_constraints(f_t tol) const
{
  i_t count = 0;
  for (f_t slack : constraint_slacks) {
    if (std::abs(slack) <= tol) { ++count; }
  }
  return count;
}

#if LPTRACE_INSTANTIATE_DOUBLE
template struct tableau_snapshot_t<int, double>;
template class solution_t<int, double>;
#endif

}  // namespace lptrace::linear_programming
