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

#include <graphical/geometry.hpp>

#include <lptrace/linear_programming/utilities/problem_formatter.hpp>

#include <cmath>

namespace lptrace::linear_programming::graphical {

template <typename i_t, typename f_t>
std::vector<line_t<f_t>> constraint_lines(const optimization_problem_t<i_t, f_t>& problem,
                                          f_t tol,
                                          std::vector<i_t>& line_rows)
{
  const std::vector<std::string> names{"x1", "x2"};
  std::vector<line_t<f_t>> lines;
  line_rows.clear();
  const auto& constraints = problem.get_constraints();
  for (i_t i = 0; i < problem.get_n_constraints(); ++i) {
    const auto& row = constraints[i];
    const f_t a1    = row.coefficients[0];
    const f_t a2    = row.coefficients[1];
    // 0 x1 + 0 x2 (relation) rhs has no boundary, it is only checked for feasibility
    if (std::abs(a1) <= tol && std::abs(a2) <= tol) { continue; }
    lines.push_back({a1,
                     a2,
                     row.rhs,
                     row.relation,
                     "C" + std::to_string(i + 1) + ": " + format_constraint(row, names),
                     false});
    line_rows.push_back(i);
  }
  if (problem.is_non_negative()) {
    lines.push_back({1.0, 0.0, 0.0, relation_t::GREATER_EQUAL, "x1 >= 0", true});
    line_rows.push_back(-1);
    lines.push_back({0.0, 1.0, 0.0, relation_t::GREATER_EQUAL, "x2 >= 0", true});
    line_rows.push_back(-1);
  }
  return lines;
}

template <typename f_t>
bool intersection(const line_t<f_t>& a, const line_t<f_t>& b, f_t tol, point_t<f_t>& point)
{
  // cross((a1, a2, -ra), (b1, b2, -rb))
  const f_t tx = a.a2 * (-b.rhs) - (-a.rhs) * b.a2;
  const f_t ty = (-a.rhs) * b.a1 - a.a1 * (-b.rhs);
  const f_t tz = a.a1 * b.a2 - a.a2 * b.a1;

  const f_t scale = std::hypot(a.a1, a.a2) * std::hypot(b.a1, b.a2);
  if (std::abs(tz) <= tol * scale) { return false; }
  point = {tx / tz, ty / tz};
  return true;
}

template <typename f_t>
bool on_line(const line_t<f_t>& line, const point_t<f_t>& point, f_t tol)
{
  const f_t lhs = line.a1 * point.first + line.a2 * point.second;
  return std::abs(lhs - line.rhs) <= tol * (1.0 + std::abs(line.rhs));
}

template <typename f_t>
bool improves(f_t z, f_t incumbent, bool maximize, f_t tol)
{
  const f_t band = tol * (1.0 + std::abs(incumbent));
  return maximize ? z > incumbent + band : z < incumbent - band;
}

template <typename i_t, typename f_t>
bool improving_recession_direction(const optimization_problem_t<i_t, f_t>& problem,
                                   const std::vector<line_t<f_t>>& lines,
                                   f_t tol,
                                   point_t<f_t>& direction)
{
  const f_t sign = problem.is_maximize() ? 1.0 : -1.0;
  const f_t c1   = sign * problem.get_objective()[0];
  const f_t c2   = sign * problem.get_objective()[1];

  std::vector<point_t<f_t>> candidates;
  candidates.push_back({c1, c2});
  for (const auto& line : lines) {
    candidates.push_back({-line.a2, line.a1});
    candidates.push_back({line.a2, -line.a1});
  }

  const auto& constraints = problem.get_constraints();
  for (auto d : candidates) {
    const f_t norm = std::hypot(d.first, d.second);
    if (norm <= tol) { continue; }
    d = {d.first / norm, d.second / norm};

    if (c1 * d.first + c2 * d.second <= tol * (1.0 + std::hypot(c1, c2))) { continue; }
    if (problem.is_non_negative() && (d.first < -tol || d.second < -tol)) { continue; }

    bool recession = true;
    for (const auto& row : constraints) {
      const f_t a_d     = row.coefficients[0] * d.first + row.coefficients[1] * d.second;
      const f_t row_tol = tol * (1.0 + std::hypot(row.coefficients[0], row.coefficients[1]));
      if ((row.relation == relation_t::LESS_EQUAL && a_d > row_tol) ||
          (row.relation == relation_t::GREATER_EQUAL && a_d < -row_tol) ||
          (row.relation == relation_t::EQUAL && std::abs(a_d) > row_tol)) {
        recession = false;
        break;
      }
    }
    if (recession) {
      direction = d;
      return true;
    }
  }
  return false;
}

#if LPTRACE_INSTANTIATE_DOUBLE

template std::vector<line_t<double>> constraint_lines(
  const optimization_problem_t<int, double>& problem, double tol, std::vector<int>& line_rows);

template bool intersection(const line_t<double>& a,
                          const line_t<double>& b,
                          double tol,
                          point_t<double>& point);

template bool on_line(const line_t<double>& line, const point_t<double>& point, double tol);

template bool improves(double z, double incumbent, bool maximize, double tol);

template bool improving_recession_direction(const optimization_problem_t<int, double>& problem,
                                            const std::vector<line_t<double>>& lines,
                                            double tol,
                                            point_t<double>& direction);

#endif

}  // namespace lptrace::linear_programming::graphical
