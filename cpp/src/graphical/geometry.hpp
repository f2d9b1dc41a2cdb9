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
#include <lptrace/linear_programming/solver_solution.hpp>

#include <string>
#include <utility>
#include <vector>

namespace lptrace::linear_programming::graphical {

template <typename f_t>
using point_t = std::pair<f_t, f_t>;

/**
 * @brief Boundary lines of a two variable problem: one per constraint with a non-zero
 * coefficient, followed by the axes x1 = 0 and x2 = 0 when the variables are non-negative.
 *
 * @param[out] line_rows constraint index of each line, -1 for an axis
 */
template <typename i_t, typename f_t>
std::vector<line_t<f_t>> constraint_lines(const optimization_problem_t<i_t, f_t>& problem,
                                          f_t tol,
                                          std::vector<i_t>& line_rows);

/**
 * @brief Intersection of two lines.
 *
 * The lines are taken as homogeneous vectors (a1, a2, -rhs); their cross product is the
 * intersection point in homogeneous coordinates.
 *
 * @return false if the lines are parallel, i.e. |a1 * b2 - a2 * b1| <= tol * |a| * |b|
 */
template <typename f_t>
bool intersection(const line_t<f_t>& a, const line_t<f_t>& b, f_t tol, point_t<f_t>& point);

/** @return true if point lies on line within tol * (1 + |rhs|) */
template <typename f_t>
bool on_line(const line_t<f_t>& line, const point_t<f_t>& point, f_t tol);

/** @return true if z beats incumbent by more than tol * (1 + |incumbent|) */
template <typename f_t>
bool improves(f_t z, f_t incumbent, bool maximize, f_t tol);

/**
 * @brief Looks for a direction d along which the feasible region extends forever and the
 * objective improves.
 *
 * A direction is a recession direction when a . d <= 0 for every <= row, a . d >= 0 for every
 * >= row, a . d = 0 for every = row and d >= 0 for non-negative variables. The extreme rays of
 * the recession cone lie along a boundary line or the objective gradient, so only the gradient
 * and both directions of every line are tested.
 *
 * @return true and the unit direction in `direction` if the objective is unbounded along it
 */
template <typename i_t, typename f_t>
bool improving_recession_direction(const optimization_problem_t<i_t, f_t>& problem,
                                   const std::vector<line_t<f_t>>& lines,
                                   f_t tol,
                                   point_t<f_t>& direction);

}  // namespace lptrace::linear_programming::graphical
