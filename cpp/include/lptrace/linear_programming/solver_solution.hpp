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
#include <lptrace/linear_programming/optimization_problem.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lptrace::linear_programming {

// Terminal outcome of a solve
enum class solve_status_t : int8_t {
  OPTIMAL    = LPTRACE_STATUS_OPTIMAL,
  UNBOUNDED  = LPTRACE_STATUS_UNBOUNDED,
  INFEASIBLE = LPTRACE_STATUS_INFEASIBLE,
  ERROR      = LPTRACE_STATUS_ERROR,
};

/** @return "optimal", "unbounded", "infeasible" or "error" */
std::string status_to_string(solve_status_t status);

enum class column_kind_t : int8_t {
  DECISION   = 0,
  SLACK      = 1,
  SURPLUS    = 2,
  ARTIFICIAL = 3,
};

/**
 * @brief Immutable copy of a simplex tableau taken when a step is recorded.
 *
 * The grid is dense and row-major with `num_rows` rows and `num_cols` columns. The last row is
 * the objective (Z) row and the last column is the right-hand side.
 */
template <typename i_t, typename f_t>
struct tableau_snapshot_t {
  i_t num_rows{0};
  i_t num_cols{0};
  std::vector<f_t> values;
  // One label per column, the last one is "RHS"
  std::vector<std::string> column_labels;
  // One label per row: the basic variable of each constraint row, then "Z"
  std::vector<std::string> row_labels;
  // Column index basic in each constraint row
  std::vector<i_t> basis;
  // One kind per variable column (RHS excluded)
  std::vector<column_kind_t> column_kinds;

  f_t operator()(i_t row, i_t col) const { return values[row * num_cols + col]; }
  f_t rhs(i_t row) const { return values[row * num_cols + num_cols - 1]; }
  i_t objective_row() const { return num_rows - 1; }
  i_t num_variables() const { return num_cols - 1; }

  /** @return true if column col is 1 in row and 0 in every other row, within tol */
  bool is_unit_column(i_t col, i_t row, f_t tol) const;
};

/**
 * @brief A constraint boundary a1 * x1 + a2 * x2 = rhs in the plane.
 */
template <typename f_t>
struct line_t {
  f_t a1;
  f_t a2;
  f_t rhs;
  relation_t relation;
  std::string label;
  // Non-negativity axis rather than a user constraint
  bool is_axis{false};
};

template <typename f_t>
struct vertex_t {
  f_t x1;
  f_t x2;
  f_t objective;
};

/**
 * @brief Plotting data produced by the graphical engine.
 *
 * Lines and vertices are listed in the order they were generated. When the problem is unbounded
 * `ray_direction` holds the improving direction followed from `ray_origin`.
 */
template <typename i_t, typename f_t>
struct geometry_t {
  std::vector<line_t<f_t>> lines;
  std::vector<vertex_t<f_t>> vertices;
  // Objective coefficients (c1, c2) for drawing iso-objective lines
  f_t c1{0};
  f_t c2{0};
  // Index into vertices, -1 if none was chosen
  i_t optimal_vertex{-1};
  std::optional<std::pair<f_t, f_t>> ray_origin;
  std::optional<std::pair<f_t, f_t>> ray_direction;
};

/**
 * @brief One entry of the solve trace. Steps are snapshots and never refer back to solver state.
 */
template <typename i_t, typename f_t>
struct step_t {
  std::string title;
  std::string explanation;
  std::optional<tableau_snapshot_t<i_t, f_t>> table;
  std::optional<geometry_t<i_t, f_t>> geometry;
};

/**
 * @brief Outcome of a solve together with the full ordered trace.
 *
 * `variables` and `objective_value` are populated only when the status is OPTIMAL. `message`
 * explains any other status.
 *
 * @tparam i_t Integer type. Currently only int is supported.
 * @tparam f_t Floating point type. Currently only double is supported.
 */
template <typename i_t, typename f_t>
class solution_t {
 public:
  solution_t() = default;

  bool is_optimal() const noexcept { return status == solve_status_t::OPTIMAL; }

  /** @return the value of the named decision variable, or nullopt if it is not reported */
  std::optional<f_t> value_of(const std::string& name) const;

  /** @return the decision variable values in variable order */
  std::vector<f_t> get_primal_solution() const;

  /** @return the number of constraints whose slack is within tol */
  i_t binding_constraints(f_t tol = 1e-9) const;

  /** @return human readable status, see status_to_string */
  std::string get_status_string() const { return status_to_string(status); }

  solve_status_t status{solve_status_t::ERROR};
  // Decision variables in variable order, e.g. {"x1", 40}, {"x2", 20}
  std::vector<std::pair<std::string, f_t>> variables;
  std::optional<f_t> objective_value;
  std::vector<step_t<i_t, f_t>> steps;
  std::string message;
  bool degenerate{false};
  bool alternative_optima{false};
  // Slack of each constraint in its original orientation, optimal results only
  std::vector<f_t> constraint_slacks;
  // Number of pivots, or number of vertices evaluated by the graphical engine
  i_t iterations{0};
};

}  // namespace lptrace::linear_programming
