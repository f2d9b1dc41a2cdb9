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

#include <lptrace/linear_programming/solve.hpp>

#include <graphical/geometry.hpp>

#include <utilities/common_utils.hpp>

#include <gtest/gtest.h>

#include <cmath>

namespace lptrace::linear_programming::test {

using namespace lptrace::test;

TEST(geometry, intersection)
{
  const line_t<double> a{2, 1, 100, LE, "C1", false};
  const line_t<double> b{1, 2, 80, LE, "C2", false};
  graphical::point_t<double> p;
  ASSERT_TRUE(graphical::intersection(a, b, 1e-9, p));
  EXPECT_NEAR(p.first, 40.0, 1e-12);
  EXPECT_NEAR(p.second, 20.0, 1e-12);
  EXPECT_TRUE(graphical::on_line(a, p, 1e-9));
  EXPECT_TRUE(graphical::on_line(b, p, 1e-9));

  const line_t<double> parallel{4, 2, 10, LE, "C3", false};
  EXPECT_FALSE(graphical::intersection(a, parallel, 1e-9, p));
}

TEST(geometry, constraint_lines)
{
  std::vector<int> rows;
  const auto problem = maximize({1, 1}, {{{1, 1}, LE, 4}, {{0, 0}, LE, 1}, {{1, 0}, GE, 1}});
  const auto lines   = graphical::constraint_lines(problem, 1e-9, rows);
  ASSERT_EQ(lines.size(), 4u);
  EXPECT_EQ(rows, (std::vector<int>{0, 2, -1, -1}));
  EXPECT_EQ(lines[0].label, "C1: x1 + x2 <= 4");
  EXPECT_EQ(lines[1].label, "C3: x1 >= 1");
  EXPECT_TRUE(lines[2].is_axis);
  EXPECT_EQ(lines[3].label, "x2 >= 0");
}

TEST(geometry, improves)
{
  EXPECT_FALSE(graphical::improves(0.1 + 0.2, 0.3, true, 1e-9));
  EXPECT_FALSE(graphical::improves(0.3, 0.1 + 0.2, false, 1e-9));
  EXPECT_TRUE(graphical::improves(0.31, 0.3, true, 1e-9));
  EXPECT_FALSE(graphical::improves(0.31, 0.3, false, 1e-9));
  EXPECT_TRUE(graphical::improves(-5.0, -4.0, false, 1e-9));
  EXPECT_FALSE(graphical::improves(1e6 + 1e-4, 1e6, true, 1e-9));
}

TEST(geometry, recession_direction)
{
  std::vector<int> rows;
  const auto bounded = production_planning();
  graphical::point_t<double> d;
  EXPECT_FALSE(graphical::improving_recession_direction(
    bounded, graphical::constraint_lines(bounded, 1e-9, rows), 1e-9, d));

  const auto unbounded = unbounded_problem();
  ASSERT_TRUE(graphical::improving_recession_direction(
    unbounded, graphical::constraint_lines(unbounded, 1e-9, rows), 1e-9, d));
  EXPECT_NEAR(std::hypot(d.first, d.second), 1.0, 1e-12);
  EXPECT_GT(d.first + d.second, 0.0);
  EXPECT_LE(d.first - d.second, 1e-9);
}

TEST(graphical, production_planning)
{
  solver_settings_t<int, double> settings;
  const auto solution = solve_graphical(production_planning(), settings);

  ASSERT_EQ(solution.status, solve_status_t::OPTIMAL);
  EXPECT_NEAR(solution.value_of("x1").value(), 40.0, 1e-9);
  EXPECT_NEAR(solution.value_of("x2").value(), 20.0, 1e-9);
  EXPECT_NEAR(solution.objective_value.value(), 160.0, 1e-9);
  EXPECT_EQ(solution.iterations, 4);
  EXPECT_EQ(solution.binding_constraints(), 2);
  EXPECT_FALSE(solution.degenerate);
  EXPECT_FALSE(solution.alternative_optima);

  ASSERT_EQ(solution.steps.size(), 8u);
  EXPECT_EQ(solution.steps[0].title, "Constraint Lines");
  EXPECT_EQ(solution.steps[1].title, "Intersection Points");
  EXPECT_EQ(solution.steps[2].title, "Feasible Vertices");
  EXPECT_EQ(solution.steps[3].title, "Evaluate Vertex V1 (40, 20)");
  EXPECT_EQ(solution.steps[7].title, "Optimal Vertex");
  EXPECT_TRUE(contains(solution.steps[1].explanation, "violates"));

  const auto& geometry = solution.steps.back().geometry.value();
  EXPECT_FALSE(solution.steps.back().table.has_value());
  EXPECT_EQ(geometry.lines.size(), 4u);
  ASSERT_EQ(geometry.vertices.size(), 4u);
  const double expected[4][2] = {{40, 20}, {50, 0}, {0, 40}, {0, 0}};
  for (int k = 0; k < 4; ++k) {
    EXPECT_NEAR(geometry.vertices[k].x1, expected[k][0], 1e-9) << k;
    EXPECT_NEAR(geometry.vertices[k].x2, expected[k][1], 1e-9) << k;
  }
  EXPECT_NEAR(geometry.vertices[1].objective, 150.0, 1e-9);
  EXPECT_EQ(geometry.optimal_vertex, 0);
  EXPECT_DOUBLE_EQ(geometry.c1, 3.0);
  EXPECT_DOUBLE_EQ(geometry.c2, 2.0);
  EXPECT_FALSE(geometry.ray_origin.has_value());
}

TEST(graphical, diet_problem)
{
  solver_settings_t<int, double> settings;
  const auto solution = solve_graphical(diet_problem(), settings);

  ASSERT_TRUE(solution.is_optimal());
  EXPECT_NEAR(solution.value_of("x1").value(), 3.2, 1e-9);
  EXPECT_NEAR(solution.value_of("x2").value(), 2.4, 1e-9);
  EXPECT_NEAR(solution.objective_value.value(), 13.6, 1e-9);

  const auto& vertices = solution.steps.back().geometry->vertices;
  ASSERT_EQ(vertices.size(), 3u);
  EXPECT_NEAR(vertices[1].x1, 8.0, 1e-9);
  EXPECT_NEAR(vertices[1].objective, 16.0, 1e-9);
  EXPECT_NEAR(vertices[2].x2, 12.0, 1e-9);
  EXPECT_NEAR(vertices[2].objective, 36.0, 1e-9);
}

TEST(graphical, unbounded)
{
  solver_settings_t<int, double> settings;
  const auto solution = solve_graphical(unbounded_problem(), settings);

  EXPECT_EQ(solution.status, solve_status_t::UNBOUNDED);
  EXPECT_TRUE(solution.variables.empty());
  EXPECT_FALSE(solution.objective_value.has_value());
  EXPECT_EQ(solution.steps.back().title, "Unbounded");

  const auto& geometry = solution.steps.back().geometry.value();
  ASSERT_TRUE(geometry.ray_origin.has_value());
  ASSERT_TRUE(geometry.ray_direction.has_value());
  EXPECT_NEAR(geometry.ray_origin->first, 1.0, 1e-9);
  EXPECT_NEAR(geometry.ray_origin->second, 0.0, 1e-9);
}

TEST(graphical, infeasible)
{
  solver_settings_t<int, double> settings;
  const auto solution = solve_graphical(infeasible_problem(), settings);

  EXPECT_EQ(solution.status, solve_status_t::INFEASIBLE);
  ASSERT_EQ(solution.steps.size(), 3u);
  EXPECT_EQ(solution.steps[0].title, "Constraint Lines");
  EXPECT_EQ(solution.steps[1].title, "Intersection Points");
  EXPECT_EQ(solution.steps[2].title, "Infeasible");
  EXPECT_TRUE(contains(solution.steps[1].explanation, "parallel"));
  EXPECT_TRUE(solution.steps[2].geometry->vertices.empty());
}

TEST(graphical, investment_portfolio)
{
  solver_settings_t<int, double> settings;
  const auto solution = solve_graphical(investment_portfolio(), settings);

  ASSERT_TRUE(solution.is_optimal());
  EXPECT_NEAR(solution.value_of("x1").value(), 4000.0, 1e-6);
  EXPECT_NEAR(solution.value_of("x2").value(), 6000.0, 1e-6);
  EXPECT_NEAR(solution.objective_value.value(), 1040.0, 1e-6);
  EXPECT_EQ(solution.steps.back().geometry->vertices.size(), 4u);
}

TEST(graphical, alternative_optima)
{
  const auto problem = maximize({2, 4}, {{{1, 2}, LE, 5}, {{1, 1}, LE, 4}});
  solver_settings_t<int, double> settings;
  const auto solution = solve_graphical(problem, settings);

  ASSERT_TRUE(solution.is_optimal());
  EXPECT_NEAR(solution.objective_value.value(), 10.0, 1e-9);
  EXPECT_TRUE(solution.alternative_optima);
  EXPECT_NEAR(solution.value_of("x1").value(), 3.0, 1e-9);
  EXPECT_NEAR(solution.value_of("x2").value(), 1.0, 1e-9);
}

TEST(graphical, rounding_tie_keeps_first_vertex)
{
  // Z is 3.5 at both (3, 1) and (0, 2.5); in double the first evaluates to 3.4999999999999996
  const auto problem = maximize({0.7, 1.4}, {{{1, 2}, LE, 5}, {{1, 1}, LE, 4}});
  solver_settings_t<int, double> settings;
  const auto solution = solve_graphical(problem, settings);

  ASSERT_TRUE(solution.is_optimal());
  EXPECT_NEAR(solution.objective_value.value(), 3.5, 1e-9);
  EXPECT_TRUE(solution.alternative_optima);
  EXPECT_NEAR(solution.value_of("x1").value(), 3.0, 1e-9);
  EXPECT_NEAR(solution.value_of("x2").value(), 1.0, 1e-9);
  EXPECT_EQ(solution.steps.back().geometry->optimal_vertex, 0);
}

TEST(graphical, degenerate_vertex)
{
  // Three boundary lines meet at (2, 0)
  const auto problem = maximize({2, 1}, {{{1, 0}, LE, 2}, {{1, 1}, LE, 2}});
  solver_settings_t<int, double> settings;
  const auto solution = solve_graphical(problem, settings);

  ASSERT_TRUE(solution.is_optimal());
  EXPECT_NEAR(solution.objective_value.value(), 4.0, 1e-9);
  EXPECT_TRUE(solution.degenerate);
}

TEST(graphical, free_variables)
{
  const auto problem = minimize({1, 1}, {{{1, 0}, GE, -3}, {{0, 1}, GE, -2}}, false);
  solver_settings_t<int, double> settings;
  const auto solution = solve_graphical(problem, settings);

  ASSERT_TRUE(solution.is_optimal());
  EXPECT_NEAR(solution.value_of("x1").value(), -3.0, 1e-9);
  EXPECT_NEAR(solution.value_of("x2").value(), -2.0, 1e-9);
  EXPECT_NEAR(solution.objective_value.value(), -5.0, 1e-9);
  EXPECT_FALSE(solution.alternative_optima);
  EXPECT_EQ(solution.steps.back().geometry->lines.size(), 2u);
}

TEST(graphical, region_without_corners)
{
  // Strip between two parallel lines, optimum along the lower one
  const auto problem = minimize({1, 1}, {{{1, 1}, LE, 4}, {{1, 1}, GE, -2}}, false);
  solver_settings_t<int, double> settings;
  const auto solution = solve_graphical(problem, settings);

  ASSERT_TRUE(solution.is_optimal());
  EXPECT_NEAR(solution.objective_value.value(), -2.0, 1e-9);
  EXPECT_NEAR(solution.value_of("x1").value(), -1.0, 1e-9);
  EXPECT_TRUE(solution.alternative_optima);

  const auto half_plane = maximize({1, 1}, {{{1, 1}, LE, 4}}, false);
  const auto upper      = solve_graphical(half_plane, settings);
  ASSERT_TRUE(upper.is_optimal());
  EXPECT_NEAR(upper.objective_value.value(), 4.0, 1e-9);

  const auto open = maximize({1, 0}, {{{1, 1}, LE, 4}}, false);
  EXPECT_EQ(solve_graphical(open, settings).status, solve_status_t::UNBOUNDED);
}

TEST(graphical, requires_two_variables)
{
  solver_settings_t<int, double> settings;
  const auto problem = maximize({1, 1, 1}, {{{1, 1, 1}, LE, 3}});
  const auto msg     = error_message([&] { solve_graphical(problem, settings); });
  EXPECT_TRUE(contains(msg, "ValidationError"));
  EXPECT_TRUE(contains(msg, "exactly 2 variables"));
}

}  // namespace lptrace::linear_programming::test
