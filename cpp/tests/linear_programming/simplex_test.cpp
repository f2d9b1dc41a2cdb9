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

#include <lptrace/linear_programming/constants.h>
#include <lptrace/linear_programming/solve.hpp>

#include <utilities/common_utils.hpp>

#include <gtest/gtest.h>

namespace lptrace::linear_programming::test {

using namespace lptrace::test;

namespace {

// Every tableau recorded after a pivot keeps its basic columns as unit vectors
void check_pivot_tableaux(const solution_t<int, double>& solution)
{
  for (const auto& step : solution.steps) {
    if (step.title.rfind("Pivot", 0) != 0 && step.title != "Optimal Solution") { continue; }
    ASSERT_TRUE(step.table.has_value()) << step.title;
    EXPECT_TRUE(basis_is_identity(step.table.value())) << step.title;
  }
}

}  // namespace

TEST(simplex, production_planning)
{
  solver_settings_t<int, double> settings;
  const auto solution = solve_simplex(production_planning(), settings);

  ASSERT_EQ(solution.status, solve_status_t::OPTIMAL);
  EXPECT_EQ(solution.get_status_string(), "optimal");
  EXPECT_NEAR(solution.value_of("x1").value(), 40.0, 1e-9);
  EXPECT_NEAR(solution.value_of("x2").value(), 20.0, 1e-9);
  EXPECT_NEAR(solution.objective_value.value(), 160.0, 1e-9);
  EXPECT_EQ(solution.iterations, 2);
  EXPECT_EQ(solution.binding_constraints(), 2);
  EXPECT_FALSE(solution.degenerate);
  EXPECT_FALSE(solution.alternative_optima);

  ASSERT_EQ(solution.steps.size(), 5u);
  EXPECT_EQ(solution.steps[0].title, "Standard Form");
  EXPECT_EQ(solution.steps[1].title, "Initial Tableau");
  EXPECT_EQ(solution.steps[2].title, "Pivot 1: enter x1, leave s1");
  EXPECT_EQ(solution.steps[3].title, "Pivot 2: enter x2, leave s2");
  EXPECT_EQ(solution.steps[4].title, "Optimal Solution");
  EXPECT_FALSE(solution.steps[0].table.has_value());
  EXPECT_TRUE(contains(solution.steps[2].explanation, "most negative coefficient"));

  const auto& initial = solution.steps[1].table.value();
  EXPECT_DOUBLE_EQ(initial(2, 0), -3.0);
  EXPECT_DOUBLE_EQ(initial(2, 1), -2.0);
  EXPECT_DOUBLE_EQ(initial.rhs(2), 0.0);
  EXPECT_NEAR(solution.steps[4].table->rhs(2), 160.0, 1e-9);
  check_pivot_tableaux(solution);
}

TEST(simplex, resource_allocation)
{
  solver_settings_t<int, double> settings;
  const auto solution = solve_simplex(resource_allocation(), settings);

  ASSERT_TRUE(solution.is_optimal());
  const auto x = solution.get_primal_solution();
  ASSERT_EQ(x.size(), 2u);
  EXPECT_NEAR(x[0], 30.0, 1e-9);
  EXPECT_NEAR(x[1], 40.0, 1e-9);
  EXPECT_NEAR(solution.objective_value.value(), 2350.0, 1e-9);
  check_pivot_tableaux(solution);
}

TEST(simplex, unbounded)
{
  solver_settings_t<int, double> settings;
  const auto solution = solve_simplex(unbounded_problem(), settings);

  EXPECT_EQ(solution.status, solve_status_t::UNBOUNDED);
  EXPECT_EQ(solution.iterations, 1);
  EXPECT_TRUE(solution.variables.empty());
  EXPECT_FALSE(solution.objective_value.has_value());
  EXPECT_TRUE(contains(solution.message, "x2"));
  ASSERT_FALSE(solution.steps.empty());
  EXPECT_EQ(solution.steps.back().title, "Unbounded");
}

TEST(simplex, iteration_limit)
{
  solver_settings_t<int, double> settings;
  settings.set_parameter_from_string(LPTRACE_ITERATION_LIMIT, "1");
  const auto solution = solve_simplex(production_planning(), settings);

  EXPECT_EQ(solution.status, solve_status_t::ERROR);
  EXPECT_EQ(solution.message, "iteration limit exceeded after 1 pivots");
  EXPECT_EQ(solution.steps.back().title, "Iteration Limit");
}

TEST(simplex, degenerate_tie)
{
  // The first ratio test ties between both rows
  const auto problem = maximize({2, 1}, {{{1, 0}, LE, 2}, {{1, 1}, LE, 2}});
  solver_settings_t<int, double> settings;
  const auto solution = solve_simplex(problem, settings);

  ASSERT_TRUE(solution.is_optimal());
  EXPECT_NEAR(solution.value_of("x1").value(), 2.0, 1e-9);
  EXPECT_NEAR(solution.value_of("x2").value(), 0.0, 1e-9);
  EXPECT_NEAR(solution.objective_value.value(), 4.0, 1e-9);
  EXPECT_TRUE(solution.degenerate);
  EXPECT_EQ(solution.steps[2].title, "Pivot 1: enter x1, leave s1");
  EXPECT_TRUE(contains(solution.steps[2].explanation, "tied"));
  EXPECT_TRUE(contains(solution.steps.back().explanation, "degenerate"));
}

TEST(simplex, alternative_optima)
{
  const auto problem = maximize({2, 4}, {{{1, 2}, LE, 5}, {{1, 1}, LE, 4}});
  solver_settings_t<int, double> settings;
  const auto solution = solve_simplex(problem, settings);

  ASSERT_TRUE(solution.is_optimal());
  EXPECT_NEAR(solution.objective_value.value(), 10.0, 1e-9);
  EXPECT_TRUE(solution.alternative_optima);
  EXPECT_TRUE(contains(solution.steps.back().explanation, "Alternative optima"));
}

TEST(simplex, free_variables)
{
  // Both rows have a negative right-hand side and become <= rows
  const auto problem = minimize({1, 1}, {{{1, 0}, GE, -3}, {{0, 1}, GE, -2}}, false);
  solver_settings_t<int, double> settings;
  const auto solution = solve_simplex(problem, settings);

  ASSERT_TRUE(solution.is_optimal());
  EXPECT_NEAR(solution.value_of("x1").value(), -3.0, 1e-9);
  EXPECT_NEAR(solution.value_of("x2").value(), -2.0, 1e-9);
  EXPECT_NEAR(solution.objective_value.value(), -5.0, 1e-9);
  EXPECT_FALSE(solution.alternative_optima);
  EXPECT_FALSE(solution.value_of("x1+").has_value());
}

TEST(simplex, slacks)
{
  const auto problem = maximize({1, 0}, {{{1, 0}, LE, 4}, {{0, 1}, LE, 3}});
  solver_settings_t<int, double> settings;
  const auto solution = solve_simplex(problem, settings);

  ASSERT_TRUE(solution.is_optimal());
  ASSERT_EQ(solution.constraint_slacks.size(), 2u);
  EXPECT_NEAR(solution.constraint_slacks[0], 0.0, 1e-9);
  EXPECT_NEAR(solution.constraint_slacks[1], 3.0, 1e-9);
  EXPECT_EQ(solution.binding_constraints(), 1);
}

TEST(simplex, rejects_surplus_rows)
{
  solver_settings_t<int, double> settings;
  const auto msg = error_message([&] { solve_simplex(diet_problem(), settings); });
  EXPECT_TRUE(contains(msg, "ValidationError"));
  EXPECT_TRUE(contains(msg, "Big-M"));
}

TEST(simplex, without_tableaux)
{
  solver_settings_t<int, double> settings;
  settings.set_record_tableaux(false);
  const auto solution = solve_simplex(production_planning(), settings);

  ASSERT_TRUE(solution.is_optimal());
  ASSERT_EQ(solution.steps.size(), 5u);
  for (const auto& step : solution.steps) {
    EXPECT_FALSE(step.table.has_value()) << step.title;
    EXPECT_FALSE(step.explanation.empty()) << step.title;
  }
}

}  // namespace lptrace::linear_programming::test
