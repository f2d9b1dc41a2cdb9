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

#include <algorithm>

namespace lptrace::linear_programming::test {

using namespace lptrace::test;

namespace {

bool has_step(const solution_t<int, double>& solution, const std::string& title)
{
  return std::any_of(solution.steps.begin(), solution.steps.end(), [&](const auto& step) {
    return step.title == title;
  });
}

}  // namespace

TEST(big_m, diet_problem)
{
  solver_settings_t<int, double> settings;
  const auto solution = solve_big_m(diet_problem(), settings);

  ASSERT_EQ(solution.status, solve_status_t::OPTIMAL);
  EXPECT_NEAR(solution.value_of("x1").value(), 3.2, 1e-9);
  EXPECT_NEAR(solution.value_of("x2").value(), 2.4, 1e-9);
  EXPECT_NEAR(solution.objective_value.value(), 13.6, 1e-9);
  EXPECT_EQ(solution.iterations, 2);
  EXPECT_EQ(solution.binding_constraints(1e-7), 2);

  ASSERT_GE(solution.steps.size(), 6u);
  EXPECT_EQ(solution.steps[0].title, "Standard Form");
  EXPECT_TRUE(contains(solution.steps[0].explanation, "M = 30000"));
  EXPECT_EQ(solution.steps[1].title, "Initial Tableau");
  EXPECT_EQ(solution.steps[2].title, "Eliminate Artificial Variables from Z-row");
  EXPECT_EQ(solution.steps[3].title, "Pivot 1: enter x1, leave a2");
  EXPECT_EQ(solution.steps[4].title, "Pivot 2: enter x2, leave a1");
  EXPECT_EQ(solution.steps.back().title, "Optimal Solution");
  EXPECT_TRUE(contains(solution.steps.back().explanation, "-Z"));

  // Artificial columns carry +M before the elimination step and are zeroed by it
  const auto& initial = solution.steps[1].table.value();
  EXPECT_EQ(initial.column_kinds[4], column_kind_t::ARTIFICIAL);
  EXPECT_DOUBLE_EQ(initial(2, 4), 3e4);
  EXPECT_DOUBLE_EQ(initial(2, 5), 3e4);
  const auto& eliminated = solution.steps[2].table.value();
  EXPECT_DOUBLE_EQ(eliminated(2, 4), 0.0);
  EXPECT_DOUBLE_EQ(eliminated(2, 5), 0.0);
  EXPECT_TRUE(basis_is_identity(eliminated));

  for (const auto& step : solution.steps) {
    if (step.title.rfind("Pivot", 0) != 0 && step.title != "Optimal Solution") { continue; }
    EXPECT_TRUE(basis_is_identity(step.table.value())) << step.title;
  }
}

TEST(big_m, infeasible)
{
  solver_settings_t<int, double> settings;
  const auto solution = solve_big_m(infeasible_problem(), settings);

  EXPECT_EQ(solution.status, solve_status_t::INFEASIBLE);
  EXPECT_EQ(solution.get_status_string(), "infeasible");
  EXPECT_TRUE(solution.variables.empty());
  EXPECT_FALSE(solution.objective_value.has_value());
  EXPECT_TRUE(contains(solution.message, "a1"));
  EXPECT_TRUE(contains(solution.message, "5"));
  EXPECT_EQ(solution.steps.back().title, "Infeasible");
  EXPECT_TRUE(has_step(solution, "Pivot 1: enter x1, leave s2"));
}

TEST(big_m, equality_row)
{
  const auto problem = maximize({1, 2}, {{{1, 1}, EQ, 4}, {{1, 0}, LE, 3}});
  solver_settings_t<int, double> settings;
  const auto solution = solve_big_m(problem, settings);

  ASSERT_TRUE(solution.is_optimal());
  EXPECT_NEAR(solution.value_of("x1").value(), 0.0, 1e-9);
  EXPECT_NEAR(solution.value_of("x2").value(), 4.0, 1e-9);
  EXPECT_NEAR(solution.objective_value.value(), 8.0, 1e-9);
  EXPECT_NEAR(solution.constraint_slacks[0], 0.0, 1e-9);

  const auto& final_table = solution.steps.back().table.value();
  for (int col : final_table.basis) {
    EXPECT_NE(final_table.column_kinds[col], column_kind_t::ARTIFICIAL);
  }
}

TEST(big_m, investment_portfolio)
{
  solver_settings_t<int, double> settings;
  const auto solution = solve_big_m(investment_portfolio(), settings);

  ASSERT_TRUE(solution.is_optimal());
  EXPECT_NEAR(solution.value_of("x1").value(), 4000.0, 1e-6);
  EXPECT_NEAR(solution.value_of("x2").value(), 6000.0, 1e-6);
  EXPECT_NEAR(solution.objective_value.value(), 1040.0, 1e-6);
}

TEST(big_m, matches_simplex_on_slack_problems)
{
  solver_settings_t<int, double> settings;
  const auto solution = solve_big_m(production_planning(), settings);

  ASSERT_TRUE(solution.is_optimal());
  EXPECT_NEAR(solution.objective_value.value(), 160.0, 1e-9);
  EXPECT_FALSE(has_step(solution, "Eliminate Artificial Variables from Z-row"));
  EXPECT_FALSE(contains(solution.steps[0].explanation, "M ="));
}

TEST(big_m, unbounded)
{
  // x1 >= 1 leaves x1 free to grow
  const auto problem = maximize({1, 1}, {{{1, 0}, GE, 1}, {{0, 1}, LE, 2}});
  solver_settings_t<int, double> settings;
  const auto solution = solve_big_m(problem, settings);

  EXPECT_EQ(solution.status, solve_status_t::UNBOUNDED);
  EXPECT_EQ(solution.steps.back().title, "Unbounded");
}

TEST(big_m, explicit_m)
{
  solver_settings_t<int, double> settings;
  settings.set_parameter_from_string(LPTRACE_BIG_M_VALUE, "1000");
  const auto solution = solve_big_m(diet_problem(), settings);

  ASSERT_TRUE(solution.is_optimal());
  EXPECT_TRUE(contains(solution.steps[0].explanation, "M = 1000"));
  EXPECT_DOUBLE_EQ(solution.steps[1].table->operator()(2, 4), 1000.0);
  EXPECT_NEAR(solution.objective_value.value(), 13.6, 1e-9);
}

TEST(big_m, small_constraint_coefficients)
{
  // minimize x1 + x2, 1e-5 x1 >= 1; optimum x1 = 1e5, Z = 1e5
  const auto problem = minimize({1, 1}, {{{1e-5, 0}, GE, 1}});
  solver_settings_t<int, double> settings;
  const auto solution  = solve_big_m(problem, settings);
  const auto graphical = solve_graphical(problem, settings);

  ASSERT_EQ(solution.status, solve_status_t::OPTIMAL) << solution.message;
  ASSERT_TRUE(graphical.is_optimal());
  EXPECT_NEAR(solution.value_of("x1").value(), 1e5, 1e-4);
  EXPECT_NEAR(solution.value_of("x2").value(), 0.0, 1e-9);
  EXPECT_NEAR(solution.objective_value.value(), 1e5, 1e-4);
  EXPECT_NEAR(solution.objective_value.value(), graphical.objective_value.value(), 1e-4);
  EXPECT_TRUE(contains(solution.steps[0].explanation, "M = 1e+09"));

  // Agreement does not rely on the size of M
  settings.set_parameter_from_string(LPTRACE_BIG_M_VALUE, "10");
  const auto small_m = solve_big_m(problem, settings);
  ASSERT_EQ(small_m.status, solve_status_t::OPTIMAL) << small_m.message;
  EXPECT_NEAR(small_m.objective_value.value(), 1e5, 1e-4);
}

TEST(big_m, small_reduced_costs)
{
  // maximize x1 + 0.001 x2, 1000 x1 + 1000 x2 >= 1000, x1 <= 1, x2 <= 1; optimum (1, 1)
  const auto problem =
    maximize({1, 0.001}, {{{1000, 1000}, GE, 1000}, {{1, 0}, LE, 1}, {{0, 1}, LE, 1}});
  solver_settings_t<int, double> settings;
  const auto solution  = solve_big_m(problem, settings);
  const auto graphical = solve_graphical(problem, settings);

  ASSERT_EQ(solution.status, solve_status_t::OPTIMAL) << solution.message;
  ASSERT_TRUE(graphical.is_optimal());
  EXPECT_NEAR(solution.value_of("x1").value(), 1.0, 1e-9);
  EXPECT_NEAR(solution.value_of("x2").value(), 1.0, 1e-9);
  EXPECT_NEAR(solution.objective_value.value(), 1.001, 1e-9);
  EXPECT_NEAR(solution.objective_value.value(), graphical.objective_value.value(), 1e-9);
  EXPECT_FALSE(solution.alternative_optima);
  EXPECT_EQ(solution.steps[3].title, "Pivot 1: enter x1, leave a1");
  EXPECT_EQ(solution.steps[4].title, "Pivot 2: enter e1, leave s2");
  EXPECT_EQ(solution.steps[5].title, "Pivot 3: enter x2, leave s3");
}

}  // namespace lptrace::linear_programming::test
