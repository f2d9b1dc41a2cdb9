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

#include <lp_parser/parser.hpp>

#include <lptrace/linear_programming/solve.hpp>

#include <utilities/common_utils.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace lptrace::lp_parser::test {

using namespace lptrace::test;

namespace {

std::string dataset(const std::string& file)
{
  return get_dataset_root_dir() + "/linear_programming/" + file;
}

}  // namespace

TEST(lp_parser, parse_coefficients)
{
  EXPECT_EQ(parse_coefficients<double>("3, 2"), (std::vector<double>{3, 2}));
  EXPECT_EQ(parse_coefficients<double>(" -1.5 ,2e2,, 0 "), (std::vector<double>{-1.5, 200, 0}));
  EXPECT_TRUE(parse_coefficients<double>("").empty());

  const auto msg = error_message([] { parse_coefficients<double>("3, two"); });
  EXPECT_TRUE(contains(msg, "ValidationError"));
  EXPECT_TRUE(contains(msg, "Invalid number format: 'two'"));
  EXPECT_TRUE(contains(error_message([] { parse_coefficients<double>("1, 2x"); }), "'2x'"));
}

TEST(lp_parser, parse_relation)
{
  EXPECT_EQ(parse_relation("<="), LE);
  EXPECT_EQ(parse_relation("\xE2\x89\xA4"), LE);
  EXPECT_EQ(parse_relation(" >= "), GE);
  EXPECT_EQ(parse_relation("\xE2\x89\xA5"), GE);
  EXPECT_EQ(parse_relation("="), EQ);
  EXPECT_EQ(parse_relation("=="), EQ);
  EXPECT_TRUE(
    contains(error_message([] { parse_relation("<"); }), "Unknown relation '<', use <=, >= or ="));
}

TEST(lp_parser, parse_string)
{
  const auto model = parse_lp_string<int, double>(
    "# comment only\n"
    "NAME: Sample\n"
    "Minimize: 2, 3   # cost\n"
    "\n"
    "1, 2 >= 8\n"
    "3, 1 = 12\n"
    "1, 1 <= -1\n"
    "nonnegative: false\n");

  EXPECT_EQ(model.get_problem_name(), "Sample");
  EXPECT_FALSE(model.get_maximize());
  EXPECT_FALSE(model.get_non_negative());
  EXPECT_EQ(model.get_objective_coefficients(), (std::vector<double>{2, 3}));
  ASSERT_EQ(model.get_n_constraints(), 3);
  EXPECT_EQ(model.get_constraint_coefficients()[1], (std::vector<double>{3, 1}));
  EXPECT_EQ(model.get_relations(), (std::vector<linear_programming::relation_t>{GE, EQ, LE}));
  EXPECT_EQ(model.get_constraint_bounds(), (std::vector<double>{8, 12, -1}));
  EXPECT_EQ(validate_problem_input(model), 2);
}

TEST(lp_parser, defaults)
{
  const auto model = parse_lp_string<int, double>("max: 1\n1 <= 4\n");
  EXPECT_TRUE(model.get_maximize());
  EXPECT_TRUE(model.get_non_negative());
  EXPECT_EQ(model.get_problem_name(), "");
}

TEST(lp_parser, line_errors)
{
  EXPECT_TRUE(
    contains(error_message([] { parse_lp_string<int, double>("max: 1, 1\nmin: 1, 1\n"); }),
             "Line 2: the objective function is given more than once"));
  EXPECT_TRUE(contains(error_message([] { parse_lp_string<int, double>("goal: 1, 1\n"); }),
                       "Line 1: unknown keyword 'goal'"));
  EXPECT_TRUE(
    contains(error_message([] { parse_lp_string<int, double>("nonnegative: maybe\n"); }),
             "Line 1: expected true or false after nonnegative, got 'maybe'"));
  EXPECT_TRUE(contains(error_message([] { parse_lp_string<int, double>("max: 1, 1\n1, 1 4\n"); }),
                       "Line 2: expected a constraint such as"));
  EXPECT_TRUE(contains(error_message([] { parse_lp_string<int, double>("1, 1 =< 4\n"); }),
                       "Line 1: unknown relation '=<'"));
  EXPECT_TRUE(contains(error_message([] { parse_lp_string<int, double>("1, 1 <= four\n"); }),
                       "Line 1: Invalid number format: 'four'"));
  EXPECT_TRUE(contains(error_message([] { parse_lp_string<int, double>("# x\n1, a <= 4\n"); }),
                       "Line 2: Invalid number format: 'a'"));
}

TEST(lp_parser, validate_problem_input)
{
  EXPECT_TRUE(
    contains(error_message([] { to_optimization_problem(parse_lp_string<int, double>("1 <= 4")); }),
             "Empty objective function"));
  EXPECT_TRUE(
    contains(error_message([] { to_optimization_problem(parse_lp_string<int, double>("max: 1")); }),
             "At least one constraint is required"));
  EXPECT_TRUE(contains(error_message([] {
                         to_optimization_problem(parse_lp_string<int, double>("max: 1, 2\n<= 4"));
                       }),
                       "Empty coefficients in constraint 1"));
  EXPECT_TRUE(contains(error_message([] {
                         to_optimization_problem(
                           parse_lp_string<int, double>("max: 1, 2\n1, 1 <= 4\n1, 2, 3 <= 6"));
                       }),
                       "Constraint 2 has 3 variables, expected 2"));
}

TEST(lp_parser, missing_file)
{
  const auto msg = error_message([] { parse_lp<int, double>(dataset("does_not_exist.lp")); });
  EXPECT_TRUE(contains(msg, "RuntimeError"));
  EXPECT_TRUE(contains(msg, "Error opening problem file"));
}

TEST(lp_parser, production_planning_file)
{
  const auto model = parse_lp<int, double>(dataset("production_planning.lp"));
  EXPECT_EQ(model.get_problem_name(), "Production Planning");

  const auto problem = to_optimization_problem(model);
  EXPECT_TRUE(problem.is_maximize());
  EXPECT_EQ(problem.get_n_constraints(), 2);

  linear_programming::solver_settings_t<int, double> settings;
  const auto solution = linear_programming::solve(
    problem, linear_programming::recommend_method(problem), settings);
  ASSERT_TRUE(solution.is_optimal());
  EXPECT_NEAR(solution.objective_value.value(), 160.0, 1e-9);
}

TEST(lp_parser, dataset_files)
{
  linear_programming::solver_settings_t<int, double> settings;
  const std::vector<std::pair<std::string, double>> optimal{{"diet_problem.lp", 13.6},
                                                            {"investment_portfolio.lp", 1040.0},
                                                            {"free_variables.lp", -5.0}};
  for (const auto& [file, objective] : optimal) {
    const auto problem  = to_optimization_problem(parse_lp<int, double>(dataset(file)));
    const auto solution = linear_programming::solve(
      problem, linear_programming::method_t::BIG_M, settings);
    ASSERT_TRUE(solution.is_optimal()) << file;
    EXPECT_NEAR(solution.objective_value.value(), objective, 1e-6) << file;
  }

  const auto infeasible = to_optimization_problem(parse_lp<int, double>(dataset("infeasible.lp")));
  EXPECT_EQ(linear_programming::solve(infeasible, linear_programming::method_t::BIG_M, settings)
              .status,
            linear_programming::solve_status_t::INFEASIBLE);
}

}  // namespace lptrace::lp_parser::test
