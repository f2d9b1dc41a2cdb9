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
#include <lptrace/linear_programming/solver_settings.hpp>

#include <utilities/common_utils.hpp>

#include <gtest/gtest.h>

#include <algorithm>

namespace lptrace::linear_programming::test {

using lptrace::test::contains;
using lptrace::test::error_message;

TEST(solver_settings, defaults)
{
  solver_settings_t<int, double> settings;
  EXPECT_DOUBLE_EQ(settings.get_pivot_tolerance(), 1e-9);
  EXPECT_DOUBLE_EQ(settings.get_feasibility_tolerance(), 1e-9);
  EXPECT_DOUBLE_EQ(settings.get_big_m_scale(), 1e4);
  EXPECT_DOUBLE_EQ(settings.get_big_m_value(), 0.0);
  EXPECT_EQ(settings.get_iteration_limit(), -1);
  EXPECT_TRUE(settings.get_record_tableaux());
  EXPECT_TRUE(settings.get_log_to_console());
  EXPECT_EQ(settings.get_log_file(), "");
}

TEST(solver_settings, parameter_names)
{
  solver_settings_t<int, double> settings;
  const auto names = settings.get_parameter_names();
  for (const char* name : {LPTRACE_PIVOT_TOLERANCE,
                           LPTRACE_FEASIBILITY_TOLERANCE,
                           LPTRACE_BIG_M_SCALE,
                           LPTRACE_BIG_M_VALUE,
                           LPTRACE_ITERATION_LIMIT,
                           LPTRACE_RECORD_TABLEAUX,
                           LPTRACE_LOG_TO_CONSOLE,
                           LPTRACE_LOG_FILE}) {
    EXPECT_NE(std::find(names.begin(), names.end(), name), names.end()) << name;
  }
  EXPECT_EQ(names.size(), 8u);
}

TEST(solver_settings, set_from_string)
{
  solver_settings_t<int, double> settings;
  settings.set_parameter_from_string(LPTRACE_PIVOT_TOLERANCE, "1e-7");
  settings.set_parameter_from_string(LPTRACE_ITERATION_LIMIT, "25");
  settings.set_parameter_from_string(LPTRACE_RECORD_TABLEAUX, "off");
  settings.set_parameter_from_string(LPTRACE_LOG_FILE, "/tmp/lptrace.log");

  EXPECT_DOUBLE_EQ(settings.get_pivot_tolerance(), 1e-7);
  EXPECT_EQ(settings.get_iteration_limit(), 25);
  EXPECT_FALSE(settings.get_record_tableaux());
  EXPECT_EQ(settings.get_log_file(), "/tmp/lptrace.log");

  EXPECT_EQ(settings.get_parameter_as_string(LPTRACE_ITERATION_LIMIT), "25");
  EXPECT_EQ(settings.get_parameter_as_string(LPTRACE_RECORD_TABLEAUX), "false");
  EXPECT_EQ(settings.get_parameter_as_string(LPTRACE_BIG_M_SCALE), "10000");
}

TEST(solver_settings, typed_access)
{
  solver_settings_t<int, double> settings;
  settings.set_parameter<double>(LPTRACE_BIG_M_VALUE, 500.0);
  settings.set_parameter<int>(LPTRACE_ITERATION_LIMIT, 7);
  settings.set_parameter<bool>(LPTRACE_LOG_TO_CONSOLE, false);
  settings.set_parameter<std::string>(LPTRACE_LOG_FILE, "run.log");

  EXPECT_DOUBLE_EQ(settings.get_parameter<double>(LPTRACE_BIG_M_VALUE), 500.0);
  EXPECT_EQ(settings.get_parameter<int>(LPTRACE_ITERATION_LIMIT), 7);
  EXPECT_FALSE(settings.get_parameter<bool>(LPTRACE_LOG_TO_CONSOLE));
  EXPECT_EQ(settings.get_parameter<std::string>(LPTRACE_LOG_FILE), "run.log");
}

TEST(solver_settings, invalid_values)
{
  solver_settings_t<int, double> settings;
  EXPECT_TRUE(contains(error_message([&] { settings.set_parameter_from_string("Speed", "1"); }),
                       "Unknown parameter Speed"));
  EXPECT_TRUE(contains(
    error_message([&] { settings.set_parameter_from_string(LPTRACE_PIVOT_TOLERANCE, "abc"); }),
    "expects a number"));
  EXPECT_TRUE(contains(
    error_message([&] { settings.set_parameter_from_string(LPTRACE_PIVOT_TOLERANCE, "1e-9x"); }),
    "expects a number"));
  EXPECT_TRUE(contains(
    error_message([&] { settings.set_parameter_from_string(LPTRACE_PIVOT_TOLERANCE, "0.5"); }),
    "is outside"));
  EXPECT_TRUE(contains(
    error_message([&] { settings.set_parameter_from_string(LPTRACE_ITERATION_LIMIT, "0"); }),
    "must be positive or -1"));
  EXPECT_TRUE(contains(
    error_message([&] { settings.set_parameter_from_string(LPTRACE_ITERATION_LIMIT, "-5"); }),
    "is outside"));
  EXPECT_TRUE(contains(
    error_message([&] { settings.set_parameter_from_string(LPTRACE_RECORD_TABLEAUX, "maybe"); }),
    "expects a boolean"));
  EXPECT_TRUE(contains(error_message([&] { settings.set_big_m_scale(0.5); }), "is outside"));

  // Rejected values leave the setting untouched
  EXPECT_DOUBLE_EQ(settings.get_pivot_tolerance(), 1e-9);
  EXPECT_EQ(settings.get_iteration_limit(), -1);
  EXPECT_DOUBLE_EQ(settings.get_big_m_scale(), 1e4);
}

TEST(solver_settings, effective_iteration_limit)
{
  solver_settings_t<int, double> settings;
  EXPECT_EQ(settings.effective_iteration_limit(2, 4), 300);
  settings.set_iteration_limit(12);
  EXPECT_EQ(settings.effective_iteration_limit(2, 4), 12);
}

TEST(solver_settings, effective_big_m)
{
  solver_settings_t<int, double> settings;
  EXPECT_DOUBLE_EQ(settings.effective_big_m(3.0), 3e4);
  EXPECT_DOUBLE_EQ(settings.effective_big_m(0.12), 1e4);
  // Small constraint coefficients raise M, large ones leave it alone
  EXPECT_DOUBLE_EQ(settings.effective_big_m(1.0, 1e-5), 1e9);
  EXPECT_DOUBLE_EQ(settings.effective_big_m(3.0, 0.5), 6e4);
  EXPECT_DOUBLE_EQ(settings.effective_big_m(3.0, 1000.0), 3e4);
  settings.set_big_m_scale(100.0);
  EXPECT_DOUBLE_EQ(settings.effective_big_m(3.0), 300.0);
  settings.set_big_m_value(1e6);
  EXPECT_DOUBLE_EQ(settings.effective_big_m(3.0), 1e6);
  EXPECT_DOUBLE_EQ(settings.effective_big_m(3.0, 1e-5), 1e6);
}

}  // namespace lptrace::linear_programming::test
