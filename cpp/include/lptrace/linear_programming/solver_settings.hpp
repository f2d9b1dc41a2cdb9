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

#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace lptrace::linear_programming {

template <typename T>
struct parameter_info_t {
  parameter_info_t(std::string_view param_name, T* value, T min, T max, T def)
    : param_name(param_name), value_ptr(value), min_value(min), max_value(max), default_value(def)
  {
  }
  std::string param_name;
  T* value_ptr;
  T min_value;
  T max_value;
  T default_value;
};

template <>
struct parameter_info_t<bool> {
  parameter_info_t(std::string_view name, bool* value, bool def)
    : param_name(name), value_ptr(value), default_value(def)
  {
  }
  std::string param_name;
  bool* value_ptr;
  bool default_value;
};

template <>
struct parameter_info_t<std::string> {
  parameter_info_t(std::string_view name, std::string* value, std::string def)
    : param_name(name), value_ptr(value), default_value(def)
  {
  }
  std::string param_name;
  std::string* value_ptr;
  std::string default_value;
};

/**
 * @brief Tolerances and limits shared by the Simplex, Big-M and Graphical engines.
 *
 * Settings are passed explicitly to every solve; nothing is read from global state.
 *
 * @tparam i_t Integer type. Currently only int is supported.
 * @tparam f_t Floating point type. Currently only double is supported.
 */
template <typename i_t, typename f_t>
class solver_settings_t {
 public:
  solver_settings_t();

  // The parameter tables hold pointers into this object
  solver_settings_t(const solver_settings_t& settings)            = delete;
  solver_settings_t& operator=(const solver_settings_t& settings) = delete;
  solver_settings_t(solver_settings_t&& settings)                 = delete;
  solver_settings_t& operator=(solver_settings_t&& settings)      = delete;

  /**
   * @brief Parses value according to the type of the named parameter and sets it.
   *
   * @throw lptrace::logic_error (ValidationError) for an unknown name, a value that does not
   * parse, or a value outside the parameter range.
   */
  void set_parameter_from_string(const std::string& name, const std::string& value);

  template <typename T>
  void set_parameter(const std::string& name, T value);

  template <typename T>
  T get_parameter(const std::string& name) const;

  std::string get_parameter_as_string(const std::string& name) const;

  void set_pivot_tolerance(f_t pivot_tolerance);
  void set_feasibility_tolerance(f_t feasibility_tolerance);
  void set_big_m_scale(f_t big_m_scale);
  void set_big_m_value(f_t big_m_value);
  void set_iteration_limit(i_t iteration_limit);
  void set_record_tableaux(bool record_tableaux);
  void set_log_to_console(bool log_to_console);
  void set_log_file(std::string log_file);

  f_t get_pivot_tolerance() const noexcept { return pivot_tolerance_; }
  f_t get_feasibility_tolerance() const noexcept { return feasibility_tolerance_; }
  f_t get_big_m_scale() const noexcept { return big_m_scale_; }
  f_t get_big_m_value() const noexcept { return big_m_value_; }
  i_t get_iteration_limit() const noexcept { return iteration_limit_; }
  bool get_record_tableaux() const noexcept { return record_tableaux_; }
  bool get_log_to_console() const noexcept { return log_to_console_; }
  std::string get_log_file() const noexcept { return log_file_; }

  /**
   * @brief Pivot cap for a tableau with the given number of constraint rows and columns.
   *
   * A positive IterationLimit is returned as is; -1 selects
   * LPTRACE_ITERATION_LIMIT_FACTOR * (num_rows + num_cols).
   */
  i_t effective_iteration_limit(i_t num_rows, i_t num_cols) const noexcept;

  /**
   * @brief Penalty applied to artificial variables by the Big-M engine.
   *
   * A positive BigMValue is returned as is; otherwise
   * BigMScale * max(1, max_abs_objective) * max(1, 1 / min_abs_coefficient), where
   * min_abs_coefficient is the smallest nonzero |a_ij| over the rows with artificial variables.
   */
  f_t effective_big_m(f_t max_abs_objective, f_t min_abs_coefficient = 1.0) const noexcept;

  /** @return all parameter names, in table order */
  std::vector<std::string> get_parameter_names() const;

 private:
  f_t pivot_tolerance_       = 1e-9;
  f_t feasibility_tolerance_ = 1e-9;
  f_t big_m_scale_           = 1e4;
  f_t big_m_value_           = 0.0;
  i_t iteration_limit_       = -1;
  bool record_tableaux_      = true;
  bool log_to_console_       = true;
  std::string log_file_;

  std::vector<parameter_info_t<f_t>> float_parameters;
  std::vector<parameter_info_t<i_t>> int_parameters;
  std::vector<parameter_info_t<bool>> bool_parameters;
  std::vector<parameter_info_t<std::string>> string_parameters;
};

}  // namespace lptrace::linear_programming
