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

#include <lptrace/error.hpp>
#include <lptrace/linear_programming/solver_settings.hpp>

#include <utilities/string_utils.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <type_traits>

namespace lptrace::linear_programming {

namespace {

bool parse_bool(const std::string& name, const std::string& value)
{
  std::string lower(value);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return std::tolower(c);
  });
  if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") { return true; }
  if (lower == "false" || lower == "0" || lower == "no" || lower == "off") { return false; }
  lptrace_expects(false,
                  error_type_t::ValidationError,
                  "Parameter %s expects a boolean, got '%s'",
                  name.c_str(),
                  value.c_str());
  return false;
}

template <typename T>
T parse_number(const std::string& name, const std::string& value)
{
  std::size_t consumed = 0;
  T parsed{};
  try {
    if constexpr (std::is_floating_point_v<T>) {
      parsed = static_cast<T>(std::stod(value, &consumed));
    } else {
      parsed = static_cast<T>(std::stoll(value, &consumed));
    }
  } catch (const std::logic_error&) {
    consumed = 0;
  }
  lptrace_expects(consumed != 0 && consumed == value.size(),
                  error_type_t::ValidationError,
                  "Parameter %s expects a number, got '%s'",
                  name.c_str(),
                  value.c_str());
  return parsed;
}

template <typename T>
void check_range(const parameter_info_t<T>& param, T value)
{
  lptrace_expects(value >= param.min_value && value <= param.max_value,
                  error_type_t::ValidationError,
                  "Parameter %s value %s is outside [%s, %s]",
                  param.param_name.c_str(),
                  format_value(static_cast<double>(value)).c_str(),
                  format_value(static_cast<double>(param.min_value)).c_str(),
                  format_value(static_cast<double>(param.max_value)).c_str());
}

}  // namespace

template <typename i_t, typename f_t>
solver_settings_t<i_t, f_t>::solver_settings_t()
{
  // clang-format off
  // Float parameters
  float_parameters = {
    {LPTRACE_PIVOT_TOLERANCE, &pivot_tolerance_, 1e-15, 1e-3, 1e-9},
    {LPTRACE_FEASIBILITY_TOLERANCE, &feasibility_tolerance_, 1e-15, 1e-3, 1e-9},
    {LPTRACE_BIG_M_SCALE, &big_m_scale_, 1.0, 1e12, 1e4},
    {LPTRACE_BIG_M_VALUE, &big_m_value_, 0.0, 1e15, 0.0}
  };

  // Int parameters
  int_parameters = {
    {LPTRACE_ITERATION_LIMIT, &iteration_limit_, -1, std::numeric_limits<i_t>::max(), -1}
  };

  // Bool parameters
  bool_parameters = {
    {LPTRACE_RECORD_TABLEAUX, &record_tableaux_, true},
    {LPTRACE_LOG_TO_CONSOLE, &log_to_console_, true}
  };

  // String parameters
  string_parameters = {
    {LPTRACE_LOG_FILE, &log_file_, ""}
  };
  // clang-format on
}

template <typename i_t, typename f_t>
void solver_settings_t<i_t, f_t>::set_parameter_from_string(const std::string& name,
                                                            const std::string& value)
{
  for (auto& param : float_parameters) {
    if (param.param_name == name) {
      const f_t parsed = parse_number<f_t>(name, value);
      check_range(param, parsed);
      *param.value_ptr = parsed;
      return;
    }
  }
  for (auto& param : int_parameters) {
    if (param.param_name == name) {
      const i_t parsed = parse_number<i_t>(name, value);
      check_range(param, parsed);
      lptrace_expects(parsed != 0,
                      error_type_t::ValidationError,
                      "Parameter %s must be positive or -1",
                      name.c_str());
      *param.value_ptr = parsed;
      return;
    }
  }
  for (auto& param : bool_parameters) {
    if (param.param_name == name) {
      *param.value_ptr = parse_bool(name, value);
      return;
    }
  }
  for (auto& param : string_parameters) {
    if (param.param_name == name) {
      *param.value_ptr = value;
      return;
    }
  }
  lptrace_expects(false, error_type_t::ValidationError, "Unknown parameter %s", name.c_str());
}

template <typename i_t, typename f_t>
template <typename T>
void solver_settings_t<i_t, f_t>::set_parameter(const std::string& name, T value)
{
  if constexpr (std::is_same_v<T, bool>) {
    for (auto& param : bool_parameters) {
      if (param.param_name == name) {
        *param.value_ptr = value;
        return;
      }
    }
  } else if constexpr (std::is_same_v<T, std::string>) {
    for (auto& param : string_parameters) {
      if (param.param_name == name) {
        *param.value_ptr = value;
        return;
      }
    }
  } else if constexpr (std::is_floating_point_v<T>) {
    for (auto& param : float_parameters) {
      if (param.param_name == name) {
        check_range(param, static_cast<f_t>(value));
        *param.value_ptr = static_cast<f_t>(value);
        return;
      }
    }
  } else {
    for (auto& param : int_parameters) {
      if (param.param_name == name) {
        check_range(param, static_cast<i_t>(value));
        lptrace_expects(value != 0,
                        error_type_t::ValidationError,
                        "Parameter %s must be positive or -1",
                        name.c_str());
        *param.value_ptr = static_cast<i_t>(value);
        return;
      }
    }
  }
  lptrace_expects(false,
                  error_type_t::ValidationError,
                  "Unknown parameter %s for the given value type",
                  name.c_str());
}

template <typename i_t, typename f_t>
template <typename T>
T solver_settings_t<i_t, f_t>::get_parameter(const std::string& name) const
{
  if constexpr (std::is_same_v<T, bool>) {
    for (const auto& param : bool_parameters) {
      if (param.param_name == name) { return *param.value_ptr; }
    }
  } else if constexpr (std::is_same_v<T, std::string>) {
    for (const auto& param : string_parameters) {
      if (param.param_name == name) { return *param.value_ptr; }
    }
  } else if constexpr (std::is_floating_point_v<T>) {
    for (const auto& param : float_parameters) {
      if (param.param_name == name) { return static_cast<T>(*param.value_ptr); }
    }
  } else {
    for (const auto& param : int_parameters) {
      if (param.param_name == name) { return static_cast<T>(*param.value_ptr); }
    }
  }
  lptrace_expects(false,
                  error_type_t::ValidationError,
                  "Unknown parameter %s for the requested type",
                  name.c_str());
  return T{};
}

template <typename i_t, typename f_t>
std::string solver_settings_t<i_t, f_t>::get_parameter_as_string(const std::string& name) const
{
  for (const auto& param : float_parameters) {
    if (param.param_name == name) { return format_value(*param.value_ptr); }
  }
  for (const auto& param : int_parameters) {
    if (param.param_name == name) { return std::to_string(*param.value_ptr); }
  }
  for (const auto& param : bool_parameters) {
    if (param.param_name == name) { return *param.value_ptr ? "true" : "false"; }
  }
  for (const auto& param : string_parameters) {
    if (param.param_name == name) { return *param.value_ptr; }
  }
  lptrace_expects(false, error_type_t::ValidationError, "Unknown parameter %s", name.c_str());
  return std::string();
}

template <typename i_t, typename f_t>
std::vector<std::string> solver_settings_t<i_t, f_t>::get_parameter_names() const
{
  std::vector<std::string> names;
  for (const auto& param : float_parameters) {
    names.push_back(param.param_name);
  }
  for (const auto& param : int_parameters) {
    names.push_back(param.param_name);
  }
  for (const auto& param : bool_parameters) {
    names.push_back(param.param_name);
  }
  for (const auto& param : string_parameters) {
    names.push_back(param.param_name);
  }
  return names;
}

template <typename i_t, typename f_t>
void solver_settings_t<i_t, f_t>::set_pivot_tolerance(f_t pivot_tolerance)
{
  set_parameter<f_t>(LPTRACE_PIVOT_TOLERANCE, pivot_tolerance);
}

template <typename i_t, typename f_t>
void solver_settings_t<i_t, f_t>::set_feasibility_tolerance(f_t feasibility_tolerance)
{
  set_parameter<f_t>(LPTRACE_FEASIBILITY_TOLERANCE, feasibility_tolerance);
}

template <typename i_t, typename f_t>
void solver_settings_t<i_t, f_t>::set_big_m_scale(f_t big_m_scale)
{
  set_parameter<f_t>(LPTRACE_BIG_M_SCALE, big_m_scale);
}

template <typename i_t, typename f_t>
void solver_settings_t<i_t, f_t>::set_big_m_value(f_t big_m_value)
{
  set_parameter<f_t>(LPTRACE_BIG_M_VALUE, big_m_value);
}

template <typename i_t, typename f_t>
void solver_settings_t<i_t, f_t>::set_iteration_limit(i_t iteration_limit)
{
  set_parameter<i_t>(LPTRACE_ITERATION_LIMIT, iteration_limit);
}

template <typename i_t, typename f_t>
void solver_settings_t<i_t, f_t>::set_record_tableaux(bool record_tableaux)
{
  record_tableaux_ = record_tableaux;
}

template <typename i_t, typename f_t>
void solver_settings_t<i_t, f_t>::set_log_to_console(bool log_to_console)
{
  log_to_console_ = log_to_console;
}

template <typename i_t, typename f_t>
void solver_settings_t<i_t, f_t>::set_log_file(std::string log_file)
{
  log_file_ = std::move(log_file);
}

template <typename i_t, typename f_t>
i_t solver_settings_t<i_t, f_t>::effective_iteration_limit(i_t num_rows,
                                                           i_t num_cols) const noexcept
{
  if (iteration_limit_ > 0) { return iteration_limit_; }
  return LPTRACE_ITERATION_LIMIT_FACTOR * (num_rows + num_cols);
}

template <typename i_t, typename f_t>
f_t solver_settings_t<i_t, f_t>::effective_big_m(f_t max_abs_objective,
                                                  f_t min_abs_coefficient) const noexcept
{
  if (big_m_value_ > 0) { return big_m_value_; }
  const f_t coefficient_scale =
    min_abs_coefficient > 0 ? std::max<f_t>(1.0, 1.0 / min_abs_coefficient) : 1.0;
  return big_m_scale_ * std::max<f_t>(1.0, max_abs_objective) * coefficient_scale;
}

#if LPTRACE_INSTANTIATE_DOUBLE

template class solver_settings_t<int, double>;

template void solver_settings_t<int, double>::set_parameter<double>(const std::string&, double);
template void solver_settings_t<int, double>::set_parameter<int>(const std::string&, int);
template void solver_settings_t<int, double>::set_parameter<bool>(const std::string&, bool);
template void solver_settings_t<int, double>::set_parameter<std::string>(const std::string&,
                                                                          std::string);

template double solver_settings_t<int, double>::get_parameter<double>(const std::string&) const;
template int solver_settings_t<int, double>::get_parameter<int>(const std::string&) const;
template bool solver_settings_t<int, double>::get_parameter<bool>(const std::string&) const;
template std::string solver_settings_t<int, double>::get_parameter<std::string>(
  const std::string&) const;

#endif

}  // namespace lptrace::linear_programming
