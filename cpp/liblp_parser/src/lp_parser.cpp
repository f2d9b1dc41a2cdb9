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

#include <lp_parser.hpp>

#include <lptrace/error.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace lptrace::lp_parser {

using linear_programming::relation_t;

namespace {

// UTF-8 encodings of the symbols the input form offers next to their ASCII spelling
constexpr const char* less_equal_sign    = "\xE2\x89\xA4";
constexpr const char* greater_equal_sign = "\xE2\x89\xA5";

std::string to_lower(std::string text)
{
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return text;
}

bool read_bool(const std::string& text, bool& value)
{
  const std::string lower = to_lower(trim(text));
  if (lower == "true" || lower == "yes" || lower == "1") {
    value = true;
    return true;
  }
  if (lower == "false" || lower == "no" || lower == "0") {
    value = false;
    return true;
  }
  return false;
}

// Finds the relation symbol of a constraint line, [begin, end) in bytes
bool find_relation(const std::string& line, std::size_t& begin, std::size_t& end)
{
  const std::string ascii_symbols = "<>=";
  for (std::size_t k = 0; k < line.size(); ++k) {
    if (ascii_symbols.find(line[k]) != std::string::npos) {
      begin = k;
      end   = k;
      while (end < line.size() && ascii_symbols.find(line[end]) != std::string::npos) {
        ++end;
      }
      return true;
    }
    if (line.compare(k, 3, less_equal_sign) == 0 || line.compare(k, 3, greater_equal_sign) == 0) {
      begin = k;
      end   = k + 3;
      return true;
    }
  }
  return false;
}

}  // namespace

std::string trim(const std::string& text)
{
  const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto first          = std::find_if_not(text.begin(), text.end(), is_space);
  auto last           = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
  return first < last ? std::string(first, last) : std::string();
}

template <typename f_t>
bool read_number(const std::string& text, f_t& value)
{
  const std::string entry = trim(text);
  if (entry.empty()) { return false; }
  char* end           = nullptr;
  const double parsed = std::strtod(entry.c_str(), &end);
  if (end != entry.c_str() + entry.size()) { return false; }
  value = static_cast<f_t>(parsed);
  return true;
}

template <typename f_t>
bool read_coefficients(const std::string& text, std::vector<f_t>& values, std::string& bad_entry)
{
  values.clear();
  std::istringstream stream(text);
  for (std::string entry; std::getline(stream, entry, ',');) {
    entry = trim(entry);
    if (entry.empty()) { continue; }
    f_t value;
    if (!read_number(entry, value)) {
      bad_entry = entry;
      return false;
    }
    values.push_back(value);
  }
  return true;
}

bool read_relation(const std::string& text, relation_t& relation)
{
  const std::string symbol = trim(text);
  if (symbol == "<=" || symbol == less_equal_sign) {
    relation = relation_t::LESS_EQUAL;
  } else if (symbol == ">=" || symbol == greater_equal_sign) {
    relation = relation_t::GREATER_EQUAL;
  } else if (symbol == "=" || symbol == "==") {
    relation = relation_t::EQUAL;
  } else {
    return false;
  }
  return true;
}

template <typename i_t, typename f_t>
lp_parser_t<i_t, f_t>::lp_parser_t(lp_data_model_t<i_t, f_t>& problem, const std::string& text)
  : problem_(problem)
{
  std::istringstream stream(text);
  for (std::string line; std::getline(stream, line);) {
    ++line_number_;
    const auto comment = line.find('#');
    if (comment != std::string::npos) { line.erase(comment); }
    line = trim(line);
    if (line.empty()) { continue; }
    parse_line(line);
  }
}

template <typename i_t, typename f_t>
void lp_parser_t<i_t, f_t>::parse_line(const std::string& line)
{
  const auto colon = line.find(':');
  if (colon != std::string::npos) {
    parse_keyword(to_lower(trim(line.substr(0, colon))), trim(line.substr(colon + 1)));
  } else {
    parse_constraint(line);
  }
}

template <typename i_t, typename f_t>
void lp_parser_t<i_t, f_t>::parse_keyword(const std::string& key, const std::string& value)
{
  if (key == "name") {
    problem_.set_problem_name(value);
  } else if (key == "maximize" || key == "max" || key == "minimize" || key == "min") {
    lptrace_expects(!has_objective_,
                    error_type_t::ValidationError,
                    "Line %d: the objective function is given more than once",
                    line_number_);
    problem_.set_maximize(key == "maximize" || key == "max");
    problem_.set_objective_coefficients(parse_line_coefficients(value));
    has_objective_ = true;
  } else if (key == "nonnegative" || key == "non-negative") {
    bool non_negative = true;
    lptrace_expects(read_bool(value, non_negative),
                    error_type_t::ValidationError,
                    "Line %d: expected true or false after %s, got '%s'",
                    line_number_,
                    key.c_str(),
                    value.c_str());
    problem_.set_non_negative(non_negative);
  } else {
    lptrace_expects(false,
                    error_type_t::ValidationError,
                    "Line %d: unknown keyword '%s'",
                    line_number_,
                    key.c_str());
  }
}

template <typename i_t, typename f_t>
void lp_parser_t<i_t, f_t>::parse_constraint(const std::string& line)
{
  std::size_t begin = 0;
  std::size_t end   = 0;
  lptrace_expects(find_relation(line, begin, end),
                  error_type_t::ValidationError,
                  "Line %d: expected a constraint such as '2, 1 <= 100', got '%s'",
                  line_number_,
                  line.c_str());

  const std::string symbol = line.substr(begin, end - begin);
  relation_t relation;
  lptrace_expects(read_relation(symbol, relation),
                  error_type_t::ValidationError,
                  "Line %d: unknown relation '%s', use <=, >= or =",
                  line_number_,
                  symbol.c_str());

  const std::string rhs_text = trim(line.substr(end));
  f_t rhs;
  lptrace_expects(read_number(rhs_text, rhs),
                  error_type_t::ValidationError,
                  "Line %d: Invalid number format: '%s'",
                  line_number_,
                  rhs_text.c_str());

  problem_.add_constraint(parse_line_coefficients(line.substr(0, begin)), relation, rhs);
}

template <typename i_t, typename f_t>
std::vector<f_t> lp_parser_t<i_t, f_t>::parse_line_coefficients(const std::string& text) const
{
  std::vector<f_t> values;
  std::string bad_entry;
  lptrace_expects(read_coefficients(text, values, bad_entry),
                  error_type_t::ValidationError,
                  "Line %d: Invalid number format: '%s'",
                  line_number_,
                  bad_entry.c_str());
  return values;
}

template bool read_number(const std::string& text, double& value);

template bool read_coefficients(const std::string& text,
                                std::vector<double>& values,
                                std::string& bad_entry);

template class lp_parser_t<int, double>;

}  // namespace lptrace::lp_parser
