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

#include <lp_parser/lp_data_model.hpp>

#include <string>
#include <vector>

namespace lptrace::lp_parser {

/** @return text without leading and trailing white space */
std::string trim(const std::string& text);

/** @return false if text is not entirely a number */
template <typename f_t>
bool read_number(const std::string& text, f_t& value);

/**
 * @return false if an entry is not a number; `bad_entry` is set to the offending text
 */
template <typename f_t>
bool read_coefficients(const std::string& text, std::vector<f_t>& values, std::string& bad_entry);

/** @return false if text is not a relation symbol */
bool read_relation(const std::string& text, linear_programming::relation_t& relation);

/**
 * @brief Line by line reader of the lp text format. The whole text is consumed by the
 * constructor and the result is written to `problem`.
 */
template <typename i_t, typename f_t>
class lp_parser_t {
 public:
  lp_parser_t(lp_data_model_t<i_t, f_t>& problem, const std::string& text);

 private:
  void parse_line(const std::string& line);
  void parse_keyword(const std::string& key, const std::string& value);
  void parse_constraint(const std::string& line);
  std::vector<f_t> parse_line_coefficients(const std::string& text) const;

  lp_data_model_t<i_t, f_t>& problem_;
  i_t line_number_{0};
  bool has_objective_{false};
};

}  // namespace lptrace::lp_parser
