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

#include <lptrace/linear_programming/optimization_problem.hpp>

#include <string>
#include <vector>

namespace lptrace::lp_parser {

/**
 * @brief Parses a comma separated list of numbers such as "3, 2, 1".
 *
 * Empty entries are skipped, so "3, 2," gives {3, 2}.
 *
 * @throw lptrace::logic_error (ValidationError) "Invalid number format: ..." if an entry is not
 * a number.
 */
template <typename f_t>
std::vector<f_t> parse_coefficients(const std::string& text);

/**
 * @brief Parses a relation symbol: "<=" or "≤", ">=" or "≥", "=" or "==".
 *
 * @throw lptrace::logic_error (ValidationError) for any other symbol.
 */
linear_programming::relation_t parse_relation(const std::string& text);

/**
 * @brief Reads a problem from the line oriented lp text format.
 *
 * @code
 * # Production Planning
 * name: Production Planning
 * maximize: 3, 2
 * 2, 1 <= 100
 * 1, 2 <= 80
 * nonnegative: true
 * @endcode
 *
 * Keys are case insensitive and `max:` / `min:` are accepted for `maximize:` / `minimize:`.
 * Everything after `#` is a comment. `nonnegative:` is optional and defaults to true.
 *
 * @param[in] text Problem text.
 * @return lp_data_model_t The problem exactly as written, not validated.
 * @throw lptrace::logic_error (ValidationError) on a malformed line, naming its line number.
 */
template <typename i_t, typename f_t>
lp_data_model_t<i_t, f_t> parse_lp_string(const std::string& text);

/**
 * @brief Reads a problem from a file in the lp text format, see `parse_lp_string`.
 *
 * @param[in] lp_file_path Path to the problem file.
 * @throw lptrace::logic_error (RuntimeError) if the file cannot be read, (ValidationError) if it
 * is malformed.
 */
template <typename i_t, typename f_t>
lp_data_model_t<i_t, f_t> parse_lp(const std::string& lp_file_path);

/**
 * @brief Checks that a parsed model describes a well formed problem.
 *
 * @return the number of decision variables
 * @throw lptrace::logic_error (ValidationError) "Empty objective function", "At least one
 * constraint is required", "Empty coefficients in constraint i" or "Constraint i has k
 * variables, expected n".
 */
template <typename i_t, typename f_t>
i_t validate_problem_input(const lp_data_model_t<i_t, f_t>& model);

/**
 * @brief Validates the model and builds the solver problem from it.
 */
template <typename i_t, typename f_t>
linear_programming::optimization_problem_t<i_t, f_t> to_optimization_problem(
  const lp_data_model_t<i_t, f_t>& model);

}  // namespace lptrace::lp_parser
