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

#include <lp_parser/lp_data_model.hpp>

#include <utility>

namespace lptrace::lp_parser {

template <typename i_t, typename f_t>
void lp_data_model_t<i_t, f_t>::set_problem_name(const std::string& name)
{
  problem_name_ = name;
}

template <typename i_t, typename f_t>
void lp_data_model_t<i_t, f_t>::set_maximize(bool maximize)
{
  maximize_ = maximize;
}

template <typename i_t, typename f_t>
void lp_data_model_t<i_t, f_t>::set_objective_coefficients(std::vector<f_t> objective_coefficients)
{
  objective_coefficients_ = std::move(objective_coefficients);
}

template <typename i_t, typename f_t>
void lp_data_model_t<i_t, f_t>::add_constraint(std::vector<f_t> coefficients,
                                               linear_programming::relation_t relation,
                                               f_t rhs)
{
  constraint_coefficients_.push_back(std::move(coefficients));
  relations_.push_back(relation);
  constraint_bounds_.push_back(rhs);
}

template <typename i_t, typename f_t>
void lp_data_model_t<i_t, f_t>::set_non_negative(bool non_negative)
{
  non_negative_ = non_negative;
}

template <typename i_t, typename f_t>
const std::string& lp_data_model_t<i_t, f_t>::get_problem_name() const
{
  return problem_name_;
}

template <typename i_t, typename f_t>
bool lp_data_model_t<i_t, f_t>::get_maximize() const
{
  return maximize_;
}

template <typename i_t, typename f_t>
const std::vector<f_t>& lp_data_model_t<i_t, f_t>::get_objective_coefficients() const
{
  return objective_coefficients_;
}

template <typename i_t, typename f_t>
const std::vector<std::vector<f_t>>& lp_data_model_t<i_t, f_t>::get_constraint_coefficients()
  const
{
  return constraint_coefficients_;
}

template <typename i_t, typename f_t>
const std::vector<linear_programming::relation_t>& lp_data_model_t<i_t, f_t>::get_relations()
  const
{
  return relations_;
}

template <typename i_t, typename f_t>
const std::vector<f_t>& lp_data_model_t<i_t, f_t>::get_constraint_bounds() const
{
  return constraint_bounds_;
}

template <typename i_t, typename f_t>
bool lp_data_model_t<i_t, f_t>::get_non_negative() const
{
  return non_negative_;
}

template <typename i_t, typename f_t>
i_t lp_data_model_t<i_t, f_t>::get_n_constraints() const
{
  return static_cast<i_t>(constraint_coefficients_.size());
}

template class lp_data_model_t<int, double>;

}  // namespace lptrace::lp_parser
