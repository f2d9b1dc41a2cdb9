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

#include <tableau_simplex/standard_form.hpp>

#include <utilities/string_utils.hpp>

namespace lptrace::linear_programming::tableau_simplex {

template <typename i_t, typename f_t>
standard_form_t<i_t, f_t> to_standard_form(const optimization_problem_t<i_t, f_t>& problem)
{
  const i_t n = problem.get_n_variables();
  const i_t m = problem.get_n_constraints();

  standard_form_t<i_t, f_t> form;
  form.num_rows          = m;
  form.split_free        = !problem.is_non_negative();
  form.num_decision_cols = form.split_free ? 2 * n : n;
  form.obj_scale         = problem.is_maximize() ? 1.0 : -1.0;

  form.objective.resize(form.num_decision_cols);
  form.decision_labels.resize(form.num_decision_cols);
  const auto& c = problem.get_objective();
  for (i_t j = 0; j < n; ++j) {
    const std::string name = problem.get_variable_name(j);
    if (form.split_free) {
      form.objective[2 * j]           = form.obj_scale * c[j];
      form.objective[2 * j + 1]       = -form.obj_scale * c[j];
      form.decision_labels[2 * j]     = name + "+";
      form.decision_labels[2 * j + 1] = name + "-";
    } else {
      form.objective[j]       = form.obj_scale * c[j];
      form.decision_labels[j] = name;
    }
  }

  form.A.assign(m * form.num_decision_cols, 0.0);
  form.rhs.resize(m);
  form.relation.resize(m);
  form.negated.assign(m, false);
  const auto& constraints = problem.get_constraints();
  for (i_t i = 0; i < m; ++i) {
    const auto& row  = constraints[i];
    const f_t sign   = row.rhs < 0.0 ? -1.0 : 1.0;
    form.negated[i]  = row.rhs < 0.0;
    form.rhs[i]      = sign * row.rhs;
    form.relation[i] = form.negated[i] ? flip_relation(row.relation) : row.relation;
    for (i_t j = 0; j < n; ++j) {
      const f_t a_ij = sign * row.coefficients[j];
      if (form.split_free) {
        form.A[i * form.num_decision_cols + 2 * j]     = a_ij;
        form.A[i * form.num_decision_cols + 2 * j + 1] = -a_ij;
      } else {
        form.A[i * form.num_decision_cols + j] = a_ij;
      }
    }
  }
  return form;
}

template <typename i_t, typename f_t>
bool needs_artificials(const standard_form_t<i_t, f_t>& form)
{
  for (relation_t relation : form.relation) {
    if (relation != relation_t::LESS_EQUAL) { return true; }
  }
  return false;
}

template <typename i_t, typename f_t>
tableau_t<i_t, f_t> build_initial_tableau(const standard_form_t<i_t, f_t>& form, f_t big_m)
{
  const i_t m = form.num_rows;
  const i_t d = form.num_decision_cols;

  i_t num_logical    = 0;
  i_t num_artificial = 0;
  for (i_t i = 0; i < m; ++i) {
    if (form.relation[i] != relation_t::EQUAL) { ++num_logical; }
    if (form.relation[i] != relation_t::LESS_EQUAL) { ++num_artificial; }
  }

  tableau_t<i_t, f_t> tableau(m, d + num_logical + num_artificial);
  if (num_artificial > 0) { tableau.add_penalty_row(big_m); }
  for (i_t j = 0; j < d; ++j) {
    tableau.column_labels[j] = form.decision_labels[j];
    tableau.column_kinds[j]  = column_kind_t::DECISION;
    if (form.split_free) { tableau.twin[j] = (j % 2 == 0) ? j + 1 : j - 1; }
    tableau(m, j) = -form.objective[j];
  }

  i_t logical_col    = d;
  i_t artificial_col = d + num_logical;
  for (i_t i = 0; i < m; ++i) {
    for (i_t j = 0; j < d; ++j) {
      tableau(i, j) = form.coefficient(i, j);
    }
    tableau.rhs(i) = form.rhs[i];

    const std::string row_id = std::to_string(i + 1);
    switch (form.relation[i]) {
      case relation_t::LESS_EQUAL:
        tableau(i, logical_col)            = 1.0;
        tableau.column_labels[logical_col] = "s" + row_id;
        tableau.column_kinds[logical_col]  = column_kind_t::SLACK;
        tableau.basis[i]                   = logical_col;
        ++logical_col;
        break;
      case relation_t::GREATER_EQUAL:
        tableau(i, logical_col)            = -1.0;
        tableau.column_labels[logical_col] = "e" + row_id;
        tableau.column_kinds[logical_col]  = column_kind_t::SURPLUS;
        ++logical_col;
        [[fallthrough]];
      case relation_t::EQUAL:
        tableau(i, artificial_col)            = 1.0;
        tableau.penalty(artificial_col)       = 1.0;
        tableau.column_labels[artificial_col] = "a" + row_id;
        tableau.column_kinds[artificial_col]  = column_kind_t::ARTIFICIAL;
        tableau.basis[i]                      = artificial_col;
        ++artificial_col;
        break;
    }
  }
  return tableau;
}

template <typename i_t, typename f_t>
std::string describe_standard_form(const optimization_problem_t<i_t, f_t>& problem,
                                   const standard_form_t<i_t, f_t>& form,
                                   const tableau_t<i_t, f_t>& tableau)
{
  std::string text;
  if (!problem.is_maximize()) {
    text += "Minimize Z is solved as maximize -Z; the reported objective is negated back.\n";
  }
  if (form.split_free) {
    for (i_t j = 0; j < problem.get_n_variables(); ++j) {
      const std::string name = problem.get_variable_name(j);
      text += format_string("Free variable %s is written as %s+ - %s-.\n",
                            name.c_str(),
                            name.c_str(),
                            name.c_str());
    }
  }
  for (i_t i = 0; i < form.num_rows; ++i) {
    const std::string row_id = std::to_string(i + 1);
    if (form.negated[i]) {
      text += format_string(
        "Constraint %s has a negative right-hand side and was multiplied by -1 (now %s %s).\n",
        row_id.c_str(),
        relation_to_string(form.relation[i]).c_str(),
        format_value(form.rhs[i]).c_str());
    }
    switch (form.relation[i]) {
      case relation_t::LESS_EQUAL:
        text += "Constraint " + row_id + " (<=): add slack variable s" + row_id + ".\n";
        break;
      case relation_t::GREATER_EQUAL:
        text += "Constraint " + row_id + " (>=): subtract surplus variable e" + row_id +
                " and add artificial variable a" + row_id + ".\n";
        break;
      case relation_t::EQUAL:
        text += "Constraint " + row_id + " (=): add artificial variable a" + row_id + ".\n";
        break;
    }
  }
  text += "Columns:";
  for (i_t j = 0; j < tableau.num_vars(); ++j) {
    text += (j == 0 ? " " : ", ") + tableau.column_labels[j];
  }
  text += ".";
  return text;
}

#if LPTRACE_INSTANTIATE_DOUBLE

template standard_form_t<int, double> to_standard_form(
  const optimization_problem_t<int, double>& problem);

template bool needs_artificials(const standard_form_t<int, double>& form);

template tableau_t<int, double> build_initial_tableau(const standard_form_t<int, double>& form,
                                                      double big_m);

template std::string describe_standard_form(const optimization_problem_t<int, double>& problem,
                                            const standard_form_t<int, double>& form,
                                            const tableau_t<int, double>& tableau);

#endif

}  // namespace lptrace::linear_programming::tableau_simplex
