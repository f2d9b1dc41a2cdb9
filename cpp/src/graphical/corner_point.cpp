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

#include <graphical/corner_point.hpp>
#include <graphical/geometry.hpp>

#include <lptrace/error.hpp>

#include <linear_programming/utilities/step_trace.hpp>
#include <utilities/logger.hpp>
#include <utilities/string_utils.hpp>

#include <cmath>

namespace lptrace::linear_programming::graphical {

namespace {

template <typename f_t>
std::string format_point(const point_t<f_t>& p)
{
  return "(" + format_value(p.first) + ", " + format_value(p.second) + ")";
}

template <typename f_t>
point_t<f_t> snap_to_zero(point_t<f_t> p, f_t tol)
{
  if (std::abs(p.first) <= tol) { p.first = 0.0; }
  if (std::abs(p.second) <= tol) { p.second = 0.0; }
  return p;
}

template <typename f_t>
std::vector<f_t> as_vector(const point_t<f_t>& p)
{
  return {p.first, p.second};
}

// Appends p unless it coincides with a vertex already listed
template <typename f_t>
bool add_unique(std::vector<vertex_t<f_t>>& vertices, const point_t<f_t>& p, f_t tol)
{
  for (const auto& v : vertices) {
    if (std::abs(v.x1 - p.first) <= tol * (1.0 + std::abs(p.first)) &&
        std::abs(v.x2 - p.second) <= tol * (1.0 + std::abs(p.second))) {
      return false;
    }
  }
  vertices.push_back({p.first, p.second, 0.0});
  return true;
}

// Names the first constraint violated by x, for the trace
template <typename i_t, typename f_t>
std::string first_violation(const optimization_problem_t<i_t, f_t>& problem,
                            const std::vector<f_t>& x,
                            f_t tol)
{
  if (problem.is_non_negative()) {
    for (i_t j = 0; j < 2; ++j) {
      if (x[j] < -tol) { return problem.get_variable_name(j) + " >= 0"; }
    }
  }
  const auto& constraints = problem.get_constraints();
  for (i_t i = 0; i < problem.get_n_constraints(); ++i) {
    const f_t lhs     = problem.evaluate_row(i, x);
    const f_t rhs     = constraints[i].rhs;
    const f_t row_tol = tol * (1.0 + std::abs(rhs));
    const bool violated =
      (constraints[i].relation == relation_t::LESS_EQUAL && lhs > rhs + row_tol) ||
      (constraints[i].relation == relation_t::GREATER_EQUAL && lhs < rhs - row_tol) ||
      (constraints[i].relation == relation_t::EQUAL && std::abs(lhs - rhs) > row_tol);
    if (violated) { return "C" + std::to_string(i + 1); }
  }
  return std::string();
}

}  // namespace

template <typename i_t, typename f_t>
solution_t<i_t, f_t> solve_corner_points(const optimization_problem_t<i_t, f_t>& problem,
                                         const solver_settings_t<i_t, f_t>& settings)
{
  lptrace_expects(problem.get_n_variables() == 2,
                  error_type_t::ValidationError,
                  "The graphical method needs exactly 2 variables, the problem has %d",
                  problem.get_n_variables());

  const f_t tol       = settings.get_feasibility_tolerance();
  const f_t pivot_tol = settings.get_pivot_tolerance();
  const bool maximize = problem.is_maximize();
  const auto& c       = problem.get_objective();

  step_trace_t<i_t, f_t> trace(settings.get_record_tableaux());
  solution_t<i_t, f_t> solution;

  geometry_t<i_t, f_t> geometry;
  std::vector<i_t> line_rows;
  geometry.lines = constraint_lines(problem, pivot_tol, line_rows);
  geometry.c1    = c[0];
  geometry.c2    = c[1];

  std::string lines_text = "Each constraint is drawn as the line where it holds with equality";
  lines_text += problem.is_non_negative() ? ", together with the axes x1 = 0 and x2 = 0:\n"
                                          : ":\n";
  for (const auto& line : geometry.lines) {
    lines_text += "  " + line.label + "\n";
  }
  if (static_cast<i_t>(line_rows.size()) - (problem.is_non_negative() ? 2 : 0) <
      problem.get_n_constraints()) {
    lines_text += "Constraints with both coefficients zero have no boundary line and are only "
                  "checked for feasibility.\n";
  }
  trace.add_step("Constraint Lines", std::move(lines_text), geometry);

  // Pairwise intersections in line order
  std::string intersections_text;
  const i_t num_lines = static_cast<i_t>(geometry.lines.size());
  for (i_t a = 0; a < num_lines; ++a) {
    for (i_t b = a + 1; b < num_lines; ++b) {
      const auto& la = geometry.lines[a];
      const auto& lb = geometry.lines[b];
      const std::string pair_label = la.label + "  and  " + lb.label;
      point_t<f_t> p;
      if (!intersection(la, lb, pivot_tol, p)) {
        intersections_text += "  " + pair_label + ": parallel, no intersection\n";
        continue;
      }
      p                         = snap_to_zero(p, tol);
      const std::vector<f_t> x  = as_vector(p);
      const std::string verdict = first_violation(problem, x, tol);
      if (!verdict.empty()) {
        intersections_text +=
          "  " + pair_label + ": " + format_point(p) + " violates " + verdict + "\n";
        continue;
      }
      const bool added = add_unique(geometry.vertices, p, tol);
      intersections_text += "  " + pair_label + ": " + format_point(p) +
                            (added ? " is feasible\n" : " is feasible (already listed)\n");
    }
  }

  // A region without corners is bounded by parallel lines only. A bounded optimum then lies on
  // one of them, so the foot of the perpendicular from the origin on each line is a candidate.
  bool corner_free = false;
  if (geometry.vertices.empty() && !problem.is_non_negative()) {
    for (const auto& line : geometry.lines) {
      const f_t norm2      = line.a1 * line.a1 + line.a2 * line.a2;
      const point_t<f_t> p = snap_to_zero(
        point_t<f_t>{line.rhs * line.a1 / norm2, line.rhs * line.a2 / norm2}, tol);
      if (!problem.is_feasible(as_vector(p), tol)) { continue; }
      if (add_unique(geometry.vertices, p, tol)) {
        intersections_text += "  The feasible region has no corner; " + format_point(p) +
                              " is a feasible point of " + line.label + ".\n";
      }
    }
    const point_t<f_t> origin{0.0, 0.0};
    if (geometry.vertices.empty() && problem.is_feasible(as_vector(origin), tol)) {
      geometry.vertices.push_back({0.0, 0.0, 0.0});
      intersections_text += "  The feasible region has no boundary line; (0, 0) is feasible.\n";
    }
    corner_free = !geometry.vertices.empty();
  }

  if (intersections_text.empty()) { intersections_text = "  There are no pairs of lines.\n"; }
  trace.add_step("Intersection Points",
                 "Intersections of every pair of lines, checked against all constraints:\n" +
                   intersections_text,
                 geometry);

  if (geometry.vertices.empty()) {
    solution.status  = solve_status_t::INFEASIBLE;
    solution.message = "The problem is infeasible: no intersection point satisfies every "
                       "constraint, so the feasible region is empty.";
    trace.add_step("Infeasible",
                   "No candidate point survives the feasibility check. The constraints "
                   "contradict each other.",
                   geometry);
    LPTRACE_LOG_INFO("Graphical: infeasible");
    solution.steps = trace.release();
    return solution;
  }

  std::string vertices_text = "Feasible vertices of the region:\n";
  for (std::size_t k = 0; k < geometry.vertices.size(); ++k) {
    vertices_text += format_string("  V%d = %s\n",
                                   static_cast<int>(k + 1),
                                   format_point(point_t<f_t>{geometry.vertices[k].x1,
                                                             geometry.vertices[k].x2})
                                     .c_str());
  }
  trace.add_step("Feasible Vertices", std::move(vertices_text), geometry);

  for (auto& v : geometry.vertices) {
    v.objective = problem.evaluate_objective({v.x1, v.x2});
  }

  point_t<f_t> direction;
  if (improving_recession_direction(problem, geometry.lines, pivot_tol, direction)) {
    i_t best = 0;
    for (i_t k = 1; k < static_cast<i_t>(geometry.vertices.size()); ++k) {
      const f_t z      = geometry.vertices[k].objective;
      const f_t z_best = geometry.vertices[best].objective;
      if (improves(z, z_best, maximize, tol)) { best = k; }
    }
    const point_t<f_t> origin{geometry.vertices[best].x1, geometry.vertices[best].x2};
    direction              = snap_to_zero(direction, pivot_tol);
    geometry.ray_origin    = origin;
    geometry.ray_direction = direction;

    solution.status  = solve_status_t::UNBOUNDED;
    solution.message = format_string(
      "The problem is unbounded: the feasible region extends forever along direction %s and Z %s "
      "without limit.",
      format_point(direction).c_str(),
      maximize ? "increases" : "decreases");
    trace.add_step("Unbounded",
                   format_string("Starting from %s and moving along %s keeps every constraint "
                                 "satisfied while Z keeps %s, so no vertex is optimal.",
                                 format_point(origin).c_str(),
                                 format_point(direction).c_str(),
                                 maximize ? "increasing" : "decreasing"),
                   geometry);
    LPTRACE_LOG_INFO("Graphical: unbounded along (%g, %g)", direction.first, direction.second);
    solution.steps = trace.release();
    return solution;
  }

  i_t best = 0;
  for (i_t k = 0; k < static_cast<i_t>(geometry.vertices.size()); ++k) {
    const auto& v = geometry.vertices[k];
    trace.add_step(format_string("Evaluate Vertex V%d %s",
                                 k + 1,
                                 format_point(point_t<f_t>{v.x1, v.x2}).c_str()),
                   format_string("Z = %s * %s + %s * %s = %s",
                                 format_value(c[0]).c_str(),
                                 format_value(v.x1).c_str(),
                                 format_value(c[1]).c_str(),
                                 format_value(v.x2).c_str(),
                                 format_value(v.objective).c_str()));
    LPTRACE_LOG_DEBUG("Vertex %d (%e, %e) Z %e", k + 1, v.x1, v.x2, v.objective);
    // Keeps the first vertex on ties within tolerance
    if (improves(v.objective, geometry.vertices[best].objective, maximize, tol)) { best = k; }
  }

  const auto& opt  = geometry.vertices[best];
  const f_t z_best = opt.objective;
  i_t num_tied     = 0;
  for (const auto& v : geometry.vertices) {
    if (std::abs(v.objective - z_best) <= tol * (1.0 + std::abs(z_best))) { ++num_tied; }
  }

  i_t lines_through = 0;
  for (const auto& line : geometry.lines) {
    if (on_line(line, point_t<f_t>{opt.x1, opt.x2}, tol)) { ++lines_through; }
  }

  geometry.optimal_vertex = best;
  const std::vector<f_t> x{opt.x1, opt.x2};

  solution.status             = solve_status_t::OPTIMAL;
  solution.variables          = {{problem.get_variable_name(0), opt.x1},
                                 {problem.get_variable_name(1), opt.x2}};
  solution.objective_value    = z_best;
  solution.constraint_slacks  = problem.compute_slacks(x, tol);
  solution.iterations         = static_cast<i_t>(geometry.vertices.size());
  solution.degenerate         = lines_through > 2;
  solution.alternative_optima = num_tied > 1 || corner_free;

  std::string explanation = format_string("The %s value of Z over all vertices is %s at V%d:\n",
                                          maximize ? "largest" : "smallest",
                                          format_value(z_best).c_str(),
                                          best + 1);
  explanation += format_string("x1 = %s\nx2 = %s\nZ = %s",
                               format_value(opt.x1).c_str(),
                               format_value(opt.x2).c_str(),
                               format_value(z_best).c_str());
  if (solution.alternative_optima) {
    explanation += corner_free
                     ? "\nZ is constant along the boundary line through this point, so there "
                       "are alternative optima."
                     : "\nAnother vertex reaches the same value of Z, so every point of the edge "
                       "between them is optimal (alternative optima).";
  }
  if (solution.degenerate) {
    explanation += format_string(
      "\nThe vertex is degenerate: %d boundary lines pass through it.", lines_through);
  }
  trace.add_step("Optimal Vertex", std::move(explanation), geometry);

  LPTRACE_LOG_INFO("Graphical: optimal objective %.6g at (%g, %g)", z_best, opt.x1, opt.x2);
  solution.steps = trace.release();
  return solution;
}

#if LPTRACE_INSTANTIATE_DOUBLE
template solution_t<int, double> solve_corner_points(
  const optimization_problem_t<int, double>& problem,
  const solver_settings_t<int, double>& settings);
#endif

}  // namespace lptrace::linear_programming::graphical
