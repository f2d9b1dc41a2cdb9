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

#include <lptrace/error.hpp>
#include <lptrace/linear_programming/constants.h>
#include <lptrace/linear_programming/solve.hpp>
#include <lptrace/linear_programming/utilities/problem_formatter.hpp>

#include <utilities/logger.hpp>

#include <argparse/argparse.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace lp = lptrace::linear_programming;

namespace {

constexpr int exit_solved          = 0;
constexpr int exit_invalid_problem = 1;
constexpr int exit_unreadable      = 2;

/**
 * @brief Ready made problems to start from, in the lp text format.
 */
const std::map<std::string, std::string>& problem_templates()
{
  static const std::map<std::string, std::string> templates = {
    {"Production Planning",
     "name: Production Planning\n"
     "maximize: 3, 2\n"
     "2, 1 <= 100\n"
     "1, 2 <= 80\n"},
    {"Resource Allocation",
     "name: Resource Allocation\n"
     "maximize: 25, 40\n"
     "4, 3 <= 240\n"
     "2, 6 <= 300\n"},
    {"Diet Problem",
     "name: Diet Problem\n"
     "minimize: 2, 3\n"
     "1, 2 >= 8\n"
     "3, 1 >= 12\n"},
    {"Investment Portfolio",
     "name: Investment Portfolio\n"
     "maximize: 0.08, 0.12\n"
     "1, 1 <= 10000\n"
     "1, 0 >= 3000\n"
     "0, 1 <= 6000\n"},
  };
  return templates;
}

std::string format_number(double value, int precision)
{
  if (std::abs(value) < 1e-12) { value = 0.0; }
  std::ostringstream out;
  out << std::setprecision(precision) << value;
  return out.str();
}

std::string format_fixed(double value)
{
  if (std::abs(value) < 5e-5) { value = 0.0; }
  std::ostringstream out;
  out << std::fixed << std::setprecision(4) << value;
  return out.str();
}

void print_tableau(const lp::tableau_snapshot_t<int, double>& table)
{
  std::vector<std::vector<std::string>> cells(table.num_rows + 1);
  cells[0].push_back("Basis");
  for (const auto& label : table.column_labels) {
    cells[0].push_back(label);
  }
  for (int i = 0; i < table.num_rows; ++i) {
    cells[i + 1].push_back(table.row_labels[i]);
    for (int j = 0; j < table.num_cols; ++j) {
      cells[i + 1].push_back(format_number(table(i, j), 6));
    }
  }

  std::vector<std::size_t> widths(table.num_cols + 1, 0);
  for (const auto& row : cells) {
    for (std::size_t j = 0; j < row.size(); ++j) {
      widths[j] = std::max(widths[j], row[j].size());
    }
  }
  for (const auto& row : cells) {
    std::cout << "  ";
    for (std::size_t j = 0; j < row.size(); ++j) {
      std::cout << (j == 0 ? std::left : std::right) << std::setw(widths[j] + (j == 0 ? 0 : 2))
                << row[j];
    }
    std::cout << std::left << "\n";
  }
}

void print_geometry(const lp::geometry_t<int, double>& geometry)
{
  std::cout << "  Lines:\n";
  for (const auto& line : geometry.lines) {
    std::cout << "    " << line.label << "\n";
  }
  if (!geometry.vertices.empty()) { std::cout << "  Vertices:\n"; }
  for (std::size_t k = 0; k < geometry.vertices.size(); ++k) {
    const auto& vertex = geometry.vertices[k];
    const bool optimal = static_cast<int>(k) == geometry.optimal_vertex;
    std::cout << "    " << (optimal ? "* " : "  ") << "V" << k + 1 << " ("
              << format_number(vertex.x1, 6) << ", " << format_number(vertex.x2, 6)
              << ")  Z = " << format_number(vertex.objective, 6) << "\n";
  }
  if (geometry.ray_origin.has_value() && geometry.ray_direction.has_value()) {
    std::cout << "  Unbounded ray from (" << format_number(geometry.ray_origin->first, 6) << ", "
              << format_number(geometry.ray_origin->second, 6) << ") along ("
              << format_number(geometry.ray_direction->first, 6) << ", "
              << format_number(geometry.ray_direction->second, 6) << ")\n";
  }
}

void print_solution(const lp::solution_t<int, double>& solution)
{
  int step_number = 1;
  for (const auto& step : solution.steps) {
    std::cout << "\nStep " << step_number++ << ": " << step.title << "\n";
    std::cout << step.explanation << "\n";
    if (step.table.has_value()) { print_tableau(*step.table); }
    if (step.geometry.has_value()) { print_geometry(*step.geometry); }
  }

  std::cout << "\nStatus: " << solution.get_status_string() << "\n";
  if (!solution.is_optimal()) {
    std::cout << solution.message << "\n";
    return;
  }
  for (const auto& [name, value] : solution.variables) {
    std::cout << "  " << name << " = " << format_fixed(value) << "\n";
  }
  std::cout << "  Z = " << format_fixed(solution.objective_value.value_or(0.0)) << "\n";
  std::cout << "Binding constraints: " << solution.binding_constraints() << " of "
            << solution.constraint_slacks.size() << "\n";
  if (solution.degenerate) { std::cout << "The optimal solution is degenerate.\n"; }
  if (solution.alternative_optima) { std::cout << "The problem has alternative optima.\n"; }
}

std::optional<lp::method_t> method_from_string(const std::string& name)
{
  if (name == "simplex") { return lp::method_t::SIMPLEX; }
  if (name == "big-m") { return lp::method_t::BIG_M; }
  if (name == "graphical") { return lp::method_t::GRAPHICAL; }
  return std::nullopt;
}

}  // namespace

int main(int argc, char* argv[])
{
  argparse::ArgumentParser program("lptrace_cli", "0.1.0");
  program.add_description("Solves a small linear program and prints every step of the solution.");
  program.add_argument("problem")
    .help("problem file in the lp text format")
    .default_value(std::string(""))
    .nargs(argparse::nargs_pattern::optional);
  program.add_argument("--template")
    .help(
      "start from a ready made problem: \"Production Planning\", \"Resource Allocation\", "
      "\"Diet Problem\" or \"Investment Portfolio\"")
    .default_value(std::string(""));
  program.add_argument("--method")
    .help("simplex, big-m, graphical or auto")
    .default_value(std::string("auto"));
  program.add_argument("--param")
    .help("solver parameter as Name=Value, may be repeated")
    .default_value(std::vector<std::string>{})
    .append();
  program.add_argument("--log-file").help("path of the log file").default_value(std::string(""));
  program.add_argument("--quiet")
    .help("do not log to the console")
    .default_value(false)
    .implicit_value(true);

  try {
    program.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << program;
    return exit_invalid_problem;
  }

  const std::string file_name     = program.get<std::string>("problem");
  const std::string template_name = program.get<std::string>("--template");
  const std::string method_name   = program.get<std::string>("--method");

  if (file_name.empty() == template_name.empty()) {
    std::cerr << "Give either a problem file or --template" << std::endl;
    std::cerr << program;
    return exit_invalid_problem;
  }

  lp::solver_settings_t<int, double> settings;
  try {
    for (const auto& param : program.get<std::vector<std::string>>("--param")) {
      const auto equal = param.find('=');
      if (equal == std::string::npos) {
        std::cerr << "Parameter '" << param << "' is not of the form Name=Value" << std::endl;
        return exit_invalid_problem;
      }
      settings.set_parameter_from_string(param.substr(0, equal), param.substr(equal + 1));
    }
    const std::string log_file = program.get<std::string>("--log-file");
    if (!log_file.empty()) { settings.set_parameter_from_string(LPTRACE_LOG_FILE, log_file); }
    if (program.get<bool>("--quiet")) { settings.set_log_to_console(false); }
  } catch (const lptrace::logic_error& e) {
    std::cerr << e.what() << std::endl;
    return exit_invalid_problem;
  }

  lptrace::init_logger_t log(settings.get_log_file(), settings.get_log_to_console());

  lptrace::lp_parser::lp_data_model_t<int, double> model;
  if (!file_name.empty()) {
    if (!std::ifstream(file_name).good()) {
      std::cerr << "Cannot read problem file " << file_name << std::endl;
      return exit_unreadable;
    }
    try {
      model = lptrace::lp_parser::parse_lp<int, double>(file_name);
    } catch (const lptrace::logic_error& e) {
      std::cerr << "Problem file error: " << e.what() << std::endl;
      return exit_invalid_problem;
    }
  } else {
    const auto& templates = problem_templates();
    const auto found      = templates.find(template_name);
    if (found == templates.end()) {
      std::cerr << "Unknown template '" << template_name << "'" << std::endl;
      return exit_invalid_problem;
    }
    model = lptrace::lp_parser::parse_lp_string<int, double>(found->second);
  }

  try {
    const auto problem = lptrace::lp_parser::to_optimization_problem(model);

    lp::method_t method = lp::recommend_method(problem);
    if (method_name != "auto") {
      const auto chosen = method_from_string(method_name);
      if (!chosen.has_value()) {
        std::cerr << "Unknown method '" << method_name << "'" << std::endl;
        return exit_invalid_problem;
      }
      method = *chosen;
    }

    if (!model.get_problem_name().empty()) { std::cout << model.get_problem_name() << "\n"; }
    std::cout << lp::format_problem(problem) << "\n";
    std::cout << "Method: " << lp::method_to_string(method) << "\n";

    const auto solution = lp::solve(problem, method, settings);
    print_solution(solution);
  } catch (const lptrace::logic_error& e) {
    std::cerr << "Cannot solve: " << e.what() << std::endl;
    return exit_invalid_problem;
  }
  return exit_solved;
}
