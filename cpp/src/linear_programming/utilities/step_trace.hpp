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

#include <lptrace/linear_programming/solver_solution.hpp>

#include <optional>
#include <string>
#include <vector>

namespace lptrace::linear_programming {

/**
 * @brief Append-only recorder for the steps of a solve.
 *
 * Every step owns copies of its table and geometry. The recorder is owned by a single solve and
 * its steps are moved into the solution when the solve terminates.
 */
template <typename i_t, typename f_t>
class step_trace_t {
 public:
  explicit step_trace_t(bool record_tableaux) : record_tableaux_(record_tableaux) {}

  step_trace_t(const step_trace_t&)            = delete;
  step_trace_t& operator=(const step_trace_t&) = delete;

  // Tableau snapshots are dropped when RecordTableaux is off
  bool records_tableaux() const { return record_tableaux_; }

  void add_step(std::string title, std::string explanation);
  void add_step(std::string title,
                std::string explanation,
                std::optional<tableau_snapshot_t<i_t, f_t>> table);
  void add_step(std::string title, std::string explanation, geometry_t<i_t, f_t> geometry);

  i_t size() const { return static_cast<i_t>(steps_.size()); }
  const step_t<i_t, f_t>& back() const { return steps_.back(); }

  /** @return the recorded steps, leaving the recorder empty */
  std::vector<step_t<i_t, f_t>> release();

 private:
  void push(step_t<i_t, f_t>&& step);

  bool record_tableaux_;
  std::vector<step_t<i_t, f_t>> steps_;
};

}  // namespace lptrace::linear_programming
