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

#include <linear_programming/utilities/step_trace.hpp>

#include <utilities/logger.hpp>

#include <utility>

namespace lptrace::linear_programming {

template <typename i_t, typename f_t>
void step_trace_t<i_t, f_t>::add_step(std::string title, std::string explanation)
{
  step_t<i_t, f_t> step;
  step.title       = std::move(title);
  step.explanation = std::move(explanation);
  push(std::move(step));
}

template <typename i_t, typename f_t>
void step_trace_t<i_t, f_t>::add_step(std::string title,
                                      std::string explanation,
                                      std::optional<tableau_snapshot_t<i_t, f_t>> table)
{
  step_t<i_t, f_t> step;
  step.title       = std::move(title);
  step.explanation = std::move(explanation);
  if (record_tableaux_) { step.table = std::move(table); }
  push(std::move(step));
}

template <typename i_t, typename f_t>
void step_trace_t<i_t, f_t>::add_step(std::string title,
                                      std::string explanation,
                                      geometry_t<i_t, f_t> geometry)
{
  step_t<i_t, f_t> step;
  step.title       = std::move(title);
  step.explanation = std::move(explanation);
  step.geometry    = std::move(geometry);
  push(std::move(step));
}

template <typename i_t, typename f_t>
std::vector<step_t<i_t, f_t>> step_trace_t<i_t, f_t>::release()
{
  std::vector<step_t<i_t, f_t>> steps;
  steps.swap(steps_);
  return steps;
}

template <typename i_t, typename f_t>
void step_trace_t<i_t, f_t>::push(step_t<i_t, f_t>&& step)
{
  LPTRACE_LOG_TRACE("Step %d: %s", static_cast<int>(steps_.size()) + 1, step.title.c_str());
  steps_.push_back(std::move(step));
}

#if LPTRACE_INSTANTIATE_DOUBLE
template class step_trace_t<int, double>;
#endif

}  // namespace lptrace::linear_programming
