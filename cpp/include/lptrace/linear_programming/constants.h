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

#ifndef LPTRACE_CONSTANTS_H
#define LPTRACE_CONSTANTS_H

#ifdef __cplusplus
#include <limits>
#else
#include <math.h>
#endif

#define LPTRACE_INSTANTIATE_FLOAT  0
#define LPTRACE_INSTANTIATE_DOUBLE 1

/* @brief Solver parameter string constants */
#define LPTRACE_PIVOT_TOLERANCE       "PivotTolerance"
#define LPTRACE_FEASIBILITY_TOLERANCE "FeasibilityTolerance"
#define LPTRACE_BIG_M_SCALE           "BigMScale"
#define LPTRACE_BIG_M_VALUE           "BigMValue"
#define LPTRACE_ITERATION_LIMIT       "IterationLimit"
#define LPTRACE_RECORD_TABLEAUX       "RecordTableaux"
#define LPTRACE_LOG_TO_CONSOLE        "LogToConsole"
#define LPTRACE_LOG_FILE              "LogFile"

/* @brief Solve status constants */
#define LPTRACE_STATUS_OPTIMAL    0
#define LPTRACE_STATUS_UNBOUNDED  1
#define LPTRACE_STATUS_INFEASIBLE 2
#define LPTRACE_STATUS_ERROR      3

/* @brief The objective sense constants */
#define LPTRACE_MAXIMIZE 1
#define LPTRACE_MINIMIZE -1

/* @brief The constraint relation constants */
#define LPTRACE_LESS_EQUAL    'L'
#define LPTRACE_GREATER_EQUAL 'G'
#define LPTRACE_EQUAL         'E'

/* @brief The solution method constants */
#define LPTRACE_METHOD_SIMPLEX   0
#define LPTRACE_METHOD_BIG_M     1
#define LPTRACE_METHOD_GRAPHICAL 2

/* @brief Automatic iteration limit: this many pivots per tableau row and column */
#define LPTRACE_ITERATION_LIMIT_FACTOR 50

/* @brief The infinity constant */
#ifdef __cplusplus
#define LPTRACE_INFINITY std::numeric_limits<double>::infinity()
#else
#define LPTRACE_INFINITY INFINITY
#endif

#endif  // LPTRACE_CONSTANTS_H
