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

#ifndef PLANORCH_ADAPTERS_ADAPTERS_LOG_HPP
#define PLANORCH_ADAPTERS_ADAPTERS_LOG_HPP

#include <format>
#include <stdexcept>
#include <string>
#include <utility>

#include "log/components.hpp"
#include "log/planorch_log_macros.hpp"

namespace planorch::adapters {

/**
 * @brief Declare logging components for the collaborator adapters
 */
DECLARE_LOG_COMPONENT(AdapterLog, Process, Agent, Git, PlanFile);

/**
 * Log error message and throw exception
 *
 * @tparam ExceptionType Exception type to throw (defaults to std::invalid_argument)
 * @tparam Args Variadic template arguments for format string
 * @param[in] component Adapter component for error logging
 * @param[in] format_string Format string for error message
 * @param[in] args Format string arguments
 * @throws ExceptionType with formatted error message
 */
template <typename ExceptionType = std::invalid_argument, typename... Args>
[[noreturn]] void
log_and_throw(AdapterLog component, std::format_string<Args...> format_string, Args &&...args) {
    const std::string error_msg = std::format(format_string, std::forward<Args>(args)...);
    PLANORCH_LOGC_ERROR(component, "{}", error_msg);
    throw ExceptionType(error_msg);
}

} // namespace planorch::adapters

#endif // PLANORCH_ADAPTERS_ADAPTERS_LOG_HPP
