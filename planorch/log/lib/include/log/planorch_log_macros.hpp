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

#ifndef PLANORCH_LOG_PLANORCH_LOG_MACROS_HPP
#define PLANORCH_LOG_PLANORCH_LOG_MACROS_HPP

#include <quill/LogMacros.h>

#include "log/planorch_log.hpp"

// NOLINTBEGIN(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while,clang-diagnostic-gnu-zero-variadic-macro-arguments)

#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wgnu-zero-variadic-macro-arguments"
#endif

/**
 * Get the process Quill logger
 */
#define PLANORCH_GET_LOGGER() ::planorch::log::detail::get_quill_logger()

/**
 * Helper macro for component logging
 *
 * Checks the component level before formatting anything.
 *
 * @param level_enum planorch log level enum
 * @param quill_level Corresponding Quill log level
 * @param component Component to log for
 * @param message Log message format string
 * @param ... Format arguments
 */
#define PLANORCH_LOGC_HELPER(level_enum, quill_level, component, message, ...)                     \
    do {                                                                                           \
        if (::planorch::log::ComponentLevelStorage<decltype(component)>::should_log(               \
                    component, ::planorch::log::LogLevel::level_enum)) {                           \
            QUILL_LOG_##quill_level(                                                               \
                    PLANORCH_GET_LOGGER(),                                                         \
                    "[{}] " message,                                                               \
                    ::planorch::log::format_component_name(component),                             \
                    ##__VA_ARGS__);                                                                \
        }                                                                                          \
    } while (0)

/**
 * Helper macro for event+component logging
 *
 * @param level_enum planorch log level enum
 * @param quill_level Corresponding Quill log level
 * @param component Component to log for
 * @param event wise_enum event value being logged
 * @param message Log message format string
 * @param ... Format arguments
 */
#define PLANORCH_LOGEC_HELPER(level_enum, quill_level, component, event, message, ...)             \
    do {                                                                                           \
        if (::planorch::log::ComponentLevelStorage<decltype(component)>::should_log(               \
                    component, ::planorch::log::LogLevel::level_enum)) {                           \
            QUILL_LOG_##quill_level(                                                               \
                    PLANORCH_GET_LOGGER(),                                                         \
                    "[{}] EVENT [{}] " message,                                                    \
                    ::planorch::log::format_component_name(component),                             \
                    ::planorch::log::format_component_name(event),                                 \
                    ##__VA_ARGS__);                                                                \
        }                                                                                          \
    } while (0)

#define PLANORCH_LOG_TRACE_L1(fmt, ...) QUILL_LOG_TRACE_L1(PLANORCH_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define PLANORCH_LOGC_TRACE_L1(c, m, ...)                                                          \
    PLANORCH_LOGC_HELPER(TraceL1, TRACE_L1, c, m, ##__VA_ARGS__)

#define PLANORCH_LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(PLANORCH_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define PLANORCH_LOGC_DEBUG(c, m, ...) PLANORCH_LOGC_HELPER(Debug, DEBUG, c, m, ##__VA_ARGS__)
#define PLANORCH_LOGEC_DEBUG(c, e, m, ...)                                                         \
    PLANORCH_LOGEC_HELPER(Debug, DEBUG, c, e, m, ##__VA_ARGS__)

#define PLANORCH_LOG_INFO(fmt, ...) QUILL_LOG_INFO(PLANORCH_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define PLANORCH_LOGC_INFO(c, m, ...) PLANORCH_LOGC_HELPER(Info, INFO, c, m, ##__VA_ARGS__)
#define PLANORCH_LOGEC_INFO(c, e, m, ...) PLANORCH_LOGEC_HELPER(Info, INFO, c, e, m, ##__VA_ARGS__)

#define PLANORCH_LOG_NOTICE(fmt, ...) QUILL_LOG_NOTICE(PLANORCH_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define PLANORCH_LOGC_NOTICE(c, m, ...) PLANORCH_LOGC_HELPER(Notice, NOTICE, c, m, ##__VA_ARGS__)

#define PLANORCH_LOG_WARN(fmt, ...) QUILL_LOG_WARNING(PLANORCH_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define PLANORCH_LOGC_WARN(c, m, ...) PLANORCH_LOGC_HELPER(Warn, WARNING, c, m, ##__VA_ARGS__)
#define PLANORCH_LOGEC_WARN(c, e, m, ...)                                                          \
    PLANORCH_LOGEC_HELPER(Warn, WARNING, c, e, m, ##__VA_ARGS__)

#define PLANORCH_LOG_ERROR(fmt, ...) QUILL_LOG_ERROR(PLANORCH_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define PLANORCH_LOGC_ERROR(c, m, ...) PLANORCH_LOGC_HELPER(Error, ERROR, c, m, ##__VA_ARGS__)
#define PLANORCH_LOGEC_ERROR(c, e, m, ...)                                                         \
    PLANORCH_LOGEC_HELPER(Error, ERROR, c, e, m, ##__VA_ARGS__)

#define PLANORCH_LOG_CRITICAL(fmt, ...)                                                            \
    QUILL_LOG_CRITICAL(PLANORCH_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define PLANORCH_LOGC_CRITICAL(c, m, ...)                                                          \
    PLANORCH_LOGC_HELPER(Critical, CRITICAL, c, m, ##__VA_ARGS__)

#ifdef __clang__
#pragma clang diagnostic pop
#endif

// NOLINTEND(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while,clang-diagnostic-gnu-zero-variadic-macro-arguments)

#endif // PLANORCH_LOG_PLANORCH_LOG_MACROS_HPP
