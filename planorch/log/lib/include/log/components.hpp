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

#ifndef PLANORCH_LOG_COMPONENTS_HPP
#define PLANORCH_LOG_COMPONENTS_HPP

#include <array>
#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string_view>
#include <unordered_map>

#include <wise_enum.h>

namespace planorch::log {

/**
 * Severity levels for the planorch logger
 *
 * Ordered from most verbose to most critical. Used by the global logger and
 * by the per-component filters.
 */
enum class LogLevel {
    TraceL1, //!< Fine-grained tracing (scheduler decisions, lock polling)
    Debug,   //!< Debug messages
    Info,    //!< Informational messages
    Notice,  //!< Notable state transitions
    Warn,    //!< Recoverable problems (stuck tasks, dropped events)
    Error,   //!< Failed operations
    Critical //!< Unrecoverable failures
};

} // namespace planorch::log

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(planorch::log::LogLevel, TraceL1, Debug, Info, Notice, Warn, Error, Critical)

namespace planorch::log {

/**
 * Get the default log level for new components
 *
 * @return Default log level (Info)
 */
[[nodiscard]] LogLevel get_logger_default_level();

/**
 * Parse a log level name
 *
 * Accepts the wise_enum names ("Debug", "Warn", ...) and their lower-case
 * spellings ("debug", "warn", ...).
 *
 * @param[in] name Level name
 * @return Parsed level, or std::nullopt when the name is unknown
 */
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

/**
 * Name lookup for contiguous wise_enum types
 *
 * @note Requires enum values to be contiguous starting from 0
 * @tparam EnumType The enum type to create registry for
 */
template <typename EnumType> struct EnumRegistry final {
private:
    static constexpr std::size_t NUM_VALUES = ::wise_enum::size<EnumType>;

    static const std::array<std::string_view, NUM_VALUES> &get_name_table() {
        static const std::array<std::string_view, NUM_VALUES> table = [] {
            std::array<std::string_view, NUM_VALUES> names{};
            std::size_t idx = 0;
            for (auto value_and_name : ::wise_enum::range<EnumType>) {
                // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
                names[idx] = std::string_view{value_and_name.name.data(), value_and_name.name.size()};
                ++idx;
            }
            return names;
        }();
        return table;
    }

public:
    /**
     * Get string name for enum value
     *
     * @param[in] value Enum value to get name for
     * @return String view of enum name, or "UNKNOWN" if out of range
     */
    static std::string_view get_name(const EnumType value) {
        const auto idx = static_cast<std::size_t>(value);
        return (idx < NUM_VALUES)
                       // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
                       ? get_name_table()[idx]
                       : std::string_view{"UNKNOWN"};
    }
};

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/**
 * Declare a log component enum with specified values
 *
 * @param ComponentType Name of the component enum type
 * @param ... List of component values
 */
#define DECLARE_LOG_COMPONENT(ComponentType, ...) WISE_ENUM_CLASS(ComponentType, __VA_ARGS__)

/**
 * Declare a log event enum with specified values
 *
 * Events name what happened and are logged with the PLANORCH_LOGEC_* macros.
 *
 * @param EventType Name of the event enum type
 * @param ... List of event values
 */
#define DECLARE_LOG_EVENT(EventType, ...) WISE_ENUM_CLASS(EventType, __VA_ARGS__)

// NOLINTEND(cppcoreguidelines-macro-usage)

/**
 * Per-component log level storage
 *
 * One atomic level slot per enum value, indexed directly so the check in the
 * logging macros stays a single load. Levels may be changed at runtime from
 * any thread (e.g. by the daemon's configuration reload).
 *
 * @tparam ComponentType The component enum type
 */
template <typename ComponentType> class ComponentLevelStorage final {
private:
    static constexpr std::size_t NUM_COMPONENTS = ::wise_enum::size<ComponentType>;
    static std::array<std::atomic<LogLevel>, NUM_COMPONENTS> levels; //!< Per-component levels
    static std::once_flag init_flag;                                 //!< Initialization guard

public:
    /**
     * Initialize every component with the default level
     */
    static void initialize() {
        std::call_once(init_flag, []() {
            const LogLevel default_level = get_logger_default_level();
            for (auto &level : levels) {
                level.store(default_level, std::memory_order_relaxed);
            }
        });
    }

    /**
     * Get the current log level for a component
     *
     * @param[in] component Component to query
     * @return Current log level for the component
     */
    static LogLevel get_level(ComponentType component) {
        initialize();
        const auto idx = static_cast<std::size_t>(component);
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
        return levels[idx].load(std::memory_order_relaxed);
    }

    /**
     * Set log level for a specific component
     *
     * @param[in] component Component to configure
     * @param[in] level New log level for the component
     */
    static void set_level(ComponentType component, LogLevel level) {
        initialize();
        const auto idx = static_cast<std::size_t>(component);
        if (idx < NUM_COMPONENTS) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
            levels[idx].store(level, std::memory_order_relaxed);
        }
    }

    /**
     * Check if a message should be logged for a component
     *
     * @param[in] component Component being logged to
     * @param[in] message_level Log level of the message
     * @return true if message should be logged
     */
    static bool should_log(ComponentType component, LogLevel message_level) {
        initialize();
        const auto idx = static_cast<std::size_t>(component);
        if (idx >= NUM_COMPONENTS) {
            return message_level >= get_logger_default_level();
        }
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
        return message_level >= levels[idx].load(std::memory_order_relaxed);
    }

    /**
     * Set the same log level for all components
     *
     * @param[in] level Log level to apply to all components
     */
    static void set_all_levels(LogLevel level) {
        initialize();
        for (auto &slot : levels) {
            slot.store(level, std::memory_order_relaxed);
        }
    }
};

template <typename ComponentType>
std::array<std::atomic<LogLevel>, ComponentLevelStorage<ComponentType>::NUM_COMPONENTS>
        ComponentLevelStorage<ComponentType>::levels;

template <typename ComponentType> std::once_flag ComponentLevelStorage<ComponentType>::init_flag;

/**
 * Get string representation of a component or event enum value
 *
 * @tparam EnumType Component or event enum type
 * @param[in] value Enum value
 * @return String view of the enum name
 */
template <typename EnumType> std::string_view format_component_name(EnumType value) {
    return EnumRegistry<EnumType>::get_name(value);
}

/**
 * Register components with individual log levels
 *
 * @tparam ComponentType Component enum type
 * @param[in] component_levels Map of components to their log levels
 */
template <typename ComponentType>
void register_component(const std::unordered_map<ComponentType, LogLevel> &component_levels) {
    ComponentLevelStorage<ComponentType>::initialize();
    for (const auto &[component, level] : component_levels) {
        ComponentLevelStorage<ComponentType>::set_level(component, level);
    }
}

/**
 * Register all components with the same log level
 *
 * @tparam ComponentType Component enum type
 * @param[in] level Log level to assign to all components
 */
template <typename ComponentType> void register_component(LogLevel level) {
    ComponentLevelStorage<ComponentType>::set_all_levels(level);
}

/**
 * Get the current log level for a specific component
 *
 * @tparam ComponentType Component enum type
 * @param[in] component Component to query
 * @return Current log level for the component
 */
template <typename ComponentType>
[[nodiscard]] LogLevel get_component_level(ComponentType component) {
    return ComponentLevelStorage<ComponentType>::get_level(component);
}

} // namespace planorch::log

#endif // PLANORCH_LOG_COMPONENTS_HPP
