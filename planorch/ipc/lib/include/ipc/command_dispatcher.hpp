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

/**
 * @file command_dispatcher.hpp
 * @brief Maps control commands onto an orchestration loop
 */

#ifndef PLANORCH_IPC_COMMAND_DISPATCHER_HPP
#define PLANORCH_IPC_COMMAND_DISPATCHER_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include <nlohmann/json.hpp>
#include <wise_enum.h>

#include "engine/engine_errors.hpp"
#include "engine/event_bus.hpp"
#include "engine/icontrol_target.hpp"
#include "engine/orchestrator_types.hpp"
#include "engine/time.hpp"

namespace planorch::ipc {

/**
 * Commands understood by the control surface
 */
enum class Command : std::uint8_t {
    Status,       //!< Loop status from the status cache
    Ping,         //!< Liveness check
    Pause,        //!< Stop new dispatch
    Resume,       //!< Resume dispatch
    Cancel,       //!< End the run once in-flight tasks finish
    Shutdown,     //!< Alias of Cancel
    SetBatchSize, //!< {n}
    RetryTask,    //!< {taskId}
    SkipTask,     //!< {taskId}
    ExtendTask,   //!< {taskId}
    Events        //!< {sinceId, limit}
};

} // namespace planorch::ipc

WISE_ENUM_ADAPT(
        planorch::ipc::Command,
        Status,
        Ping,
        Pause,
        Resume,
        Cancel,
        Shutdown,
        SetBatchSize,
        RetryTask,
        SkipTask,
        ExtendTask,
        Events)

namespace planorch::ipc {

/**
 * Get the wire name of a command, e.g. "setBatchSize"
 */
[[nodiscard]] std::string_view to_wire(Command command) noexcept;

/**
 * Parse a wire command name
 *
 * @return Command, or std::nullopt if the name is unknown
 */
[[nodiscard]] std::optional<Command> command_from_wire(std::string_view name) noexcept;

/**
 * Dispatcher configuration
 */
struct DispatcherConfig final {
    static constexpr engine::Millis DEFAULT_CONTROL_TIMEOUT{5000};
    static constexpr std::size_t DEFAULT_EVENTS_LIMIT = 100;
    static constexpr std::size_t MAX_EVENTS_LIMIT = 1000;

    engine::Millis control_timeout{DEFAULT_CONTROL_TIMEOUT}; //!< Wait for the loop to claim a command
};

/**
 * @class CommandDispatcher
 * @brief Executes decoded commands against a control target
 *
 * Control commands are queued on the target and waited for up to the
 * control timeout. A command the loop has not claimed by then is abandoned,
 * so it is never applied, and the caller receives IpcTimeout. A command
 * claimed before the deadline is always waited for. Thread-safe.
 */
class CommandDispatcher final {
public:
    /**
     * @param[in] config Timeouts
     * @param[in] target Loop receiving control commands; must outlive the dispatcher
     * @param[in] events Event bus for the events command; nullptr disables it
     * @throws std::invalid_argument if the control timeout is not positive
     */
    CommandDispatcher(
            DispatcherConfig config, engine::IControlTarget &target, engine::EventBus *events);

    /**
     * Execute one command
     *
     * @param[in] command Wire command name
     * @param[in] payload Command payload object
     * @return Result data, or UnknownCommand, InvalidParameter, IpcTimeout,
     *         or the error reported by the loop
     */
    [[nodiscard]] engine::Result<nlohmann::json>
    dispatch(std::string_view command, const nlohmann::json &payload);

private:
    [[nodiscard]] engine::Result<nlohmann::json> control(engine::ControlCommand command);
    [[nodiscard]] engine::Result<nlohmann::json> events(const nlohmann::json &payload) const;

    DispatcherConfig config_;
    engine::IControlTarget &target_;
    engine::EventBus *events_;
};

} // namespace planorch::ipc

#endif // PLANORCH_IPC_COMMAND_DISPATCHER_HPP
