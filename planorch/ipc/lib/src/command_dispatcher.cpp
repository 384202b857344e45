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
 * @file command_dispatcher.cpp
 * @brief Maps control commands onto an orchestration loop
 */

#include <algorithm>   // for min
#include <array>       // for array
#include <cstddef>     // for size_t
#include <cstdint>     // for int64_t, uint32_t, uint64_t
#include <format>      // for format
#include <optional>    // for optional, nullopt
#include <string>      // for string
#include <string_view> // for string_view
#include <utility>     // for pair, move

#include <nlohmann/json.hpp>
#include <quill/LogMacros.h>
#include <wise_enum.h>

#include "engine/engine_errors.hpp"
#include "engine/event.hpp"
#include "engine/orchestrator_types.hpp"
#include "ipc/command_dispatcher.hpp"
#include "ipc/ipc_log.hpp"
#include "ipc/protocol.hpp"
#include "log/planorch_log_macros.hpp"

namespace planorch::ipc {

namespace {

namespace pe = planorch::engine;

constexpr std::array<std::pair<Command, std::string_view>, 11> COMMAND_NAMES{{
        {Command::Status, "status"},
        {Command::Ping, "ping"},
        {Command::Pause, "pause"},
        {Command::Resume, "resume"},
        {Command::Cancel, "cancel"},
        {Command::Shutdown, "shutdown"},
        {Command::SetBatchSize, "setBatchSize"},
        {Command::RetryTask, "retryTask"},
        {Command::SkipTask, "skipTask"},
        {Command::ExtendTask, "extendTask"},
        {Command::Events, "events"},
}};

static_assert(COMMAND_NAMES.size() == ::wise_enum::size<Command>);

/// Parsed lines hold unsigned numbers, JSON built in code holds signed ones
bool is_non_negative_integer(const nlohmann::json &value) {
    return value.is_number_unsigned() ||
           (value.is_number_integer() && value.get<std::int64_t>() >= 0);
}

pe::Result<std::string> task_id_of(const nlohmann::json &payload) {
    const auto it = payload.find("taskId");
    if (it == payload.end() || !it->is_string() || it->get<std::string>().empty()) {
        return pe::make_error(pe::OrchErrc::InvalidParameter, "payload.taskId must be a task id");
    }
    return it->get<std::string>();
}

pe::Result<std::uint64_t>
unsigned_of(const nlohmann::json &payload, const char *key, const std::uint64_t fallback) {
    const auto it = payload.find(key);
    if (it == payload.end() || it->is_null()) {
        return fallback;
    }
    if (!is_non_negative_integer(*it)) {
        return pe::make_error(
                pe::OrchErrc::InvalidParameter,
                std::format("payload.{} must be a non-negative integer", key));
    }
    return it->get<std::uint64_t>();
}

} // namespace

std::string_view to_wire(const Command command) noexcept {
    for (const auto &[entry, name] : COMMAND_NAMES) {
        if (entry == command) {
            return name;
        }
    }
    return "unknown";
}

std::optional<Command> command_from_wire(const std::string_view name) noexcept {
    for (const auto &[entry, wire] : COMMAND_NAMES) {
        if (wire == name) {
            return entry;
        }
    }
    return std::nullopt;
}

CommandDispatcher::CommandDispatcher(
        DispatcherConfig config, pe::IControlTarget &target, pe::EventBus *events)
        : config_{config}, target_{target}, events_{events} {
    if (config_.control_timeout.count() <= 0) {
        log_and_throw(IpcLog::Dispatcher, "Control timeout must be positive");
    }
}

pe::Result<nlohmann::json>
CommandDispatcher::dispatch(const std::string_view command, const nlohmann::json &payload) {
    const auto parsed = command_from_wire(command);
    if (!parsed.has_value()) {
        return pe::make_error(
                pe::OrchErrc::UnknownCommand, std::format("unknown command '{}'", command));
    }

    switch (*parsed) {
    case Command::Status:
        return pe::status_to_json(target_.status());

    case Command::Ping:
        return nlohmann::json{{"pong", true}, {"protocolVersion", PROTOCOL_VERSION}};

    case Command::Pause:
        return control({.kind = pe::ControlKind::Pause});

    case Command::Resume:
        return control({.kind = pe::ControlKind::Resume});

    case Command::Cancel:
    case Command::Shutdown:
        return control({.kind = pe::ControlKind::Cancel});

    case Command::SetBatchSize: {
        const auto it = payload.find("n");
        if (it == payload.end() || !is_non_negative_integer(*it)) {
            return pe::make_error(
                    pe::OrchErrc::InvalidParameter, "payload.n must be a positive integer");
        }
        const auto requested = it->get<std::uint64_t>();
        if (requested == 0 || requested > pe::OrchestratorConfig::MAX_BATCH_SIZE) {
            return pe::make_error(
                    pe::OrchErrc::InvalidParameter,
                    std::format(
                            "batch size {} is outside 1..{}",
                            requested,
                            pe::OrchestratorConfig::MAX_BATCH_SIZE));
        }
        return control(
                {.kind = pe::ControlKind::SetBatchSize,
                 .task_id = {},
                 .batch_size = static_cast<std::uint32_t>(requested)});
    }

    case Command::RetryTask:
    case Command::SkipTask:
    case Command::ExtendTask: {
        auto task_id = task_id_of(payload);
        if (!task_id) {
            return tl::unexpected(task_id.error());
        }
        const auto kind = *parsed == Command::RetryTask  ? pe::ControlKind::RetryTask
                          : *parsed == Command::SkipTask ? pe::ControlKind::SkipTask
                                                         : pe::ControlKind::ExtendTask;
        return control({.kind = kind, .task_id = std::move(*task_id)});
    }

    case Command::Events:
        return events(payload);
    }
    return pe::make_error(
            pe::OrchErrc::UnknownCommand, std::format("unhandled command '{}'", command));
}

pe::Result<nlohmann::json> CommandDispatcher::control(pe::ControlCommand command) {
    const auto kind = command.kind;
    const auto pending = target_.submit(std::move(command));
    if (auto outcome = pending->wait_for(config_.control_timeout); outcome.has_value()) {
        return std::move(*outcome);
    }
    if (pending->try_abandon()) {
        PLANORCH_LOGEC_WARN(
                IpcLog::Dispatcher,
                IpcEvent::RequestTimedOut,
                "{} not applied within {} ms, abandoned",
                ::wise_enum::to_string(kind),
                config_.control_timeout.count());
        return pe::make_error(
                pe::OrchErrc::IpcTimeout,
                std::format(
                        "command not applied within {} ms", config_.control_timeout.count()));
    }
    // Claimed just before the deadline: the loop is applying it
    return pending->wait();
}

pe::Result<nlohmann::json> CommandDispatcher::events(const nlohmann::json &payload) const {
    if (events_ == nullptr) {
        return pe::make_error(pe::OrchErrc::NotRunning, "no event bus attached");
    }
    const auto since = unsigned_of(payload, "sinceId", 0);
    if (!since) {
        return tl::unexpected(since.error());
    }
    const auto limit = unsigned_of(payload, "limit", DispatcherConfig::DEFAULT_EVENTS_LIMIT);
    if (!limit) {
        return tl::unexpected(limit.error());
    }

    const auto capped = std::min<std::uint64_t>(*limit, DispatcherConfig::MAX_EVENTS_LIMIT);
    auto list = nlohmann::json::array();
    for (const auto &event : events_->recent(*since, static_cast<std::size_t>(capped))) {
        list.push_back(pe::event_to_json(event));
    }
    return nlohmann::json{{"events", std::move(list)}, {"lastId", events_->last_id()}};
}

} // namespace planorch::ipc
