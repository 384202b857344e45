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

#include <array>       // for array
#include <cstdint>     // for uint64_t
#include <exception>   // for exception
#include <format>      // for format
#include <optional>    // for optional
#include <string>      // for string
#include <string_view> // for string_view
#include <utility>     // for pair

#include <nlohmann/json.hpp>
#include <wise_enum.h>

#include "engine/engine_errors.hpp"
#include "engine/event.hpp"

namespace planorch::engine {

namespace {

constexpr std::array<std::pair<EventType, std::string_view>, 13> WIRE_NAMES{{
        {EventType::PlanInitialized, "plan.initialized"},
        {EventType::TaskStarted, "task.started"},
        {EventType::TaskCompleted, "task.completed"},
        {EventType::TaskFailed, "task.failed"},
        {EventType::TaskRetrying, "task.retrying"},
        {EventType::TaskStuck, "task.stuck"},
        {EventType::TaskSkipped, "task.skipped"},
        {EventType::PhaseCompleted, "phase.completed"},
        {EventType::RunStarted, "run.started"},
        {EventType::RunCompleted, "run.completed"},
        {EventType::ConstraintApplied, "constraint.applied"},
        {EventType::OrchestratorState, "orchestrator.state"},
        {EventType::PolicyApplied, "policy.applied"},
}};

static_assert(
        WIRE_NAMES.size() == ::wise_enum::size<EventType>,
        "Every EventType needs a wire name");

} // namespace

std::string_view to_wire(const EventType type) noexcept {
    for (const auto &[value, name] : WIRE_NAMES) {
        if (value == type) {
            return name;
        }
    }
    return "unknown";
}

std::optional<EventType> event_type_from_wire(const std::string_view name) noexcept {
    for (const auto &[value, wire] : WIRE_NAMES) {
        if (wire == name) {
            return value;
        }
    }
    return std::nullopt;
}

nlohmann::json event_to_json(const Event &event) {
    return nlohmann::json{
            {"id", event.id},
            {"type", to_wire(event.type)},
            {"timestamp", event.timestamp},
            {"payload", event.payload}};
}

Result<Event> event_from_json(const nlohmann::json &json) {
    try {
        const auto type_name = json.at("type").get<std::string>();
        const auto type = event_type_from_wire(type_name);
        if (!type.has_value()) {
            return make_error(
                    OrchErrc::CorruptSnapshot, std::format("unknown event type '{}'", type_name));
        }
        return Event{
                .id = json.at("id").get<std::uint64_t>(),
                .type = *type,
                .timestamp = json.value("timestamp", std::string{}),
                .payload = json.value("payload", nlohmann::json::object())};
    } catch (const std::exception &e) {
        return make_error(OrchErrc::CorruptSnapshot, std::format("malformed event: {}", e.what()));
    }
}

} // namespace planorch::engine
