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
 * @file event.hpp
 * @brief Orchestration event types and their JSON form
 */

#ifndef PLANORCH_ENGINE_EVENT_HPP
#define PLANORCH_ENGINE_EVENT_HPP

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <wise_enum.h>

#include "engine/engine_errors.hpp"

namespace planorch::engine {

/**
 * Event types emitted by the orchestrator
 */
// clang-format off
enum class EventType : std::uint8_t {
    PlanInitialized,   //!< plan.initialized: payload is the full snapshot
    TaskStarted,       //!< task.started
    TaskCompleted,     //!< task.completed
    TaskFailed,        //!< task.failed (terminal)
    TaskRetrying,      //!< task.retrying (back to pending)
    TaskStuck,         //!< task.stuck
    TaskSkipped,       //!< task.skipped
    PhaseCompleted,    //!< phase.completed
    RunStarted,        //!< run.started
    RunCompleted,      //!< run.completed
    ConstraintApplied, //!< constraint.applied
    OrchestratorState, //!< orchestrator.state
    PolicyApplied      //!< policy.applied
};
// clang-format on

} // namespace planorch::engine

WISE_ENUM_ADAPT(
        planorch::engine::EventType,
        PlanInitialized,
        TaskStarted,
        TaskCompleted,
        TaskFailed,
        TaskRetrying,
        TaskStuck,
        TaskSkipped,
        PhaseCompleted,
        RunStarted,
        RunCompleted,
        ConstraintApplied,
        OrchestratorState,
        PolicyApplied)

namespace planorch::engine {

/// Set of event types; empty matches every type
using EventFilter = std::set<EventType>;

/**
 * Get the dotted wire name of an event type
 *
 * @param[in] type Event type
 * @return Name such as "task.started"
 */
[[nodiscard]] std::string_view to_wire(EventType type) noexcept;

/**
 * Parse a dotted wire name
 *
 * @param[in] name Name such as "run.completed"
 * @return Event type, or std::nullopt for an unknown name
 */
[[nodiscard]] std::optional<EventType> event_type_from_wire(std::string_view name) noexcept;

/**
 * One emitted event
 */
struct Event final {
    std::uint64_t id{};       //!< Monotonic across restarts of the same plan
    EventType type{};         //!< Event type
    std::string timestamp;    //!< ISO-8601 UTC
    nlohmann::json payload;   //!< Type specific payload

    [[nodiscard]] bool matches(const EventFilter &filter) const {
        return filter.empty() || filter.contains(type);
    }
};

/**
 * Encode as {id, type, timestamp, payload}
 */
[[nodiscard]] nlohmann::json event_to_json(const Event &event);

/**
 * Decode one event
 *
 * @param[in] json Event object
 * @return Event, or CorruptSnapshot on missing fields or an unknown type
 */
[[nodiscard]] Result<Event> event_from_json(const nlohmann::json &json);

} // namespace planorch::engine

#endif // PLANORCH_ENGINE_EVENT_HPP
