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
#include <cstddef>     // for size_t
#include <cstdint>     // for uint32_t
#include <future>      // for future_status
#include <optional>    // for optional
#include <string_view> // for string_view
#include <utility>     // for pair, move

#include <nlohmann/json.hpp>
#include <wise_enum.h>

#include "engine/engine_log.hpp"
#include "engine/json_codec.hpp"
#include "engine/orchestrator_types.hpp"

namespace planorch::engine {

namespace {

constexpr std::array<std::pair<OrchestratorState, std::string_view>, 6> STATE_NAMES{{
        {OrchestratorState::Idle, "idle"},
        {OrchestratorState::Running, "running"},
        {OrchestratorState::Pausing, "pausing"},
        {OrchestratorState::Paused, "paused"},
        {OrchestratorState::Cancelling, "cancelling"},
        {OrchestratorState::Stopped, "stopped"},
}};

constexpr std::array<std::pair<StuckAction, std::string_view>, 4> STUCK_ACTION_NAMES{{
        {StuckAction::None, "none"},
        {StuckAction::Extend, "extend"},
        {StuckAction::Skip, "skip"},
        {StuckAction::Retry, "retry"},
}};

constexpr std::array<std::pair<UncommittedPolicy, std::string_view>, 3> POLICY_NAMES{{
        {UncommittedPolicy::Ignore, "ignore"},
        {UncommittedPolicy::AutoStash, "autoStash"},
        {UncommittedPolicy::Abort, "abort"},
}};

static_assert(STATE_NAMES.size() == ::wise_enum::size<OrchestratorState>);
static_assert(STUCK_ACTION_NAMES.size() == ::wise_enum::size<StuckAction>);
static_assert(POLICY_NAMES.size() == ::wise_enum::size<UncommittedPolicy>);

template <typename E, std::size_t N>
std::string_view
name_of(const std::array<std::pair<E, std::string_view>, N> &table, const E value) noexcept {
    for (const auto &[entry, name] : table) {
        if (entry == value) {
            return name;
        }
    }
    return "unknown";
}

template <typename E, std::size_t N>
std::optional<E> value_of(
        const std::array<std::pair<E, std::string_view>, N> &table,
        const std::string_view name) noexcept {
    for (const auto &[entry, wire] : table) {
        if (wire == name) {
            return entry;
        }
    }
    return std::nullopt;
}

} // namespace

std::string_view to_wire(const OrchestratorState state) noexcept {
    return name_of(STATE_NAMES, state);
}

std::string_view to_wire(const StuckAction action) noexcept {
    return name_of(STUCK_ACTION_NAMES, action);
}

std::string_view to_wire(const UncommittedPolicy policy) noexcept {
    return name_of(POLICY_NAMES, policy);
}

std::optional<StuckAction> stuck_action_from_wire(const std::string_view name) noexcept {
    return value_of(STUCK_ACTION_NAMES, name);
}

std::optional<UncommittedPolicy>
uncommitted_policy_from_wire(const std::string_view name) noexcept {
    return value_of(POLICY_NAMES, name);
}

void OrchestratorConfig::validate() const {
    if (plan_id.empty()) {
        log_and_throw(EngineLog::Orchestrator, "Orchestrator plan_id must not be empty");
    }
    if (batch_size < 1 || batch_size > MAX_BATCH_SIZE) {
        log_and_throw(
                EngineLog::Orchestrator,
                "Orchestrator batch_size {} is outside 1..{}",
                batch_size,
                MAX_BATCH_SIZE);
    }
    if (max_retries < 1) {
        log_and_throw(EngineLog::Orchestrator, "Orchestrator max_retries must be at least 1");
    }
    if (stuck_threshold.count() <= 0 || stuck_grace_period.count() < 0) {
        log_and_throw(
                EngineLog::Orchestrator,
                "Orchestrator stuck_threshold must be positive and "
                "stuck_grace_period non-negative");
    }
    if (tick_interval.count() <= 0) {
        log_and_throw(EngineLog::Orchestrator, "Orchestrator tick_interval must be positive");
    }
    if (store_retry_backoff.count() < 0) {
        log_and_throw(
                EngineLog::Orchestrator, "Orchestrator store_retry_backoff must not be negative");
    }
}

PendingControl::PendingControl(ControlCommand command)
        : command_{std::move(command)}, future_{promise_.get_future().share()} {}

bool PendingControl::try_claim() noexcept {
    auto expected = Phase::Queued;
    return phase_.compare_exchange_strong(expected, Phase::Claimed, std::memory_order_acq_rel);
}

bool PendingControl::try_abandon() noexcept {
    auto expected = Phase::Queued;
    return phase_.compare_exchange_strong(expected, Phase::Abandoned, std::memory_order_acq_rel);
}

void PendingControl::complete(Outcome outcome) { promise_.set_value(std::move(outcome)); }

std::optional<PendingControl::Outcome> PendingControl::wait_for(const Millis timeout) const {
    if (future_.wait_for(timeout) != std::future_status::ready) {
        return std::nullopt;
    }
    return future_.get();
}

PendingControl::Outcome PendingControl::wait() const { return future_.get(); }

nlohmann::json status_to_json(const OrchestratorStatus &status) {
    nlohmann::json stuck = nlohmann::json::array();
    for (const auto &warning : status.stuck) {
        stuck.push_back(
                {{"taskId", warning.task_id},
                 {"elapsedMs", warning.elapsed.count()},
                 {"autoActionApplied", warning.auto_action_applied},
                 {"resolution", to_wire(warning.resolution)}});
    }
    nlohmann::json out{
            {"state", to_wire(status.state)},
            {"planId", status.plan_id},
            {"batchSize", status.batch_size},
            {"summary", status.summary},
            {"inFlight", status.in_flight},
            {"workers", {{"threads", status.worker_threads}, {"busy", status.busy_workers}}},
            {"stuck", std::move(stuck)},
            {"blocked", status.blocked},
            {"tasksAttempted", status.tasks_attempted},
            {"tasksFailed", status.tasks_failed},
            {"updatedAt", status.updated_at}};
    if (status.run_id.has_value()) {
        out["runId"] = *status.run_id;
    }
    if (status.end_reason.has_value()) {
        out["endReason"] = *status.end_reason;
    }
    return out;
}

} // namespace planorch::engine
