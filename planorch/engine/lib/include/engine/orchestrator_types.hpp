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
 * @file orchestrator_types.hpp
 * @brief Orchestration loop states, configuration, controls and status
 */

#ifndef PLANORCH_ENGINE_ORCHESTRATOR_TYPES_HPP
#define PLANORCH_ENGINE_ORCHESTRATOR_TYPES_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <wise_enum.h>

#include "engine/engine_errors.hpp"
#include "engine/task_types.hpp"
#include "engine/time.hpp"

namespace planorch::engine {

/**
 * Orchestration loop state
 *
 * Idle -> Running; Running -> Pausing -> Paused -> Running;
 * Running | Pausing | Paused -> Cancelling -> Stopped.
 */
enum class OrchestratorState : std::uint8_t {
    Idle,       //!< Not started
    Running,    //!< Dispatching ready tasks
    Pausing,    //!< No new dispatch; waiting for in-flight tasks
    Paused,     //!< No new dispatch and nothing in flight
    Cancelling, //!< Waiting for in-flight tasks before stopping
    Stopped     //!< Terminal
};

/**
 * Automatic response to a stuck task after the grace period
 */
enum class StuckAction : std::uint8_t {
    None,   //!< Keep warning only
    Extend, //!< Restart the stuck clock
    Skip,   //!< Mark skipped and ignore the eventual result
    Retry   //!< Treat the eventual result as a retryable failure
};

/**
 * Handling of uncommitted working-tree changes at start
 */
enum class UncommittedPolicy : std::uint8_t {
    Ignore,    //!< Proceed without checking
    AutoStash, //!< Stash the changes, then proceed
    Abort      //!< Refuse to start
};

/**
 * Control command kinds applied by the loop
 */
enum class ControlKind : std::uint8_t {
    Pause,
    Resume,
    Cancel,
    SetBatchSize,
    RetryTask,
    SkipTask,
    ExtendTask
};

} // namespace planorch::engine

WISE_ENUM_ADAPT(
        planorch::engine::OrchestratorState, Idle, Running, Pausing, Paused, Cancelling, Stopped)
WISE_ENUM_ADAPT(planorch::engine::StuckAction, None, Extend, Skip, Retry)
WISE_ENUM_ADAPT(planorch::engine::UncommittedPolicy, Ignore, AutoStash, Abort)
WISE_ENUM_ADAPT(
        planorch::engine::ControlKind,
        Pause,
        Resume,
        Cancel,
        SetBatchSize,
        RetryTask,
        SkipTask,
        ExtendTask)

namespace planorch::engine {

[[nodiscard]] std::string_view to_wire(OrchestratorState state) noexcept;
[[nodiscard]] std::string_view to_wire(StuckAction action) noexcept;
[[nodiscard]] std::string_view to_wire(UncommittedPolicy policy) noexcept;

/**
 * Parse a stuck action name (none, extend, skip, retry)
 */
[[nodiscard]] std::optional<StuckAction> stuck_action_from_wire(std::string_view name) noexcept;

/**
 * Parse a policy name (ignore, autoStash, abort)
 */
[[nodiscard]] std::optional<UncommittedPolicy>
uncommitted_policy_from_wire(std::string_view name) noexcept;

/**
 * Orchestration loop configuration
 */
struct OrchestratorConfig final {
    static constexpr std::uint32_t DEFAULT_BATCH_SIZE = 5;
    static constexpr std::uint32_t MAX_BATCH_SIZE = 64;
    static constexpr std::uint32_t DEFAULT_MAX_RETRIES = 2;
    static constexpr Millis DEFAULT_STUCK_THRESHOLD{std::chrono::minutes{30}};
    static constexpr Millis DEFAULT_STUCK_GRACE_PERIOD{std::chrono::minutes{5}};
    static constexpr Millis DEFAULT_TICK_INTERVAL{100};
    static constexpr std::uint32_t DEFAULT_STORE_RETRY_ATTEMPTS = 5;
    static constexpr Millis DEFAULT_STORE_RETRY_BACKOFF{50};

    std::string plan_id;                                   //!< Plan to execute
    std::uint32_t batch_size{DEFAULT_BATCH_SIZE};          //!< Maximum tasks in flight (1..64)
    std::uint32_t max_retries{DEFAULT_MAX_RETRIES};        //!< Failures before terminal failed
    Millis stuck_threshold{DEFAULT_STUCK_THRESHOLD};       //!< In-flight time before task.stuck
    Millis stuck_grace_period{DEFAULT_STUCK_GRACE_PERIOD}; //!< Operator window before auto-action
    StuckAction stuck_action{StuckAction::None};           //!< Auto-action after the grace period
    UncommittedPolicy on_uncommitted_changes{UncommittedPolicy::Ignore}; //!< Start policy
    Millis tick_interval{DEFAULT_TICK_INTERVAL}; //!< Maximum idle wait between ticks
    std::uint32_t store_retry_attempts{DEFAULT_STORE_RETRY_ATTEMPTS}; //!< LockTimeout retries
    Millis store_retry_backoff{DEFAULT_STORE_RETRY_BACKOFF}; //!< Initial retry backoff (doubles)
    bool commit_on_complete{true}; //!< Queue a commit per completed task when a queue is attached
    bool ignore_sequential{};      //!< Operator override: sequential groups do not serialize
    bool force_dependencies{};     //!< Operator override: unmet dependencies do not block

    /**
     * Reject invalid values
     *
     * @throws std::invalid_argument naming the first invalid field
     */
    void validate() const;
};

/**
 * One control request for the loop
 */
struct ControlCommand final {
    ControlKind kind{ControlKind::Pause}; //!< What to do
    std::string task_id;                  //!< Target of task commands
    std::uint32_t batch_size{};           //!< Value for SetBatchSize
};

/**
 * A control command travelling from a caller to the loop
 *
 * The loop claims a command before applying it; a caller that gives up
 * first abandons it, and an abandoned command is never applied.
 */
class PendingControl final {
public:
    using Outcome = Result<nlohmann::json>;

    explicit PendingControl(ControlCommand command);

    [[nodiscard]] const ControlCommand &command() const noexcept { return command_; }

    /**
     * Move from queued to claimed (loop side)
     *
     * @return false if the caller already abandoned the command
     */
    [[nodiscard]] bool try_claim() noexcept;

    /**
     * Move from queued to abandoned (caller side)
     *
     * @return false if the loop already claimed the command
     */
    [[nodiscard]] bool try_abandon() noexcept;

    /**
     * Publish the outcome
     */
    void complete(Outcome outcome);

    /**
     * Wait for the outcome
     *
     * @param[in] timeout Maximum wait
     * @return Outcome, or std::nullopt on timeout
     */
    [[nodiscard]] std::optional<Outcome> wait_for(Millis timeout) const;

    /**
     * Wait for the outcome without a bound
     */
    [[nodiscard]] Outcome wait() const;

private:
    enum class Phase : std::uint8_t { Queued, Claimed, Abandoned };

    ControlCommand command_;
    std::atomic<Phase> phase_{Phase::Queued};
    std::promise<Outcome> promise_;
    std::shared_future<Outcome> future_;
};

/**
 * Stuck warning visible through status()
 */
struct StuckWarning final {
    std::string task_id;            //!< In-flight task
    Millis elapsed{};               //!< Time since dispatch or the last extension
    bool auto_action_applied{};     //!< Grace period elapsed and the auto-action ran
    StuckAction resolution{StuckAction::None}; //!< Pending handling of the eventual result
};

/**
 * Point-in-time view of the loop
 */
struct OrchestratorStatus final {
    OrchestratorState state{OrchestratorState::Idle};
    std::string plan_id;
    std::uint32_t batch_size{};
    std::optional<std::string> run_id;
    Summary summary;
    std::vector<std::string> in_flight;             //!< Dispatched task ids
    std::size_t worker_threads{};                   //!< Threads in the worker pool
    std::size_t busy_workers{};                     //!< Queued or running agent jobs
    std::vector<StuckWarning> stuck;                //!< Stuck in-flight tasks
    std::map<std::string, std::string> blocked;     //!< Pending task id -> blocked reason
    std::uint32_t tasks_attempted{};
    std::uint32_t tasks_failed{};
    std::optional<std::string> end_reason;
    std::string updated_at;
};

/**
 * Encode a status for the control surface
 */
[[nodiscard]] nlohmann::json status_to_json(const OrchestratorStatus &status);

/**
 * Final result of one run
 */
struct RunOutcome final {
    std::string run_id;
    std::string end_reason;       //!< completed, blocked, cancelled
    Summary summary;
    std::uint32_t tasks_attempted{};
    std::uint32_t tasks_failed{};
};

} // namespace planorch::engine

#endif // PLANORCH_ENGINE_ORCHESTRATOR_TYPES_HPP
