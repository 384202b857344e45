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
 * @file orchestrator.hpp
 * @brief Orchestration loop driving a plan to completion
 */

#ifndef PLANORCH_ENGINE_ORCHESTRATOR_HPP
#define PLANORCH_ENGINE_ORCHESTRATOR_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "engine/commit_queue.hpp"
#include "engine/engine_errors.hpp"
#include "engine/event_bus.hpp"
#include "engine/iagent_runner.hpp"
#include "engine/icontrol_target.hpp"
#include "engine/iversion_control.hpp"
#include "engine/orchestrator_types.hpp"
#include "engine/status_store.hpp"
#include "engine/task_types.hpp"
#include "engine/time.hpp"
#include "engine/worker_pool.hpp"

namespace planorch::engine {

/**
 * Collaborators used by the orchestrator
 *
 * All references must outlive the orchestrator. vcs and commits are optional.
 */
struct OrchestratorDeps final {
    StatusStore &store;               //!< Plan state persistence
    EventBus &events;                 //!< Event emission
    IAgentRunner &runner;             //!< Task execution
    IVersionControl *vcs{};           //!< Uncommitted-changes policy; nullptr disables it
    CommitQueue *commits{};           //!< Per-task commits; nullptr disables them
};

/**
 * Orchestration loop for one plan
 *
 * A single loop thread makes every decision: it drains control commands in
 * receipt order, applies task completions, checks stuck tasks and, while
 * running, dispatches up to batch_size ready tasks to a worker pool. All
 * task state changes go through StatusStore::mutate() and are mirrored as
 * events. In-flight tasks are never preempted; cancel and pause only stop
 * new dispatch.
 *
 * Control methods may be called from any thread.
 */
class Orchestrator final : public IControlTarget {
public:
    /**
     * Create an idle orchestrator
     *
     * @param[in] config Loop configuration
     * @param[in] deps Collaborators
     * @throws std::invalid_argument if config is invalid
     */
    Orchestrator(OrchestratorConfig config, OrchestratorDeps deps);

    /**
     * Cancels a running loop and waits for it
     */
    ~Orchestrator() override;

    Orchestrator(const Orchestrator &) = delete;
    Orchestrator &operator=(const Orchestrator &) = delete;
    Orchestrator(Orchestrator &&) = delete;
    Orchestrator &operator=(Orchestrator &&) = delete;

    /**
     * Start and run the loop on the calling thread until it stops
     *
     * @return Run outcome, or the start error (PlanNotFound, CorruptSnapshot,
     *         PolicyAbort, AlreadyRunning, LockTimeout, IoError)
     */
    [[nodiscard]] Result<RunOutcome> run();

    /**
     * Start the loop on a background thread
     *
     * The start sequence (load, recovery, policy, run record) completes
     * before this returns.
     *
     * @return Empty on success, or the start error
     */
    [[nodiscard]] Status start();

    /**
     * Wait for a loop started with start() to stop
     *
     * @return Run outcome, or NotRunning if start() was not called
     */
    [[nodiscard]] Result<RunOutcome> wait();

    /**
     * Stop new dispatch; in-flight tasks finish
     */
    [[nodiscard]] Status pause();

    [[nodiscard]] Status resume();

    /**
     * Stop new dispatch and end the run once in-flight tasks finish
     */
    [[nodiscard]] Status cancel();

    /**
     * Change the number of concurrently dispatched tasks
     *
     * @param[in] batch_size New size (1..64)
     */
    [[nodiscard]] Status set_batch_size(std::uint32_t batch_size);

    /**
     * Return a failed or skipped task to pending, or mark a stuck in-flight
     * task for retry
     *
     * The task's last error is cleared; its retry count is kept.
     */
    [[nodiscard]] Status retry_task(std::string_view task_id);

    /**
     * Mark a pending, failed or in-flight task skipped
     */
    [[nodiscard]] Status skip_task(std::string_view task_id);

    /**
     * Restart the stuck clock of an in-flight task
     */
    [[nodiscard]] Status extend_task(std::string_view task_id);

    /**
     * Queue a control command for the loop
     *
     * @param[in] command Command to apply
     * @return Handle resolved once the loop applies the command; resolved
     *         immediately with NotRunning when the loop is not accepting commands
     */
    [[nodiscard]] std::shared_ptr<PendingControl> submit(ControlCommand command) override;

    /**
     * Latest loop status (updated every tick)
     */
    [[nodiscard]] OrchestratorStatus status() const override;

    [[nodiscard]] OrchestratorState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const OrchestratorConfig &config() const noexcept { return config_; }

private:
    /// Task handed to the worker pool
    struct InFlight final {
        std::string task_id;
        Time::SteadyPoint dispatched_at;                 //!< Start of the current stuck clock
        std::optional<Time::SteadyPoint> stuck_since;    //!< Set when task.stuck was emitted
        bool auto_action_applied{};
        StuckAction resolution{StuckAction::None};       //!< Skip or Retry override the result
    };

    /// Finished agent invocation waiting to be applied
    struct Completion final {
        std::string task_id;
        AgentResult result;
    };

    [[nodiscard]] Status initialize();
    [[nodiscard]] Status apply_recovery(const LoadResult &loaded);
    [[nodiscard]] Status apply_uncommitted_policy();
    void loop();
    [[nodiscard]] RunOutcome finish(std::string_view end_reason);

    void drain_commands();
    [[nodiscard]] PendingControl::Outcome apply_command(const ControlCommand &command);
    void drain_completions();
    [[nodiscard]] Status apply_completion(const Completion &completion);
    void check_stuck_tasks();
    void dispatch_ready_tasks();
    void emit_constraint_events(const std::map<std::string, std::string> &blocked);
    void emit_phase_completions();
    void reap_commits();
    [[nodiscard]] std::optional<std::string> termination_reason() const;

    [[nodiscard]] PendingControl::Outcome retry_task_now(const std::string &task_id);
    [[nodiscard]] PendingControl::Outcome
    skip_task_now(const std::string &task_id, std::string_view reason);
    [[nodiscard]] PendingControl::Outcome extend_task_now(const std::string &task_id);

    /**
     * StatusStore::mutate() retrying LockTimeout with exponential backoff
     */
    [[nodiscard]] Result<StatusSnapshot> mutate_with_retry(const StatusStore::Mutation &mutation);

    void set_state(OrchestratorState next);
    void publish_status();
    [[nodiscard]] Status wait_for_control(std::shared_ptr<PendingControl> pending);

    OrchestratorConfig config_;
    OrchestratorDeps deps_;
    std::atomic<OrchestratorState> state_{OrchestratorState::Idle};

    // Shared with callers and workers
    std::mutex queue_mutex_;
    std::condition_variable wake_cv_;
    std::deque<std::shared_ptr<PendingControl>> commands_;
    std::deque<Completion> completions_;
    bool accepting_commands_{};

    mutable std::mutex status_mutex_;
    OrchestratorStatus status_;

    // Loop thread only
    StatusSnapshot snapshot_;
    std::string run_id_;
    std::uint32_t batch_size_{};
    std::map<std::string, InFlight> in_flight_;
    std::map<std::string, std::string> blocked_;
    std::map<std::string, std::string> constraint_seen_; //!< Last constraint reason per task
    bool dispatch_deferred_{};                           //!< Last dispatch hit a store error
    std::set<std::string> reported_phases_;
    std::uint32_t tasks_attempted_{};
    std::uint32_t tasks_failed_{};
    std::vector<std::pair<std::string, CommitQueue::Future>> commit_futures_;
    std::optional<RunOutcome> outcome_;

    WorkerPool pool_;
    std::thread loop_thread_;
};

} // namespace planorch::engine

#endif // PLANORCH_ENGINE_ORCHESTRATOR_HPP
