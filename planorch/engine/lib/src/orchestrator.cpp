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

#include <algorithm>  // for all_of, find_if, max
#include <chrono>     // for duration_cast
#include <cstddef>    // for size_t
#include <cstdint>    // for uint32_t
#include <deque>      // for deque
#include <exception>  // for exception
#include <format>     // for format
#include <future>     // for future_status
#include <iterator>   // for next
#include <map>        // for map
#include <memory>     // for shared_ptr, make_shared
#include <mutex>      // for lock_guard, unique_lock
#include <optional>   // for optional
#include <string>     // for string
#include <string_view> // for string_view
#include <thread>     // for thread, sleep_for
#include <utility>    // for move
#include <vector>     // for vector

#include <nlohmann/json.hpp>
#include <quill/LogMacros.h>
#include <wise_enum.h>

#include "engine/engine_errors.hpp"
#include "engine/engine_log.hpp"
#include "engine/event.hpp"
#include "engine/json_codec.hpp"
#include "engine/orchestrator.hpp"
#include "engine/scheduler.hpp"
#include "engine/task_types.hpp"
#include "engine/time.hpp"
#include "log/planorch_log_macros.hpp"

namespace planorch::engine {

namespace {

nlohmann::json task_payload(const Task &task, std::string_view reason = {}) {
    auto payload = task_state_to_json(task);
    payload["phase"] = task.phase;
    if (!reason.empty()) {
        payload["reason"] = reason;
    }
    return payload;
}

std::optional<RunRecord> find_run(const StatusSnapshot &snapshot, const std::string_view run_id) {
    const auto it = std::find_if(
            snapshot.runs.begin(), snapshot.runs.end(), [run_id](const auto &r) {
                return r.run_id == run_id;
            });
    if (it == snapshot.runs.end()) {
        return std::nullopt;
    }
    return *it;
}

/// Error returned by a dispatch mutation that found nothing to start
constexpr std::string_view NOTHING_READY = "no ready tasks";

} // namespace

Orchestrator::Orchestrator(OrchestratorConfig config, OrchestratorDeps deps)
        : config_{std::move(config)}, deps_{deps} {
    config_.validate();
    const auto plan_ok = validate_plan_id(config_.plan_id);
    if (!plan_ok) {
        log_and_throw(EngineLog::Orchestrator, "{}", plan_ok.error().message);
    }
    batch_size_ = config_.batch_size;
    status_.plan_id = config_.plan_id;
    status_.batch_size = batch_size_;
}

Orchestrator::~Orchestrator() {
    if (loop_thread_.joinable()) {
        const auto pending = submit(ControlCommand{.kind = ControlKind::Cancel});
        if (const auto outcome = pending->wait(); !outcome) {
            PLANORCH_LOGC_DEBUG(
                    EngineLog::Orchestrator,
                    "Cancel at shutdown: {}",
                    outcome.error().to_string());
        }
        loop_thread_.join();
    }
}

Result<RunOutcome> Orchestrator::run() {
    if (auto started = initialize(); !started) {
        return tl::unexpected(started.error());
    }
    loop();
    return *outcome_;
}

Status Orchestrator::start() {
    if (auto started = initialize(); !started) {
        return started;
    }
    loop_thread_ = std::thread([this] { loop(); });
    return {};
}

Result<RunOutcome> Orchestrator::wait() {
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }
    if (!outcome_.has_value()) {
        return make_error(OrchErrc::NotRunning, "orchestrator was not started");
    }
    return *outcome_;
}

Status Orchestrator::initialize() {
    if (state() != OrchestratorState::Idle) {
        return make_error(
                OrchErrc::AlreadyRunning,
                std::format("orchestrator for plan '{}' already started", config_.plan_id));
    }

    auto loaded = deps_.store.load(config_.plan_id);
    if (!loaded) {
        PLANORCH_LOGC_ERROR(
                EngineLog::Orchestrator,
                "Cannot load plan '{}': {}",
                config_.plan_id,
                loaded.error().to_string());
        return tl::unexpected(loaded.error());
    }
    snapshot_ = loaded->snapshot;

    if (deps_.events.last_id() == 0) {
        deps_.events.emit(EventType::PlanInitialized, snapshot_to_json(snapshot_));
    }
    if (auto recovered = apply_recovery(*loaded); !recovered) {
        return recovered;
    }
    if (auto policy = apply_uncommitted_policy(); !policy) {
        return policy;
    }

    auto run_id = deps_.store.start_run(config_.plan_id);
    if (!run_id) {
        return tl::unexpected(run_id.error());
    }
    run_id_ = std::move(*run_id);
    auto current = deps_.store.read(config_.plan_id);
    if (!current) {
        return tl::unexpected(current.error());
    }
    snapshot_ = std::move(*current);
    if (const auto run = find_run(snapshot_, run_id_); run.has_value()) {
        deps_.events.emit(EventType::RunStarted, nlohmann::json(*run));
    }

    // Phases finished in earlier runs are not reported again
    for (const auto &phase : snapshot_.phase_order) {
        const bool done = std::all_of(
                snapshot_.tasks.begin(), snapshot_.tasks.end(), [&phase](const auto &entry) {
                    return entry.second.phase != phase || is_terminal(entry.second.status);
                });
        if (done) {
            reported_phases_.insert(phase);
        }
    }

    pool_.ensure_threads(batch_size_);
    {
        const std::lock_guard lock{queue_mutex_};
        accepting_commands_ = true;
    }
    PLANORCH_LOGC_INFO(
            EngineLog::Orchestrator,
            "Starting {} for plan '{}': {} tasks, batch size {}",
            run_id_,
            config_.plan_id,
            snapshot_.summary.total_tasks,
            batch_size_);
    set_state(OrchestratorState::Running);
    publish_status();
    return {};
}

Status Orchestrator::apply_recovery(const LoadResult &loaded) {
    for (const auto &task_id : loaded.recovered_ids) {
        const Task *task = snapshot_.find(task_id);
        if (task == nullptr) {
            continue;
        }
        if (task->retry_count < config_.max_retries) {
            PLANORCH_LOGC_WARN(
                    EngineLog::Orchestrator,
                    "Task {} was interrupted, returned to pending (retry {})",
                    task_id,
                    task->retry_count);
            deps_.events.emit(EventType::TaskRetrying, task_payload(*task, "recovered"));
            continue;
        }

        Task updated{};
        auto failed = mutate_with_retry([&](StatusSnapshot &snapshot) -> Status {
            Task *live = snapshot.find(task_id);
            if (live == nullptr) {
                return make_error(OrchErrc::TaskNotFound, task_id);
            }
            live->status = TaskStatus::Failed;
            updated = *live;
            return {};
        });
        if (!failed) {
            return tl::unexpected(failed.error());
        }
        snapshot_ = std::move(*failed);
        PLANORCH_LOGC_ERROR(
                EngineLog::Orchestrator,
                "Task {} was interrupted with no retries left, marked failed",
                task_id);
        deps_.events.emit(EventType::TaskFailed, task_payload(updated, "recovered"));
    }
    return {};
}

Status Orchestrator::apply_uncommitted_policy() {
    const auto policy = config_.on_uncommitted_changes;
    if (policy == UncommittedPolicy::Ignore) {
        return {};
    }
    if (deps_.vcs == nullptr) {
        PLANORCH_LOGC_WARN(
                EngineLog::Orchestrator,
                "Policy '{}' ignored: no version control configured",
                to_wire(policy));
        return {};
    }

    const auto dirty = deps_.vcs->has_uncommitted_changes();
    if (!dirty) {
        PLANORCH_LOGC_ERROR(
                EngineLog::Orchestrator,
                "Cannot check for uncommitted changes: {}",
                dirty.error().to_string());
        return tl::unexpected(dirty.error());
    }

    nlohmann::json payload{{"policy", to_wire(policy)}, {"dirty", *dirty}, {"action", "none"}};
    if (!*dirty) {
        deps_.events.emit(EventType::PolicyApplied, std::move(payload));
        return {};
    }

    if (policy == UncommittedPolicy::Abort) {
        payload["action"] = "abort";
        deps_.events.emit(EventType::PolicyApplied, std::move(payload));
        return make_error(
                OrchErrc::PolicyAbort,
                std::format("plan '{}': working tree has uncommitted changes", config_.plan_id));
    }

    if (auto stashed = deps_.vcs->stash(
                std::format("planorch: auto-stash before running plan {}", config_.plan_id));
        !stashed) {
        return stashed;
    }
    payload["action"] = "stashed";
    PLANORCH_LOGC_NOTICE(EngineLog::Orchestrator, "Stashed uncommitted changes before run");
    deps_.events.emit(EventType::PolicyApplied, std::move(payload));
    return {};
}

void Orchestrator::loop() {
    while (true) {
        drain_commands();
        drain_completions();
        check_stuck_tasks();
        if (state() == OrchestratorState::Pausing && in_flight_.empty()) {
            set_state(OrchestratorState::Paused);
        }
        dispatch_deferred_ = false;
        if (state() == OrchestratorState::Running) {
            dispatch_ready_tasks();
        }
        emit_phase_completions();
        reap_commits();
        publish_status();

        if (const auto reason = termination_reason(); reason.has_value()) {
            outcome_ = finish(*reason);
            return;
        }

        std::unique_lock lock{queue_mutex_};
        wake_cv_.wait_for(lock, config_.tick_interval, [this] {
            return !commands_.empty() || !completions_.empty();
        });
    }
}

std::optional<std::string> Orchestrator::termination_reason() const {
    if (!in_flight_.empty() || dispatch_deferred_) {
        return std::nullopt;
    }
    switch (state()) {
    case OrchestratorState::Cancelling:
        return "cancelled";
    case OrchestratorState::Running: {
        const auto &summary = snapshot_.summary;
        if (summary.pending == 0 && summary.in_progress == 0) {
            return "completed";
        }
        // Nothing was dispatchable this tick and nothing is running
        return "blocked";
    }
    default:
        return std::nullopt;
    }
}

RunOutcome Orchestrator::finish(const std::string_view end_reason) {
    std::deque<std::shared_ptr<PendingControl>> leftover;
    {
        const std::lock_guard lock{queue_mutex_};
        accepting_commands_ = false;
        leftover.swap(commands_);
    }
    for (const auto &pending : leftover) {
        if (pending->try_claim()) {
            pending->complete(make_error(OrchErrc::NotRunning, "orchestrator stopped"));
        }
    }

    auto closed = deps_.store.complete_run(
            config_.plan_id, run_id_, tasks_attempted_, tasks_failed_, end_reason);
    if (closed) {
        snapshot_ = std::move(*closed);
        if (const auto run = find_run(snapshot_, run_id_); run.has_value()) {
            deps_.events.emit(EventType::RunCompleted, nlohmann::json(*run));
        }
    } else {
        PLANORCH_LOGC_ERROR(
                EngineLog::Orchestrator,
                "Cannot close {}: {}",
                run_id_,
                closed.error().to_string());
    }

    PLANORCH_LOGC_INFO(
            EngineLog::Orchestrator,
            "{} ended ({}): {} completed, {} failed, {} skipped, {} pending",
            run_id_,
            end_reason,
            snapshot_.summary.completed,
            snapshot_.summary.failed,
            snapshot_.summary.skipped,
            snapshot_.summary.pending);
    set_state(OrchestratorState::Stopped);

    RunOutcome outcome{
            .run_id = run_id_,
            .end_reason = std::string{end_reason},
            .summary = snapshot_.summary,
            .tasks_attempted = tasks_attempted_,
            .tasks_failed = tasks_failed_};
    {
        const std::lock_guard lock{status_mutex_};
        status_.end_reason = outcome.end_reason;
    }
    publish_status();
    return outcome;
}

void Orchestrator::set_state(const OrchestratorState next) {
    const auto previous = state_.exchange(next, std::memory_order_acq_rel);
    if (previous == next) {
        return;
    }
    PLANORCH_LOGC_INFO(
            EngineLog::Orchestrator,
            "State {} -> {}",
            ::wise_enum::to_string(previous),
            ::wise_enum::to_string(next));
    deps_.events.emit(
            EventType::OrchestratorState,
            {{"previous", to_wire(previous)}, {"state", to_wire(next)}});
}

void Orchestrator::publish_status() {
    const auto now = Time::steady_now();
    const std::lock_guard lock{status_mutex_};
    status_.state = state();
    status_.batch_size = batch_size_;
    if (!run_id_.empty()) {
        status_.run_id = run_id_;
    }
    status_.summary = snapshot_.summary;
    status_.in_flight.clear();
    status_.stuck.clear();
    for (const auto &[id, entry] : in_flight_) {
        status_.in_flight.push_back(id);
        if (entry.stuck_since.has_value()) {
            status_.stuck.push_back(StuckWarning{
                    .task_id = id,
                    .elapsed = std::chrono::duration_cast<Millis>(now - entry.dispatched_at),
                    .auto_action_applied = entry.auto_action_applied,
                    .resolution = entry.resolution});
        }
    }
    status_.worker_threads = pool_.thread_count();
    status_.busy_workers = pool_.busy_count();
    status_.blocked = blocked_;
    status_.tasks_attempted = tasks_attempted_;
    status_.tasks_failed = tasks_failed_;
    status_.updated_at = Time::now_iso8601();
}

OrchestratorStatus Orchestrator::status() const {
    const std::lock_guard lock{status_mutex_};
    return status_;
}

std::shared_ptr<PendingControl> Orchestrator::submit(ControlCommand command) {
    auto pending = std::make_shared<PendingControl>(std::move(command));
    {
        const std::lock_guard lock{queue_mutex_};
        if (!accepting_commands_) {
            if (pending->try_claim()) {
                pending->complete(make_error(
                        OrchErrc::NotRunning,
                        std::format("orchestrator for plan '{}' is not running", config_.plan_id)));
            }
            return pending;
        }
        commands_.push_back(pending);
    }
    wake_cv_.notify_one();
    return pending;
}

Status Orchestrator::wait_for_control(std::shared_ptr<PendingControl> pending) {
    auto outcome = pending->wait();
    if (!outcome) {
        return tl::unexpected(outcome.error());
    }
    return {};
}

Status Orchestrator::pause() { return wait_for_control(submit({.kind = ControlKind::Pause})); }

Status Orchestrator::resume() { return wait_for_control(submit({.kind = ControlKind::Resume})); }

Status Orchestrator::cancel() { return wait_for_control(submit({.kind = ControlKind::Cancel})); }

Status Orchestrator::set_batch_size(const std::uint32_t batch_size) {
    return wait_for_control(
            submit({.kind = ControlKind::SetBatchSize, .task_id = {}, .batch_size = batch_size}));
}

Status Orchestrator::retry_task(const std::string_view task_id) {
    return wait_for_control(
            submit({.kind = ControlKind::RetryTask, .task_id = std::string{task_id}}));
}

Status Orchestrator::skip_task(const std::string_view task_id) {
    return wait_for_control(
            submit({.kind = ControlKind::SkipTask, .task_id = std::string{task_id}}));
}

Status Orchestrator::extend_task(const std::string_view task_id) {
    return wait_for_control(
            submit({.kind = ControlKind::ExtendTask, .task_id = std::string{task_id}}));
}

void Orchestrator::drain_commands() {
    std::deque<std::shared_ptr<PendingControl>> batch;
    {
        const std::lock_guard lock{queue_mutex_};
        batch.swap(commands_);
    }
    for (const auto &pending : batch) {
        if (!pending->try_claim()) {
            PLANORCH_LOGC_DEBUG(
                    EngineLog::Orchestrator,
                    "Skipping abandoned {} command",
                    ::wise_enum::to_string(pending->command().kind));
            continue;
        }
        auto outcome = apply_command(pending->command());
        if (!outcome) {
            PLANORCH_LOGC_WARN(
                    EngineLog::Orchestrator,
                    "{} rejected: {}",
                    ::wise_enum::to_string(pending->command().kind),
                    outcome.error().to_string());
        }
        pending->complete(std::move(outcome));
    }
}

PendingControl::Outcome Orchestrator::apply_command(const ControlCommand &command) {
    const auto current = state();
    const auto state_reply = [this] { return nlohmann::json{{"state", to_wire(state())}}; };

    switch (command.kind) {
    case ControlKind::Pause:
        if (current == OrchestratorState::Running) {
            set_state(
                    in_flight_.empty() ? OrchestratorState::Paused : OrchestratorState::Pausing);
        } else if (current != OrchestratorState::Pausing && current != OrchestratorState::Paused) {
            return make_error(
                    OrchErrc::InvalidTransition,
                    std::format("cannot pause while {}", to_wire(current)));
        }
        return state_reply();

    case ControlKind::Resume:
        if (current == OrchestratorState::Pausing || current == OrchestratorState::Paused) {
            set_state(OrchestratorState::Running);
        } else if (current != OrchestratorState::Running) {
            return make_error(
                    OrchErrc::InvalidTransition,
                    std::format("cannot resume while {}", to_wire(current)));
        }
        return state_reply();

    case ControlKind::Cancel:
        if (current != OrchestratorState::Cancelling) {
            set_state(OrchestratorState::Cancelling);
        }
        return state_reply();

    case ControlKind::SetBatchSize:
        if (command.batch_size < 1 || command.batch_size > OrchestratorConfig::MAX_BATCH_SIZE) {
            return make_error(
                    OrchErrc::InvalidParameter,
                    std::format(
                            "batch size {} is outside 1..{}",
                            command.batch_size,
                            OrchestratorConfig::MAX_BATCH_SIZE));
        }
        batch_size_ = command.batch_size;
        pool_.ensure_threads(batch_size_);
        PLANORCH_LOGC_INFO(EngineLog::Orchestrator, "Batch size set to {}", batch_size_);
        return nlohmann::json{{"batchSize", batch_size_}};

    case ControlKind::RetryTask:
        return retry_task_now(command.task_id);

    case ControlKind::SkipTask:
        return skip_task_now(command.task_id, "operator");

    case ControlKind::ExtendTask:
        return extend_task_now(command.task_id);
    }
    return make_error(OrchErrc::UnknownCommand, "unhandled control command");
}

PendingControl::Outcome Orchestrator::retry_task_now(const std::string &task_id) {
    if (const auto it = in_flight_.find(task_id);
        it != in_flight_.end() && it->second.resolution != StuckAction::Skip) {
        if (!it->second.stuck_since.has_value()) {
            return make_error(
                    OrchErrc::InvalidTransition,
                    std::format("task {} is running and not stuck", task_id));
        }
        it->second.resolution = StuckAction::Retry;
        PLANORCH_LOGC_INFO(
                EngineLog::Orchestrator, "Stuck task {} will be retried when it returns", task_id);
        return nlohmann::json{{"taskId", task_id}, {"action", "retry"}};
    }

    Task updated{};
    auto result = mutate_with_retry([&](StatusSnapshot &snapshot) -> Status {
        Task *task = snapshot.find(task_id);
        if (task == nullptr) {
            return make_error(OrchErrc::TaskNotFound, std::format("unknown task '{}'", task_id));
        }
        if (task->status != TaskStatus::Failed && task->status != TaskStatus::Skipped) {
            return make_error(
                    OrchErrc::InvalidTransition,
                    std::format(
                            "task {} is {}, only failed or skipped tasks can be retried",
                            task_id,
                            to_wire(task->status)));
        }
        // retry_count is kept so max_retries still bounds automatic retries
        task->status = TaskStatus::Pending;
        task->last_error.reset();
        updated = *task;
        return {};
    });
    if (!result) {
        return tl::unexpected(result.error());
    }
    snapshot_ = std::move(*result);
    deps_.events.emit(EventType::TaskRetrying, task_payload(updated, "operator"));
    return task_state_to_json(updated);
}

PendingControl::Outcome
Orchestrator::skip_task_now(const std::string &task_id, const std::string_view reason) {
    Task updated{};
    auto result = mutate_with_retry([&](StatusSnapshot &snapshot) -> Status {
        Task *task = snapshot.find(task_id);
        if (task == nullptr) {
            return make_error(OrchErrc::TaskNotFound, std::format("unknown task '{}'", task_id));
        }
        if (task->status == TaskStatus::Completed || task->status == TaskStatus::Skipped) {
            return make_error(
                    OrchErrc::InvalidTransition,
                    std::format("task {} is already {}", task_id, to_wire(task->status)));
        }
        task->status = TaskStatus::Skipped;
        updated = *task;
        return {};
    });
    if (!result) {
        return tl::unexpected(result.error());
    }
    snapshot_ = std::move(*result);
    if (const auto it = in_flight_.find(task_id); it != in_flight_.end()) {
        it->second.resolution = StuckAction::Skip;
    }
    PLANORCH_LOGC_NOTICE(EngineLog::Orchestrator, "Task {} skipped ({})", task_id, reason);
    deps_.events.emit(EventType::TaskSkipped, task_payload(updated, reason));
    return task_state_to_json(updated);
}

PendingControl::Outcome Orchestrator::extend_task_now(const std::string &task_id) {
    const auto it = in_flight_.find(task_id);
    if (it == in_flight_.end() || it->second.resolution == StuckAction::Skip) {
        if (snapshot_.find(task_id) == nullptr) {
            return make_error(OrchErrc::TaskNotFound, std::format("unknown task '{}'", task_id));
        }
        return make_error(
                OrchErrc::InvalidTransition, std::format("task {} is not running", task_id));
    }
    it->second.dispatched_at = Time::steady_now();
    it->second.stuck_since.reset();
    it->second.auto_action_applied = false;
    PLANORCH_LOGC_INFO(EngineLog::Orchestrator, "Stuck clock of task {} restarted", task_id);
    return nlohmann::json{{"taskId", task_id}, {"action", "extend"}};
}

void Orchestrator::drain_completions() {
    std::deque<Completion> batch;
    {
        const std::lock_guard lock{queue_mutex_};
        batch.swap(completions_);
    }
    std::deque<Completion> deferred;
    for (auto &completion : batch) {
        auto applied = apply_completion(completion);
        if (!applied) {
            if (applied.error().is(OrchErrc::LockTimeout)) {
                deferred.push_back(std::move(completion));
                continue;
            }
            PLANORCH_LOGC_ERROR(
                    EngineLog::Orchestrator,
                    "Cannot record result of task {}: {}",
                    completion.task_id,
                    applied.error().to_string());
            in_flight_.erase(completion.task_id);
        }
    }
    if (!deferred.empty()) {
        PLANORCH_LOGC_WARN(
                EngineLog::Orchestrator,
                "{} completion(s) deferred: status store busy",
                deferred.size());
        const std::lock_guard lock{queue_mutex_};
        completions_.insert(completions_.begin(), deferred.begin(), deferred.end());
    }
}

Status Orchestrator::apply_completion(const Completion &completion) {
    const auto it = in_flight_.find(completion.task_id);
    if (it == in_flight_.end()) {
        PLANORCH_LOGC_WARN(
                EngineLog::Orchestrator,
                "Ignoring result for task {} that is not in flight",
                completion.task_id);
        return {};
    }
    const InFlight entry = it->second;
    if (entry.resolution == StuckAction::Skip) {
        PLANORCH_LOGC_INFO(
                EngineLog::Orchestrator,
                "Ignoring result of skipped task {}",
                completion.task_id);
        in_flight_.erase(it);
        return {};
    }

    const bool success = completion.result.success && entry.resolution != StuckAction::Retry;
    std::string error_text;
    if (!success) {
        error_text = completion.result.success
                             ? std::string{"stuck: retry requested"}
                             : completion.result.error.value_or("agent reported failure");
    }

    Task updated{};
    auto result = mutate_with_retry([&](StatusSnapshot &snapshot) -> Status {
        Task *task = snapshot.find(completion.task_id);
        if (task == nullptr) {
            return make_error(OrchErrc::TaskNotFound, completion.task_id);
        }
        if (task->status != TaskStatus::InProgress) {
            return make_error(
                    OrchErrc::InvalidTransition,
                    std::format("task {} is {}", completion.task_id, to_wire(task->status)));
        }
        if (success) {
            task->status = TaskStatus::Completed;
            task->last_error.reset();
        } else {
            ++task->retry_count;
            task->last_error = error_text;
            task->status = task->retry_count >= config_.max_retries ? TaskStatus::Failed
                                                                     : TaskStatus::Pending;
        }
        updated = *task;
        return {};
    });

    if (!result) {
        if (result.error().is(OrchErrc::InvalidTransition)) {
            PLANORCH_LOGC_WARN(
                    EngineLog::Orchestrator,
                    "Dropping result: {}",
                    result.error().message);
            in_flight_.erase(completion.task_id);
            return {};
        }
        return tl::unexpected(result.error());
    }
    snapshot_ = std::move(*result);
    in_flight_.erase(completion.task_id);

    auto payload = task_payload(updated);
    payload["durationMs"] = completion.result.duration.count();
    if (success) {
        payload["artifacts"] = completion.result.artifacts;
        PLANORCH_LOGC_INFO(
                EngineLog::Orchestrator,
                "Task {} completed in {} ms",
                updated.id,
                completion.result.duration.count());
        deps_.events.emit(EventType::TaskCompleted, std::move(payload));
        if (deps_.commits != nullptr && config_.commit_on_complete) {
            commit_futures_.emplace_back(
                    updated.id,
                    deps_.commits->enqueue(
                            std::format(
                                    "planorch({}): complete task {}\n\n{}",
                                    config_.plan_id,
                                    updated.id,
                                    updated.description),
                            updated.file_references));
        }
    } else if (updated.status == TaskStatus::Failed) {
        ++tasks_failed_;
        payload["error"] = error_text;
        PLANORCH_LOGC_ERROR(
                EngineLog::Orchestrator,
                "Task {} failed after {} attempt(s): {}",
                updated.id,
                updated.retry_count,
                error_text);
        deps_.events.emit(EventType::TaskFailed, std::move(payload));
    } else {
        payload["error"] = error_text;
        payload["reason"] = "failure";
        PLANORCH_LOGC_WARN(
                EngineLog::Orchestrator,
                "Task {} failed (attempt {} of {}), will retry: {}",
                updated.id,
                updated.retry_count,
                config_.max_retries,
                error_text);
        deps_.events.emit(EventType::TaskRetrying, std::move(payload));
    }
    return {};
}

void Orchestrator::check_stuck_tasks() {
    const auto now = Time::steady_now();
    for (auto &[id, entry] : in_flight_) {
        if (entry.resolution == StuckAction::Skip) {
            continue;
        }
        const auto elapsed = std::chrono::duration_cast<Millis>(now - entry.dispatched_at);
        if (!entry.stuck_since.has_value()) {
            if (elapsed >= config_.stuck_threshold) {
                entry.stuck_since = now;
                PLANORCH_LOGC_WARN(
                        EngineLog::Orchestrator,
                        "Task {} has been running for {} ms (threshold {} ms)",
                        id,
                        elapsed.count(),
                        config_.stuck_threshold.count());
                deps_.events.emit(
                        EventType::TaskStuck,
                        {{"taskId", id},
                         {"elapsedMs", elapsed.count()},
                         {"thresholdMs", config_.stuck_threshold.count()},
                         {"autoAction", to_wire(config_.stuck_action)},
                         {"gracePeriodMs", config_.stuck_grace_period.count()}});
            }
            continue;
        }
        if (entry.auto_action_applied || now - *entry.stuck_since < config_.stuck_grace_period) {
            continue;
        }

        entry.auto_action_applied = true;
        switch (config_.stuck_action) {
        case StuckAction::None:
            PLANORCH_LOGC_WARN(
                    EngineLog::Orchestrator, "Task {} still stuck, no auto-action configured", id);
            break;
        case StuckAction::Extend:
            entry.dispatched_at = now;
            entry.stuck_since.reset();
            entry.auto_action_applied = false;
            PLANORCH_LOGC_INFO(EngineLog::Orchestrator, "Stuck task {} extended", id);
            break;
        case StuckAction::Skip:
            if (auto skipped = skip_task_now(id, "stuck"); !skipped) {
                PLANORCH_LOGC_ERROR(
                        EngineLog::Orchestrator,
                        "Cannot skip stuck task {}: {}",
                        id,
                        skipped.error().to_string());
            }
            break;
        case StuckAction::Retry:
            entry.resolution = StuckAction::Retry;
            PLANORCH_LOGC_INFO(
                    EngineLog::Orchestrator, "Stuck task {} will be retried when it returns", id);
            break;
        }
    }
}

void Orchestrator::dispatch_ready_tasks() {
    if (in_flight_.size() >= batch_size_) {
        return;
    }
    const auto capacity = static_cast<std::size_t>(batch_size_) - in_flight_.size();

    auto current = deps_.store.read(config_.plan_id);
    if (!current) {
        PLANORCH_LOGC_WARN(
                EngineLog::Orchestrator,
                "Cannot read plan state: {}",
                current.error().to_string());
        dispatch_deferred_ = true;
        return;
    }
    snapshot_ = std::move(*current);
    const ScheduleOptions options{
            .max_count = capacity,
            .ignore_sequential = config_.ignore_sequential,
            .force_dependencies = config_.force_dependencies};
    auto preview = Scheduler::ready_tasks(snapshot_, options);
    blocked_ = preview.blocked;
    emit_constraint_events(blocked_);
    if (preview.ready.empty()) {
        return;
    }

    std::vector<Task> selected;
    std::vector<std::string> forced;
    auto result = mutate_with_retry([&](StatusSnapshot &snapshot) -> Status {
        selected.clear();
        const auto schedule = Scheduler::ready_tasks(snapshot, options);
        if (schedule.ready.empty()) {
            return make_error(OrchErrc::InvalidTransition, std::string{NOTHING_READY});
        }
        forced = schedule.forced;
        for (const auto &ready : schedule.ready) {
            Task *task = snapshot.find(ready.id);
            task->status = TaskStatus::InProgress;
            selected.push_back(*task);
        }
        return {};
    });
    if (!result) {
        if (result.error().message != NOTHING_READY) {
            PLANORCH_LOGC_WARN(
                    EngineLog::Orchestrator,
                    "Dispatch deferred: {}",
                    result.error().to_string());
            dispatch_deferred_ = true;
        }
        return;
    }
    snapshot_ = std::move(*result);

    for (const auto &task_id : forced) {
        const Task *task = snapshot_.find(task_id);
        deps_.events.emit(
                EventType::ConstraintApplied,
                {{"taskId", task_id},
                 {"reason", "dependencyOverride"},
                 {"kind", "dependencyOverride"},
                 {"blockedBy", task == nullptr ? nlohmann::json::array()
                                               : nlohmann::json(task->dependencies)}});
        PLANORCH_LOGC_WARN(
                EngineLog::Orchestrator,
                "Task {} dispatched with dependencies overridden",
                task_id);
    }

    const auto now = Time::steady_now();
    for (const auto &task : selected) {
        in_flight_.emplace(task.id, InFlight{.task_id = task.id, .dispatched_at = now});
        blocked_.erase(task.id);
        ++tasks_attempted_;

        auto payload = task_payload(task);
        payload["runId"] = run_id_;
        deps_.events.emit(EventType::TaskStarted, std::move(payload));
        PLANORCH_LOGC_INFO(EngineLog::Orchestrator, "Dispatching task {}", task.id);

        pool_.submit([this, id = task.id, description = task.description] {
            const auto started = Time::steady_now();
            AgentResult result{};
            try {
                result = deps_.runner.run(id, description);
            } catch (const std::exception &e) {
                result.success = false;
                result.error = std::format("agent runner threw: {}", e.what());
            }
            if (result.duration.count() == 0) {
                result.duration =
                        std::chrono::duration_cast<Millis>(Time::steady_now() - started);
            }
            {
                const std::lock_guard lock{queue_mutex_};
                completions_.push_back(Completion{.task_id = id, .result = std::move(result)});
            }
            wake_cv_.notify_one();
        });
    }
}

void Orchestrator::emit_constraint_events(const std::map<std::string, std::string> &blocked) {
    for (auto it = constraint_seen_.begin(); it != constraint_seen_.end();) {
        it = blocked.contains(it->first) ? std::next(it) : constraint_seen_.erase(it);
    }
    for (const auto &[task_id, reason] : blocked) {
        if (reason.starts_with("dependency:")) {
            constraint_seen_.erase(task_id);
            continue;
        }
        const auto [seen, inserted] = constraint_seen_.try_emplace(task_id, reason);
        if (!inserted && seen->second == reason) {
            continue;
        }
        seen->second = reason;
        const auto colon = reason.find(':');
        deps_.events.emit(
                EventType::ConstraintApplied,
                {{"taskId", task_id},
                 {"reason", reason},
                 {"kind", reason.substr(0, colon)},
                 {"blockedBy", colon == std::string::npos ? "" : reason.substr(colon + 1)}});
        PLANORCH_LOGC_DEBUG(EngineLog::Orchestrator, "Task {} deferred: {}", task_id, reason);
    }
}

void Orchestrator::emit_phase_completions() {
    for (const auto &phase : snapshot_.phase_order) {
        if (reported_phases_.contains(phase)) {
            continue;
        }
        Summary counts{};
        bool all_terminal = true;
        for (const auto &[id, task] : snapshot_.tasks) {
            if (task.phase != phase) {
                continue;
            }
            ++counts.total_tasks;
            if (!is_terminal(task.status)) {
                all_terminal = false;
                break;
            }
            if (task.status == TaskStatus::Completed) {
                ++counts.completed;
            } else if (task.status == TaskStatus::Failed) {
                ++counts.failed;
            } else {
                ++counts.skipped;
            }
        }
        if (!all_terminal || counts.total_tasks == 0) {
            continue;
        }
        reported_phases_.insert(phase);
        PLANORCH_LOGC_INFO(EngineLog::Orchestrator, "Phase {} completed", phase);
        deps_.events.emit(
                EventType::PhaseCompleted,
                {{"phase", phase},
                 {"totalTasks", counts.total_tasks},
                 {"completed", counts.completed},
                 {"failed", counts.failed},
                 {"skipped", counts.skipped}});
    }
}

void Orchestrator::reap_commits() {
    for (auto it = commit_futures_.begin(); it != commit_futures_.end();) {
        if (it->second.wait_for(Millis{0}) != std::future_status::ready) {
            ++it;
            continue;
        }
        const auto committed = it->second.get();
        if (committed) {
            PLANORCH_LOGC_DEBUG(
                    EngineLog::Orchestrator,
                    "Task {} committed as {}",
                    it->first,
                    committed->commit_id);
        } else {
            PLANORCH_LOGC_WARN(
                    EngineLog::Orchestrator,
                    "Commit for task {} failed: {}",
                    it->first,
                    committed.error().to_string());
        }
        it = commit_futures_.erase(it);
    }
}

Result<StatusSnapshot> Orchestrator::mutate_with_retry(const StatusStore::Mutation &mutation) {
    Millis backoff = config_.store_retry_backoff;
    const auto attempts = std::max<std::uint32_t>(config_.store_retry_attempts, 1);
    for (std::uint32_t attempt = 1;; ++attempt) {
        auto result = deps_.store.mutate(config_.plan_id, mutation);
        if (result || !result.error().is(OrchErrc::LockTimeout) || attempt >= attempts) {
            return result;
        }
        PLANORCH_LOGC_WARN(
                EngineLog::Orchestrator,
                "Status store busy (attempt {}/{}), retrying in {} ms",
                attempt,
                attempts,
                backoff.count());
        std::this_thread::sleep_for(backoff);
        backoff *= 2;
    }
}

} // namespace planorch::engine
