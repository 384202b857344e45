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
 * @file status_store.cpp
 * @brief Locked, atomic persistence of status snapshots
 */

#include <algorithm>    // for find, any_of
#include <chrono>       // for duration_cast
#include <cstdint>      // for uint32_t
#include <filesystem>   // for path, create_directories, exists
#include <format>       // for format
#include <functional>   // for function
#include <memory>       // for make_unique
#include <mutex>        // for lock_guard, unique_lock, timed_mutex
#include <string>       // for string
#include <string_view>  // for string_view
#include <system_error> // for error_code
#include <utility>      // for move
#include <vector>       // for vector

#include <quill/LogMacros.h>

#include "engine/dependency_graph.hpp"
#include "engine/engine_errors.hpp"
#include "engine/engine_log.hpp"
#include "engine/file_io.hpp"
#include "engine/json_codec.hpp"
#include "engine/status_store.hpp"
#include "engine/task_types.hpp"
#include "engine/time.hpp"
#include "log/planorch_log_macros.hpp"

namespace planorch::engine {

namespace {

constexpr std::string_view STATUS_FILE = "status.json";
constexpr std::string_view LOCK_FILE = "status.lock";
constexpr std::string_view RECOVERED_ERROR = "interrupted: recovered after restart";
constexpr int JSON_INDENT = 2;

bool same_structure(const Task &before, const Task &after) {
    return before.id == after.id && before.description == after.description &&
           before.phase == after.phase && before.dependencies == after.dependencies &&
           before.dependents == after.dependents &&
           before.sequential_group == after.sequential_group &&
           before.file_references == after.file_references;
}

Status validate_mutation(const StatusSnapshot &before, const StatusSnapshot &after) {
    if (after.plan_id != before.plan_id || after.task_order != before.task_order ||
        after.phase_order != before.phase_order || after.tasks.size() != before.tasks.size()) {
        return make_error(
                OrchErrc::InvalidMutation,
                std::format("plan '{}': task set or ordering changed", before.plan_id));
    }
    for (const auto &[id, old_task] : before.tasks) {
        const Task *new_task = after.find(id);
        if (new_task == nullptr) {
            return make_error(OrchErrc::InvalidMutation, std::format("task '{}' was removed", id));
        }
        if (!same_structure(old_task, *new_task)) {
            return make_error(
                    OrchErrc::InvalidMutation,
                    std::format("task '{}': only status, retryCount and lastError may change", id));
        }
        if (new_task->retry_count < old_task.retry_count) {
            return make_error(
                    OrchErrc::InvalidMutation,
                    std::format(
                            "task '{}': retryCount decreased from {} to {}",
                            id,
                            old_task.retry_count,
                            new_task->retry_count));
        }
    }
    if (after.runs.size() < before.runs.size()) {
        return make_error(OrchErrc::InvalidMutation, "run records were removed");
    }
    for (std::size_t i = 0; i < before.runs.size(); ++i) {
        const auto &old_run = before.runs[i];
        if (old_run.completed_at.has_value() && !(after.runs[i] == old_run)) {
            return make_error(
                    OrchErrc::InvalidMutation,
                    std::format("completed run '{}' was modified", old_run.run_id));
        }
        if (after.runs[i].run_id != old_run.run_id) {
            return make_error(OrchErrc::InvalidMutation, "run records were reordered");
        }
    }
    return {};
}

} // namespace

Status validate_plan_id(const std::string_view plan_id) {
    if (plan_id.empty() || plan_id == "." || plan_id == ".." ||
        plan_id.find_first_of("/\\") != std::string_view::npos ||
        plan_id.find('\0') != std::string_view::npos) {
        return make_error(
                OrchErrc::InvalidParameter, std::format("invalid plan id '{}'", plan_id));
    }
    return {};
}

StatusStore::StatusStore(StatusStoreConfig config) : config_{std::move(config)} {
    if (config_.state_dir.empty()) {
        log_and_throw(EngineLog::Store, "Status store requires a state directory");
    }
    if (config_.lock_timeout.count() <= 0) {
        log_and_throw(
                EngineLog::Store,
                "Lock timeout must be positive, got {} ms",
                config_.lock_timeout.count());
    }
}

std::filesystem::path StatusStore::plan_dir(const std::string_view plan_id) const {
    return config_.state_dir / std::string{plan_id};
}

std::filesystem::path StatusStore::status_path(const std::string_view plan_id) const {
    return plan_dir(plan_id) / STATUS_FILE;
}

bool StatusStore::exists(const std::string_view plan_id) const {
    std::error_code ec;
    return validate_plan_id(plan_id).has_value() &&
           std::filesystem::exists(status_path(plan_id), ec);
}

std::timed_mutex &StatusStore::plan_mutex(const std::string_view plan_id) {
    const std::lock_guard<std::mutex> guard(mutexes_guard_);
    auto &slot = plan_mutexes_[std::string{plan_id}];
    if (!slot) {
        slot = std::make_unique<std::timed_mutex>();
    }
    return *slot;
}

Result<StatusSnapshot> StatusStore::locked_update(
        const std::string_view plan_id, const std::function<Result<StatusSnapshot>()> &body) {
    if (auto valid = validate_plan_id(plan_id); !valid) {
        return tl::unexpected(valid.error());
    }

    const auto deadline = Time::steady_now() + config_.lock_timeout;
    std::unique_lock<std::timed_mutex> local_lock(plan_mutex(plan_id), std::defer_lock);
    if (!local_lock.try_lock_for(config_.lock_timeout)) {
        PLANORCH_LOGC_WARN(EngineLog::Store, "Plan '{}' is busy in this process", plan_id);
        return make_error(
                OrchErrc::LockTimeout,
                std::format("plan '{}' lock not acquired within {} ms", plan_id,
                            config_.lock_timeout.count()));
    }

    std::error_code ec;
    std::filesystem::create_directories(plan_dir(plan_id), ec);
    if (ec) {
        return make_error(
                OrchErrc::IoError,
                std::format("cannot create '{}': {}", plan_dir(plan_id).string(), ec.message()));
    }

    const auto left = std::max(
            Millis{1}, std::chrono::duration_cast<Millis>(deadline - Time::steady_now()));
    auto file_lock = FileLock::acquire(plan_dir(plan_id) / LOCK_FILE, left);
    if (!file_lock) {
        PLANORCH_LOGC_WARN(
                EngineLog::Store, "Plan '{}' lock failed: {}", plan_id, file_lock.error().message);
        return tl::unexpected(file_lock.error());
    }
    return body();
}

Status StatusStore::persist(const StatusSnapshot &snapshot) const {
    const auto text = snapshot_to_json(snapshot).dump(JSON_INDENT);
    auto written = write_file_atomic(status_path(snapshot.plan_id), text);
    if (!written) {
        PLANORCH_LOGC_ERROR(
                EngineLog::Store,
                "Failed to persist plan '{}': {}",
                snapshot.plan_id,
                written.error().message);
    }
    return written;
}

Result<StatusSnapshot> StatusStore::init(const PlanDefinition &plan) {
    if (auto valid = validate_plan_id(plan.plan_id); !valid) {
        return tl::unexpected(valid.error());
    }

    const auto graph = DependencyGraph::build(plan.tasks);
    if (!graph) {
        return tl::unexpected(graph.error().to_error());
    }

    std::vector<Task> tasks = plan.tasks;
    graph->annotate(tasks);

    StatusSnapshot snapshot{};
    snapshot.plan_id = plan.plan_id;
    snapshot.phase_order = plan.phases;
    for (auto &task : tasks) {
        if (task.phase.empty()) {
            task.phase = derive_phase(task.id);
        }
        if (std::find(snapshot.phase_order.begin(), snapshot.phase_order.end(), task.phase) ==
            snapshot.phase_order.end()) {
            snapshot.phase_order.push_back(task.phase);
        }
        task.status = TaskStatus::Pending;
        task.retry_count = 0;
        task.last_error.reset();
        snapshot.task_order.push_back(task.id);
        snapshot.tasks.emplace(task.id, std::move(task));
    }
    snapshot.recalculate_summary();
    snapshot.updated_at = Time::now_iso8601();

    return locked_update(plan.plan_id, [&]() -> Result<StatusSnapshot> {
        std::error_code ec;
        if (std::filesystem::exists(status_path(plan.plan_id), ec)) {
            return make_error(
                    OrchErrc::PlanExists,
                    std::format("plan '{}' is already initialized", plan.plan_id));
        }
        if (auto written = persist(snapshot); !written) {
            return tl::unexpected(written.error());
        }
        PLANORCH_LOGC_INFO(
                EngineLog::Store,
                "Initialized plan '{}' with {} tasks in {} phases",
                snapshot.plan_id,
                snapshot.tasks.size(),
                snapshot.phase_order.size());
        return snapshot;
    });
}

Result<StatusSnapshot> StatusStore::read(const std::string_view plan_id) const {
    if (auto valid = validate_plan_id(plan_id); !valid) {
        return tl::unexpected(valid.error());
    }
    auto text = read_file(status_path(plan_id));
    if (!text) {
        if (text.error().is(OrchErrc::PlanNotFound)) {
            return make_error(
                    OrchErrc::PlanNotFound, std::format("plan '{}' is not initialized", plan_id));
        }
        return tl::unexpected(text.error());
    }
    auto snapshot = parse_snapshot(*text);
    if (!snapshot) {
        return make_error(
                OrchErrc::CorruptSnapshot,
                std::format("plan '{}': {}", plan_id, snapshot.error().message));
    }
    if (snapshot->plan_id != plan_id) {
        return make_error(
                OrchErrc::CorruptSnapshot,
                std::format("plan '{}': file belongs to plan '{}'", plan_id, snapshot->plan_id));
    }
    return snapshot;
}

Result<LoadResult> StatusStore::load(const std::string_view plan_id) {
    LoadResult report{};
    auto loaded = locked_update(plan_id, [&]() -> Result<StatusSnapshot> {
        const auto persisted_text = read_file(status_path(plan_id));
        auto snapshot = read(plan_id);
        if (!snapshot) {
            return snapshot;
        }

        // parse_snapshot recalculates the summary; compare with what was on disk
        if (persisted_text) {
            const auto raw = nlohmann::json::parse(*persisted_text, nullptr, false);
            if (!raw.is_discarded() && raw.contains("summary")) {
                report.summary_repaired = raw.at("summary") != nlohmann::json(snapshot->summary);
            } else {
                report.summary_repaired = true;
            }
        }

        for (const auto &id : snapshot->task_order) {
            Task *task = snapshot->find(id);
            if (task->status == TaskStatus::InProgress) {
                task->status = TaskStatus::Pending;
                ++task->retry_count;
                task->last_error = std::string{RECOVERED_ERROR};
                report.recovered_ids.push_back(id);
            }
        }

        if (report.recovered_ids.empty() && !report.summary_repaired) {
            return snapshot;
        }

        snapshot->recalculate_summary();
        snapshot->updated_at = Time::now_iso8601();
        if (auto written = persist(*snapshot); !written) {
            return tl::unexpected(written.error());
        }
        PLANORCH_LOGC_NOTICE(
                EngineLog::Store,
                "Repaired plan '{}': {} interrupted tasks reset, summary {}",
                plan_id,
                report.recovered_ids.size(),
                report.summary_repaired ? "recalculated" : "unchanged");
        return snapshot;
    });

    if (!loaded) {
        return tl::unexpected(loaded.error());
    }
    report.snapshot = std::move(*loaded);
    return report;
}

Result<StatusSnapshot>
StatusStore::mutate(const std::string_view plan_id, const Mutation &mutation) {
    return locked_update(plan_id, [&]() -> Result<StatusSnapshot> {
        auto current = read(plan_id);
        if (!current) {
            return current;
        }
        StatusSnapshot next = *current;
        if (auto applied = mutation(next); !applied) {
            return tl::unexpected(applied.error());
        }
        if (auto valid = validate_mutation(*current, next); !valid) {
            PLANORCH_LOGC_ERROR(
                    EngineLog::Store, "Rejected mutation of '{}': {}", plan_id,
                    valid.error().message);
            return tl::unexpected(valid.error());
        }
        next.recalculate_summary();
        next.updated_at = Time::now_iso8601();
        if (auto written = persist(next); !written) {
            return tl::unexpected(written.error());
        }
        PLANORCH_LOGC_TRACE_L1(EngineLog::Store, "Persisted plan '{}'", plan_id);
        return next;
    });
}

Result<std::string> StatusStore::start_run(const std::string_view plan_id) {
    std::string run_id;
    auto updated = mutate(plan_id, [&run_id](StatusSnapshot &snapshot) -> Status {
        run_id = std::format("run-{}", Time::now_ms());
        const auto taken = [&snapshot](const std::string &candidate) {
            return std::any_of(
                    snapshot.runs.begin(), snapshot.runs.end(), [&candidate](const RunRecord &run) {
                        return run.run_id == candidate;
                    });
        };
        const std::string base = run_id;
        for (int suffix = 1; taken(run_id); ++suffix) {
            run_id = std::format("{}-{}", base, suffix);
        }
        snapshot.runs.push_back(RunRecord{
                .run_id = run_id,
                .started_at = Time::now_iso8601(),
                .completed_at = std::nullopt,
                .tasks_attempted = 0,
                .tasks_failed = 0,
                .end_reason = std::nullopt});
        return {};
    });
    if (!updated) {
        return tl::unexpected(updated.error());
    }
    return run_id;
}

Result<StatusSnapshot> StatusStore::complete_run(
        const std::string_view plan_id,
        const std::string_view run_id,
        const std::uint32_t tasks_attempted,
        const std::uint32_t tasks_failed,
        const std::string_view end_reason) {
    return mutate(plan_id, [&](StatusSnapshot &snapshot) -> Status {
        for (auto &run : snapshot.runs) {
            if (run.run_id != run_id) {
                continue;
            }
            if (run.completed_at.has_value()) {
                return make_error(
                        OrchErrc::InvalidTransition,
                        std::format("run '{}' is already completed", run_id));
            }
            run.completed_at = Time::now_iso8601();
            run.tasks_attempted = tasks_attempted;
            run.tasks_failed = tasks_failed;
            run.end_reason = std::string{end_reason};
            return {};
        }
        return make_error(OrchErrc::InvalidParameter, std::format("unknown run '{}'", run_id));
    });
}

} // namespace planorch::engine
