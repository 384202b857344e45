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
 * @file status_store.hpp
 * @brief Crash-safe persistence of plan status snapshots
 */

#ifndef PLANORCH_ENGINE_STATUS_STORE_HPP
#define PLANORCH_ENGINE_STATUS_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <parallel_hashmap/phmap.h>

#include "engine/engine_errors.hpp"
#include "engine/task_types.hpp"
#include "engine/time.hpp"

namespace planorch::engine {

/**
 * Status store configuration
 */
struct StatusStoreConfig final {
    static constexpr Millis DEFAULT_LOCK_TIMEOUT{5000}; //!< Default lock acquisition bound

    std::filesystem::path state_dir;          //!< Root directory holding one subdirectory per plan
    Millis lock_timeout{DEFAULT_LOCK_TIMEOUT}; //!< Maximum wait for the per-plan lock
};

/**
 * Result of StatusStore::load()
 */
struct LoadResult final {
    StatusSnapshot snapshot;                //!< Repaired snapshot as persisted
    std::vector<std::string> recovered_ids; //!< Tasks reset from in_progress to pending
    bool summary_repaired{};                //!< Persisted summary did not match the tasks
};

/**
 * Single source of truth for a plan's execution state
 *
 * Snapshots live at "<state_dir>/<planId>/status.json". Every write happens
 * under an exclusive per-plan lock (an in-process mutex plus flock on
 * "status.lock") and replaces the file atomically, so concurrent readers
 * never observe a partial document and concurrent writers never lose an
 * update. Reads take no lock.
 *
 * Thread-safe.
 */
class StatusStore final {
public:
    /**
     * Mutation applied under the plan lock
     *
     * The function edits the snapshot in place. Returning an error aborts the
     * mutation without writing.
     */
    using Mutation = std::function<Status(StatusSnapshot &)>;

    /**
     * Create a store rooted at config.state_dir
     *
     * @param[in] config Store configuration
     * @throws std::invalid_argument if state_dir is empty or lock_timeout is not positive
     */
    explicit StatusStore(StatusStoreConfig config);

    /**
     * Create the initial snapshot of a plan
     *
     * Builds the dependency graph first; a ValidationError or CycleError
     * aborts before anything is written.
     *
     * @param[in] plan Parser output
     * @return Persisted snapshot, or ValidationError, CycleError, PlanExists, LockTimeout, IoError
     */
    [[nodiscard]] Result<StatusSnapshot> init(const PlanDefinition &plan);

    /**
     * Load, repair and persist the snapshot of a plan
     *
     * Tasks left in_progress by a previous process are reset to pending with
     * retryCount + 1 and the summary is recalculated.
     *
     * @param[in] plan_id Plan identifier
     * @return Repaired snapshot and repair report, or PlanNotFound,
     *         CorruptSnapshot, LockTimeout, IoError
     */
    [[nodiscard]] Result<LoadResult> load(std::string_view plan_id);

    /**
     * Read the last persisted snapshot without locking or repairing
     *
     * @param[in] plan_id Plan identifier
     * @return Snapshot, or PlanNotFound, CorruptSnapshot, IoError
     */
    [[nodiscard]] Result<StatusSnapshot> read(std::string_view plan_id) const;

    /**
     * Apply a mutation under the plan lock and persist the result
     *
     * The mutated snapshot is validated before writing: the task set, task
     * structure and completed run records must be unchanged and retry counts
     * must not decrease.
     *
     * @param[in] plan_id Plan identifier
     * @param[in] mutation Function editing the snapshot
     * @return New snapshot, or the mutation's error, InvalidMutation, LockTimeout, IoError
     */
    [[nodiscard]] Result<StatusSnapshot> mutate(std::string_view plan_id, const Mutation &mutation);

    /**
     * Append a run record
     *
     * @param[in] plan_id Plan identifier
     * @return Id of the new run ("run-<epoch ms>")
     */
    [[nodiscard]] Result<std::string> start_run(std::string_view plan_id);

    /**
     * Close a run record
     *
     * @param[in] plan_id Plan identifier
     * @param[in] run_id Run to close
     * @param[in] tasks_attempted Dispatches during the run
     * @param[in] tasks_failed Tasks that became failed during the run
     * @param[in] end_reason Why the run ended
     * @return Updated snapshot, or InvalidTransition if the run is already closed
     */
    [[nodiscard]] Result<StatusSnapshot> complete_run(
            std::string_view plan_id,
            std::string_view run_id,
            std::uint32_t tasks_attempted,
            std::uint32_t tasks_failed,
            std::string_view end_reason);

    [[nodiscard]] bool exists(std::string_view plan_id) const;

    [[nodiscard]] std::filesystem::path plan_dir(std::string_view plan_id) const;
    [[nodiscard]] std::filesystem::path status_path(std::string_view plan_id) const;

    [[nodiscard]] const StatusStoreConfig &config() const noexcept { return config_; }

private:
    /**
     * Run a locked read-modify-write cycle
     */
    [[nodiscard]] Result<StatusSnapshot> locked_update(
            std::string_view plan_id, const std::function<Result<StatusSnapshot>()> &body);

    [[nodiscard]] Status persist(const StatusSnapshot &snapshot) const;

    [[nodiscard]] std::timed_mutex &plan_mutex(std::string_view plan_id);

    StatusStoreConfig config_;
    std::mutex mutexes_guard_;
    phmap::flat_hash_map<std::string, std::unique_ptr<std::timed_mutex>> plan_mutexes_;
};

/**
 * Check a plan id for use as a directory name
 *
 * @param[in] plan_id Plan identifier
 * @return Empty on success, InvalidParameter for empty ids, path separators or dot names
 */
[[nodiscard]] Status validate_plan_id(std::string_view plan_id);

} // namespace planorch::engine

#endif // PLANORCH_ENGINE_STATUS_STORE_HPP
