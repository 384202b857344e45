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
 * @file task_types.hpp
 * @brief Plan, task and status snapshot data model
 */

#ifndef PLANORCH_ENGINE_TASK_TYPES_HPP
#define PLANORCH_ENGINE_TASK_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <wise_enum.h>

namespace planorch::engine {

/**
 * Lifecycle state of a task
 *
 * Wire names: pending, in_progress, completed, failed, skipped.
 */
enum class TaskStatus : std::uint8_t {
    Pending,    //!< Waiting for dependencies or dispatch
    InProgress, //!< Dispatched to the agent runner
    Completed,  //!< Finished successfully
    Failed,     //!< Retries exhausted
    Skipped     //!< Skipped by an operator or the stuck policy
};

} // namespace planorch::engine

WISE_ENUM_ADAPT(planorch::engine::TaskStatus, Pending, InProgress, Completed, Failed, Skipped)

namespace planorch::engine {

/**
 * Get the persisted name of a status
 *
 * @param[in] status Task status
 * @return Wire name, e.g. "in_progress"
 */
[[nodiscard]] std::string_view to_wire(TaskStatus status) noexcept;

/**
 * Parse a persisted status name
 *
 * @param[in] name Wire name
 * @return Status, or std::nullopt for an unknown name
 */
[[nodiscard]] std::optional<TaskStatus> task_status_from_wire(std::string_view name) noexcept;

/**
 * Check whether a status is terminal (completed, failed or skipped)
 */
[[nodiscard]] constexpr bool is_terminal(const TaskStatus status) noexcept {
    return status == TaskStatus::Completed || status == TaskStatus::Failed ||
           status == TaskStatus::Skipped;
}

/**
 * Check whether a dependency in this status unblocks its dependents
 */
[[nodiscard]] constexpr bool satisfies_dependency(const TaskStatus status) noexcept {
    return status == TaskStatus::Completed || status == TaskStatus::Skipped;
}

/**
 * One unit of work in a plan
 *
 * Identity and structure (id, description, phase, dependencies, group, files)
 * are fixed at plan initialization. Only status, retry_count and last_error
 * change during execution.
 */
struct Task final {
    std::string id;                             //!< Dotted "phase.index" id, unique in the plan
    std::string description;                    //!< Instruction passed to the agent runner
    std::string phase;                          //!< Owning phase id
    TaskStatus status{TaskStatus::Pending};     //!< Current lifecycle state
    std::vector<std::string> dependencies;      //!< Ids this task waits for
    std::vector<std::string> dependents;        //!< Ids waiting for this task
    std::optional<std::string> sequential_group; //!< Group whose members run one at a time
    std::vector<std::string> file_references;   //!< Files this task is expected to touch
    std::uint32_t retry_count{};                //!< Failed attempts so far
    std::optional<std::string> last_error;      //!< Message of the most recent failure

    bool operator==(const Task &) const = default;
};

/**
 * One invocation of the orchestration loop
 */
struct RunRecord final {
    std::string run_id;                      //!< "run-<epoch ms>"
    std::string started_at;                  //!< ISO-8601 UTC
    std::optional<std::string> completed_at; //!< Set once when the run ends
    std::uint32_t tasks_attempted{};         //!< Dispatches during the run
    std::uint32_t tasks_failed{};            //!< Tasks that became failed during the run
    std::optional<std::string> end_reason;   //!< completed, blocked, cancelled, error

    bool operator==(const RunRecord &) const = default;
};

/**
 * Per-status task counts
 */
struct Summary final {
    std::uint32_t total_tasks{};
    std::uint32_t pending{};
    std::uint32_t in_progress{};
    std::uint32_t completed{};
    std::uint32_t failed{};
    std::uint32_t skipped{};

    bool operator==(const Summary &) const = default;
};

/**
 * Authoritative persisted state of one plan
 */
struct StatusSnapshot final {
    static constexpr int SCHEMA_VERSION = 1; //!< Current on-disk schema

    int schema_version{SCHEMA_VERSION};           //!< Schema of the persisted file
    std::string plan_id;                          //!< Plan identifier
    std::vector<std::string> phase_order;         //!< Phase ids in plan order
    std::vector<std::string> task_order;          //!< Task ids in declared order
    std::map<std::string, Task, std::less<>> tasks; //!< Tasks keyed by id
    std::vector<RunRecord> runs;                  //!< Append-only run history
    Summary summary;                              //!< Counts derived from tasks
    std::string updated_at;                       //!< ISO-8601 UTC of the last write

    [[nodiscard]] const Task *find(std::string_view id) const;
    [[nodiscard]] Task *find(std::string_view id);

    /**
     * Position of a phase in phase_order
     *
     * @param[in] phase Phase id
     * @return Index in phase_order, or phase_order.size() for unknown phases
     */
    [[nodiscard]] std::size_t phase_rank(std::string_view phase) const;

    /**
     * Recompute summary from the task statuses
     */
    void recalculate_summary();

    /**
     * Compare two snapshots ignoring updated_at
     *
     * @param[in] other Snapshot to compare with
     * @return true if every persisted field other than updated_at matches
     */
    [[nodiscard]] bool equivalent_to(const StatusSnapshot &other) const;
};

/**
 * Parser output used to initialize a plan
 */
struct PlanDefinition final {
    std::string plan_id;             //!< Plan identifier
    std::vector<std::string> phases; //!< Phase ids in order (derived from tasks when empty)
    std::vector<Task> tasks;         //!< Tasks in declared order
};

/**
 * Count tasks per status
 *
 * @param[in] snapshot Snapshot to count
 * @return Recomputed summary
 */
[[nodiscard]] Summary compute_summary(const StatusSnapshot &snapshot);

/**
 * Natural ordering of dotted task ids
 *
 * Numeric segments compare numerically ("1.2" < "1.10"); non-numeric
 * segments compare lexically; a prefix orders first ("1" < "1.1").
 *
 * @param[in] lhs First id
 * @param[in] rhs Second id
 * @return Negative, zero or positive like strcmp
 */
[[nodiscard]] int compare_task_ids(std::string_view lhs, std::string_view rhs) noexcept;

/**
 * Derive the phase id from a dotted task id
 *
 * @param[in] task_id Task id such as "2.3"
 * @return Text before the first '.', or the whole id when it has no '.'
 */
[[nodiscard]] std::string derive_phase(std::string_view task_id);

} // namespace planorch::engine

#endif // PLANORCH_ENGINE_TASK_TYPES_HPP
