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
 * @file scheduler.hpp
 * @brief Ready-task selection under dependency, sequential and file constraints
 */

#ifndef PLANORCH_ENGINE_SCHEDULER_HPP
#define PLANORCH_ENGINE_SCHEDULER_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <vector>

#include <wise_enum.h>

#include "engine/task_types.hpp"

namespace planorch::engine {

/**
 * Kind of execution constraint
 */
enum class ConstraintKind : std::uint8_t {
    Sequential,  //!< Members run one at a time in declared order
    FileConflict //!< Members must never run concurrently
};

} // namespace planorch::engine

WISE_ENUM_ADAPT(planorch::engine::ConstraintKind, Sequential, FileConflict)

namespace planorch::engine {

/**
 * Rule restricting which ready tasks may run together
 */
struct ExecutionConstraint final {
    ConstraintKind kind{ConstraintKind::Sequential}; //!< Constraint kind
    std::string name;                                //!< Group id or shared file path
    std::vector<std::string> members;                //!< Member task ids (declared order)
    std::string reason;                              //!< Human readable origin
};

/**
 * Options for one scheduling decision
 */
struct ScheduleOptions final {
    std::size_t max_count{std::numeric_limits<std::size_t>::max()}; //!< Upper bound on ready tasks
    bool ignore_sequential{};  //!< Skip sequential filtering
    bool force_dependencies{}; //!< Treat unmet dependencies as met (operator override)
};

/**
 * Outcome of one scheduling decision
 */
struct ScheduleResult final {
    std::vector<Task> ready;                    //!< Tasks to dispatch, highest priority first
    std::map<std::string, std::string> blocked; //!< Pending task id -> blocked reason
    std::vector<std::string> forced;            //!< Ready tasks whose dependencies were overridden
};

/**
 * Derive constraints implied by the snapshot's task annotations
 *
 * One Sequential constraint per sequential group (members in declared order)
 * and one FileConflict constraint per file referenced by two or more tasks
 * (members in phase then natural id order).
 *
 * @param[in] snapshot Plan snapshot
 * @return Derived constraints
 */
[[nodiscard]] std::vector<ExecutionConstraint> derive_constraints(const StatusSnapshot &snapshot);

/**
 * Pure ready-task selector
 *
 * Selection pipeline:
 *  -# candidates: pending tasks whose dependencies are all completed or skipped
 *  -# sequential filtering: per group only the earliest unfinished member is
 *     eligible, and only when it is not in progress or failed
 *  -# file-conflict filtering: in-progress tasks occupy their files first,
 *     then candidates claim files in (phase, id) order
 *  -# phase priority: survivors sorted by phase order, then natural id order,
 *     truncated to max_count
 *
 * Blocked reasons have the form "dependency:<id>", "sequential:<group>" and
 * "fileConflict:<id>". The result does not depend on task iteration order.
 */
class Scheduler final {
public:
    /**
     * Select ready tasks
     *
     * @param[in] snapshot Current plan snapshot
     * @param[in] constraints Explicit constraints (usually derive_constraints() output)
     * @param[in] options Selection options
     * @return Ready tasks and reasons for every pending task left behind
     */
    [[nodiscard]] static ScheduleResult ready_tasks(
            const StatusSnapshot &snapshot,
            const std::vector<ExecutionConstraint> &constraints,
            const ScheduleOptions &options = {});

    /**
     * Select ready tasks using the constraints derived from the snapshot
     */
    [[nodiscard]] static ScheduleResult
    ready_tasks(const StatusSnapshot &snapshot, const ScheduleOptions &options = {});
};

} // namespace planorch::engine

#endif // PLANORCH_ENGINE_SCHEDULER_HPP
