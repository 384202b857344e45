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
 * @file scheduler.cpp
 * @brief Ready-task selection pipeline
 */

#include <algorithm>   // for sort, find_if
#include <cstddef>     // for size_t
#include <map>         // for map
#include <string>      // for string
#include <string_view> // for string_view
#include <utility>     // for move
#include <vector>      // for vector

#include <parallel_hashmap/phmap.h>
#include <quill/LogMacros.h>

#include "engine/engine_log.hpp"
#include "engine/scheduler.hpp"
#include "engine/task_types.hpp"
#include "log/planorch_log_macros.hpp"

namespace planorch::engine {

namespace {

/// Orders tasks by phase position, then natural id order
struct PriorityOrder final {
    const StatusSnapshot *snapshot;

    bool operator()(const Task *lhs, const Task *rhs) const {
        const auto lrank = snapshot->phase_rank(lhs->phase);
        const auto rrank = snapshot->phase_rank(rhs->phase);
        if (lrank != rrank) {
            return lrank < rrank;
        }
        return compare_task_ids(lhs->id, rhs->id) < 0;
    }
};

std::string resource_key_for_file(const std::string &path) { return "file:" + path; }

std::string resource_key_for_constraint(const std::string &name) { return "conflict:" + name; }

} // namespace

std::vector<ExecutionConstraint> derive_constraints(const StatusSnapshot &snapshot) {
    std::vector<ExecutionConstraint> constraints;

    std::map<std::string, std::vector<std::string>> groups;
    std::vector<std::string> group_order;
    std::map<std::string, std::vector<const Task *>> file_users;

    for (const auto &id : snapshot.task_order) {
        const Task *task = snapshot.find(id);
        if (task == nullptr) {
            continue;
        }
        if (task->sequential_group.has_value()) {
            auto [it, inserted] = groups.try_emplace(*task->sequential_group);
            if (inserted) {
                group_order.push_back(*task->sequential_group);
            }
            it->second.push_back(id);
        }
        for (const auto &file : task->file_references) {
            file_users[file].push_back(task);
        }
    }

    for (const auto &group : group_order) {
        constraints.push_back(ExecutionConstraint{
                .kind = ConstraintKind::Sequential,
                .name = group,
                .members = groups.at(group),
                .reason = "sequential group"});
    }

    const PriorityOrder order{&snapshot};
    for (auto &[file, users] : file_users) {
        if (users.size() < 2) {
            continue;
        }
        std::sort(users.begin(), users.end(), order);
        ExecutionConstraint constraint{
                .kind = ConstraintKind::FileConflict,
                .name = file,
                .members = {},
                .reason = "shared file reference"};
        for (const Task *task : users) {
            constraint.members.push_back(task->id);
        }
        constraints.push_back(std::move(constraint));
    }
    return constraints;
}

ScheduleResult Scheduler::ready_tasks(
        const StatusSnapshot &snapshot,
        const std::vector<ExecutionConstraint> &constraints,
        const ScheduleOptions &options) {
    ScheduleResult result{};
    const PriorityOrder order{&snapshot};

    // Candidates: pending with every dependency satisfied
    std::vector<const Task *> candidates;
    phmap::flat_hash_set<std::string_view> forced;
    for (const auto &id : snapshot.task_order) {
        const Task *task = snapshot.find(id);
        if (task == nullptr || task->status != TaskStatus::Pending) {
            continue;
        }
        const auto unmet = std::find_if(
                task->dependencies.begin(), task->dependencies.end(), [&snapshot](const auto &dep) {
                    const Task *dep_task = snapshot.find(dep);
                    return dep_task == nullptr || !satisfies_dependency(dep_task->status);
                });
        if (unmet != task->dependencies.end()) {
            if (!options.force_dependencies) {
                result.blocked.emplace(id, "dependency:" + *unmet);
                continue;
            }
            forced.insert(task->id);
        }
        candidates.push_back(task);
    }

    // Sequential filtering: only the earliest unfinished member of each group may run
    if (!options.ignore_sequential) {
        phmap::flat_hash_map<std::string_view, std::string> sequential_block;
        for (const auto &constraint : constraints) {
            if (constraint.kind != ConstraintKind::Sequential) {
                continue;
            }
            const Task *head = nullptr;
            for (const auto &member : constraint.members) {
                const Task *task = snapshot.find(member);
                if (task != nullptr && !satisfies_dependency(task->status)) {
                    head = task;
                    break;
                }
            }
            if (head == nullptr) {
                continue;
            }
            const bool head_runnable = head->status == TaskStatus::Pending;
            for (const auto &member : constraint.members) {
                if (head_runnable && member == head->id) {
                    continue;
                }
                sequential_block.try_emplace(member, "sequential:" + constraint.name);
            }
        }

        std::vector<const Task *> allowed;
        allowed.reserve(candidates.size());
        for (const Task *task : candidates) {
            if (const auto it = sequential_block.find(task->id); it != sequential_block.end()) {
                result.blocked.emplace(task->id, it->second);
            } else {
                allowed.push_back(task);
            }
        }
        candidates = std::move(allowed);
    }

    // Resources: referenced files plus membership in explicit conflict sets
    phmap::flat_hash_map<std::string_view, std::vector<std::string>> resources;
    const auto resources_of = [&](const Task *task) -> const std::vector<std::string> & {
        auto [it, inserted] = resources.try_emplace(task->id);
        if (inserted) {
            for (const auto &file : task->file_references) {
                it->second.push_back(resource_key_for_file(file));
            }
            for (const auto &constraint : constraints) {
                if (constraint.kind == ConstraintKind::FileConflict &&
                    std::find(constraint.members.begin(), constraint.members.end(), task->id) !=
                            constraint.members.end()) {
                    it->second.push_back(resource_key_for_constraint(constraint.name));
                }
            }
        }
        return it->second;
    };

    std::vector<const Task *> running;
    for (const auto &[id, task] : snapshot.tasks) {
        if (task.status == TaskStatus::InProgress) {
            running.push_back(&task);
        }
    }
    std::sort(running.begin(), running.end(), order);
    std::sort(candidates.begin(), candidates.end(), order);

    phmap::flat_hash_map<std::string, std::string> occupied;
    for (const Task *task : running) {
        for (const auto &key : resources_of(task)) {
            occupied.try_emplace(key, task->id);
        }
    }

    for (const Task *task : candidates) {
        if (result.ready.size() >= options.max_count) {
            break;
        }
        const auto &keys = resources_of(task);
        const auto clash = std::find_if(keys.begin(), keys.end(), [&occupied](const auto &key) {
            return occupied.contains(key);
        });
        if (clash != keys.end()) {
            result.blocked.emplace(task->id, "fileConflict:" + occupied.at(*clash));
            continue;
        }
        for (const auto &key : keys) {
            occupied.emplace(key, task->id);
        }
        result.ready.push_back(*task);
        if (forced.contains(task->id)) {
            result.forced.push_back(task->id);
        }
    }

    PLANORCH_LOGC_TRACE_L1(
            EngineLog::Scheduler,
            "Plan '{}': {} ready, {} blocked",
            snapshot.plan_id,
            result.ready.size(),
            result.blocked.size());
    return result;
}

ScheduleResult
Scheduler::ready_tasks(const StatusSnapshot &snapshot, const ScheduleOptions &options) {
    return ready_tasks(snapshot, derive_constraints(snapshot), options);
}

} // namespace planorch::engine
