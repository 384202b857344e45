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

#include <algorithm>   // for find, sort
#include <cstdint>     // for uint32_t
#include <format>      // for format
#include <optional>    // for optional
#include <stdexcept>   // for invalid_argument
#include <string>      // for string
#include <string_view> // for string_view
#include <unordered_set> // for unordered_set
#include <utility>     // for move
#include <vector>      // for vector

#include <nlohmann/json.hpp>

#include "engine/engine_errors.hpp"
#include "engine/json_codec.hpp"
#include "engine/task_types.hpp"

namespace planorch::engine {

namespace {

using nlohmann::json;

template <typename T>
void put_optional(json &out, const char *key, const std::optional<T> &value) {
    if (value.has_value()) {
        out[key] = *value;
    }
}

template <typename T> std::optional<T> get_optional(const json &in, const char *key) {
    const auto it = in.find(key);
    if (it == in.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->template get<T>();
}

std::vector<std::string> get_string_list(const json &in, const char *key) {
    const auto it = in.find(key);
    if (it == in.end() || it->is_null()) {
        return {};
    }
    return it->get<std::vector<std::string>>();
}

} // namespace

void to_json(json &out, const TaskStatus &status) { out = std::string{to_wire(status)}; }

void from_json(const json &in, TaskStatus &status) {
    const auto name = in.get<std::string>();
    const auto parsed = task_status_from_wire(name);
    if (!parsed.has_value()) {
        throw std::invalid_argument(std::format("unknown task status '{}'", name));
    }
    status = *parsed;
}

void to_json(json &out, const Summary &summary) {
    out = json{
            {"totalTasks", summary.total_tasks},
            {"pending", summary.pending},
            {"in_progress", summary.in_progress},
            {"completed", summary.completed},
            {"failed", summary.failed},
            {"skipped", summary.skipped}};
}

void to_json(json &out, const RunRecord &run) {
    out = json{
            {"runId", run.run_id},
            {"startedAt", run.started_at},
            {"tasksAttempted", run.tasks_attempted},
            {"tasksFailed", run.tasks_failed}};
    put_optional(out, "completedAt", run.completed_at);
    put_optional(out, "endReason", run.end_reason);
}

void from_json(const json &in, RunRecord &run) {
    run.run_id = in.at("runId").get<std::string>();
    run.started_at = in.at("startedAt").get<std::string>();
    run.tasks_attempted = in.value("tasksAttempted", std::uint32_t{0});
    run.tasks_failed = in.value("tasksFailed", std::uint32_t{0});
    run.completed_at = get_optional<std::string>(in, "completedAt");
    run.end_reason = get_optional<std::string>(in, "endReason");
}

json task_state_to_json(const Task &task) {
    json out{{"taskId", task.id}, {"status", task.status}, {"retryCount", task.retry_count}};
    put_optional(out, "lastError", task.last_error);
    return out;
}

json task_to_json(const Task &task) {
    json out{
            {"id", task.id},
            {"description", task.description},
            {"phase", task.phase},
            {"status", task.status},
            {"dependencies", task.dependencies},
            {"dependents", task.dependents},
            {"fileReferences", task.file_references},
            {"retryCount", task.retry_count}};
    put_optional(out, "sequentialGroup", task.sequential_group);
    put_optional(out, "lastError", task.last_error);
    return out;
}

Task task_from_json(const json &in, const std::string_view id) {
    Task task{};
    task.id = in.contains("id") ? in.at("id").get<std::string>() : std::string{id};
    task.description = in.value("description", std::string{});
    task.phase = in.value("phase", std::string{});
    if (task.phase.empty()) {
        task.phase = derive_phase(task.id);
    }
    task.status = in.contains("status") ? in.at("status").get<TaskStatus>() : TaskStatus::Pending;
    task.dependencies = get_string_list(in, "dependencies");
    task.dependents = get_string_list(in, "dependents");
    task.file_references = get_string_list(in, "fileReferences");
    task.sequential_group = get_optional<std::string>(in, "sequentialGroup");
    task.retry_count = in.value("retryCount", std::uint32_t{0});
    task.last_error = get_optional<std::string>(in, "lastError");
    return task;
}

json snapshot_to_json(const StatusSnapshot &snapshot) {
    json tasks = json::object();
    json graph = json::object();
    for (const auto &id : snapshot.task_order) {
        const Task *task = snapshot.find(id);
        if (task == nullptr) {
            continue;
        }
        json entry = task_to_json(*task);
        entry.erase("id");
        tasks[id] = std::move(entry);
        if (!task->dependencies.empty()) {
            graph[id] = task->dependencies;
        }
    }

    return json{
            {"schemaVersion", snapshot.schema_version},
            {"planId", snapshot.plan_id},
            {"updatedAt", snapshot.updated_at},
            {"phaseOrder", snapshot.phase_order},
            {"taskOrder", snapshot.task_order},
            {"tasks", std::move(tasks)},
            {"dependencyGraph", std::move(graph)},
            {"summary", snapshot.summary},
            {"runs", snapshot.runs}};
}

Result<StatusSnapshot> snapshot_from_json(const json &in) {
    StatusSnapshot snapshot{};
    try {
        snapshot.schema_version = in.value("schemaVersion", StatusSnapshot::SCHEMA_VERSION);
        snapshot.plan_id = in.at("planId").get<std::string>();
        snapshot.updated_at = in.value("updatedAt", std::string{});
        snapshot.phase_order = get_string_list(in, "phaseOrder");
        snapshot.task_order = get_string_list(in, "taskOrder");
        for (const auto &[id, entry] : in.at("tasks").items()) {
            snapshot.tasks.emplace(id, task_from_json(entry, id));
        }
        if (const auto runs = in.find("runs"); runs != in.end()) {
            snapshot.runs = runs->get<std::vector<RunRecord>>();
        }
    } catch (const json::exception &e) {
        return make_error(OrchErrc::CorruptSnapshot, e.what());
    } catch (const std::invalid_argument &e) {
        return make_error(OrchErrc::CorruptSnapshot, e.what());
    }

    if (snapshot.schema_version > StatusSnapshot::SCHEMA_VERSION) {
        return make_error(
                OrchErrc::CorruptSnapshot,
                std::format(
                        "schemaVersion {} is newer than supported version {}",
                        snapshot.schema_version,
                        StatusSnapshot::SCHEMA_VERSION));
    }

    // Older files may lack taskOrder; fall back to natural id order
    if (snapshot.task_order.empty()) {
        for (const auto &[id, task] : snapshot.tasks) {
            snapshot.task_order.push_back(id);
        }
        std::sort(
                snapshot.task_order.begin(),
                snapshot.task_order.end(),
                [](const std::string &a, const std::string &b) {
                    return compare_task_ids(a, b) < 0;
                });
    }

    std::unordered_set<std::string> seen;
    for (const auto &id : snapshot.task_order) {
        if (snapshot.find(id) == nullptr || !seen.insert(id).second) {
            return make_error(
                    OrchErrc::CorruptSnapshot,
                    std::format("taskOrder entry '{}' is duplicated or has no task", id));
        }
    }
    if (seen.size() != snapshot.tasks.size()) {
        return make_error(OrchErrc::CorruptSnapshot, "taskOrder does not list every task");
    }

    for (auto &[id, task] : snapshot.tasks) {
        for (const auto &dep : task.dependencies) {
            if (snapshot.find(dep) == nullptr) {
                return make_error(
                        OrchErrc::CorruptSnapshot,
                        std::format("task '{}' depends on unknown task '{}'", id, dep));
            }
        }
        if (std::find(snapshot.phase_order.begin(), snapshot.phase_order.end(), task.phase) ==
            snapshot.phase_order.end()) {
            snapshot.phase_order.push_back(task.phase);
        }
    }

    snapshot.recalculate_summary();
    return snapshot;
}

Result<StatusSnapshot> parse_snapshot(const std::string_view text) {
    json document = json::parse(text, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return make_error(OrchErrc::CorruptSnapshot, "status file is not a JSON object");
    }
    return snapshot_from_json(document);
}

Result<PlanDefinition> parse_plan_definition(const std::string_view text) {
    const json document = json::parse(text, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return make_error(OrchErrc::ValidationError, "plan document is not a JSON object");
    }

    PlanDefinition plan{};
    try {
        plan.plan_id = document.at("planId").get<std::string>();
        plan.phases = get_string_list(document, "phases");
        for (const auto &entry : document.at("tasks")) {
            Task task = task_from_json(entry);
            // Execution state is never taken from the parser
            task.status = TaskStatus::Pending;
            task.retry_count = 0;
            task.last_error.reset();
            task.dependents.clear();
            plan.tasks.push_back(std::move(task));
        }
    } catch (const json::exception &e) {
        return make_error(OrchErrc::ValidationError, e.what());
    } catch (const std::invalid_argument &e) {
        return make_error(OrchErrc::ValidationError, e.what());
    }

    if (plan.plan_id.empty()) {
        return make_error(OrchErrc::ValidationError, "planId must not be empty");
    }
    return plan;
}

} // namespace planorch::engine
