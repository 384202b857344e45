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

#include <algorithm> // for find_if
#include <cstdint>   // for uint32_t
#include <exception> // for exception
#include <format>    // for format
#include <string>    // for string
#include <utility>   // for move
#include <vector>    // for vector

#include <nlohmann/json.hpp>
#include <quill/LogMacros.h>

#include "engine/engine_errors.hpp"
#include "engine/engine_log.hpp"
#include "engine/event.hpp"
#include "engine/json_codec.hpp"
#include "engine/snapshot_projector.hpp"
#include "engine/task_types.hpp"
#include "log/planorch_log_macros.hpp"

namespace planorch::engine {

namespace {

bool is_task_event(const EventType type) noexcept {
    switch (type) {
    case EventType::TaskStarted:
    case EventType::TaskCompleted:
    case EventType::TaskFailed:
    case EventType::TaskRetrying:
    case EventType::TaskStuck:
    case EventType::TaskSkipped:
        return true;
    default:
        return false;
    }
}

} // namespace

Status SnapshotProjector::apply(const Event &event) {
    last_event_id_ = event.id;

    if (event.type == EventType::PlanInitialized) {
        auto initial = snapshot_from_json(event.payload);
        if (!initial) {
            return tl::unexpected(initial.error());
        }
        snapshot_ = std::move(*initial);
        return {};
    }

    const bool task_event = is_task_event(event.type);
    const bool run_event =
            event.type == EventType::RunStarted || event.type == EventType::RunCompleted;
    if (!task_event && !run_event) {
        return {};
    }
    if (!snapshot_.has_value()) {
        return make_error(
                OrchErrc::CorruptSnapshot,
                std::format("event {} precedes plan.initialized", event.id));
    }

    try {
        if (task_event) {
            if (!event.payload.contains("status")) {
                return {};
            }
            const auto task_id = event.payload.at("taskId").get<std::string>();
            Task *task = snapshot_->find(task_id);
            if (task == nullptr) {
                return make_error(
                        OrchErrc::TaskNotFound,
                        std::format("event {} names unknown task '{}'", event.id, task_id));
            }
            task->status = event.payload.at("status").get<TaskStatus>();
            task->retry_count = event.payload.value("retryCount", task->retry_count);
            if (const auto it = event.payload.find("lastError");
                it != event.payload.end() && it->is_string()) {
                task->last_error = it->get<std::string>();
            } else {
                task->last_error.reset();
            }
        } else {
            auto run = event.payload.get<RunRecord>();
            auto &runs = snapshot_->runs;
            const auto existing = std::find_if(runs.begin(), runs.end(), [&run](const auto &r) {
                return r.run_id == run.run_id;
            });
            if (existing != runs.end()) {
                *existing = std::move(run);
            } else {
                runs.push_back(std::move(run));
            }
        }
    } catch (const std::exception &e) {
        return make_error(
                OrchErrc::CorruptSnapshot,
                std::format("event {} has a malformed payload: {}", event.id, e.what()));
    }

    snapshot_->recalculate_summary();
    snapshot_->updated_at = event.timestamp;
    return {};
}

Result<StatusSnapshot> SnapshotProjector::project(const std::vector<Event> &events) {
    SnapshotProjector projector;
    for (const auto &event : events) {
        if (auto applied = projector.apply(event); !applied) {
            PLANORCH_LOGC_WARN(
                    EngineLog::Projector,
                    "Projection stopped at event {}: {}",
                    event.id,
                    applied.error().to_string());
            return tl::unexpected(std::move(applied.error()));
        }
    }
    if (!projector.snapshot_.has_value()) {
        return make_error(OrchErrc::CorruptSnapshot, "event log has no plan.initialized event");
    }
    return std::move(*projector.snapshot_);
}

} // namespace planorch::engine
