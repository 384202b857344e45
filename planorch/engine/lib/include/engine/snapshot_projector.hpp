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
 * @file snapshot_projector.hpp
 * @brief Rebuild a status snapshot by replaying the event log
 */

#ifndef PLANORCH_ENGINE_SNAPSHOT_PROJECTOR_HPP
#define PLANORCH_ENGINE_SNAPSHOT_PROJECTOR_HPP

#include <cstdint>
#include <optional>
#include <vector>

#include "engine/engine_errors.hpp"
#include "engine/event.hpp"
#include "engine/task_types.hpp"

namespace planorch::engine {

/**
 * Incremental event-to-snapshot projection
 *
 * plan.initialized resets the projection to its snapshot payload. Task
 * events carrying a status apply the post-transition
 * {status, retryCount, lastError}; run.started and run.completed insert or
 * replace the run record with the same runId. Other events leave the
 * projection unchanged. The result is compared with the live snapshot
 * through StatusSnapshot::equivalent_to().
 */
class SnapshotProjector final {
public:
    /**
     * Apply one event
     *
     * @param[in] event Event in id order
     * @return Empty on success; CorruptSnapshot for a task or run event seen
     *         before plan.initialized or a malformed payload; TaskNotFound
     *         for an unknown task id
     */
    [[nodiscard]] Status apply(const Event &event);

    /**
     * Current projection, std::nullopt before plan.initialized
     */
    [[nodiscard]] const std::optional<StatusSnapshot> &snapshot() const noexcept {
        return snapshot_;
    }

    [[nodiscard]] std::uint64_t last_event_id() const noexcept { return last_event_id_; }

    /**
     * Project a whole event sequence
     *
     * @param[in] events Events oldest first
     * @return Snapshot, or the first apply() error; CorruptSnapshot when no
     *         plan.initialized was seen
     */
    [[nodiscard]] static Result<StatusSnapshot> project(const std::vector<Event> &events);

private:
    std::optional<StatusSnapshot> snapshot_;
    std::uint64_t last_event_id_{};
};

} // namespace planorch::engine

#endif // PLANORCH_ENGINE_SNAPSHOT_PROJECTOR_HPP
