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
 * @file json_codec.hpp
 * @brief JSON encoding of snapshots, run records and plan definitions
 *
 * Field names follow the persisted camelCase schema (planId, retryCount,
 * fileReferences, ...). Optional fields are omitted when unset.
 */

#ifndef PLANORCH_ENGINE_JSON_CODEC_HPP
#define PLANORCH_ENGINE_JSON_CODEC_HPP

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "engine/engine_errors.hpp"
#include "engine/task_types.hpp"

namespace planorch::engine {

void to_json(nlohmann::json &json, const TaskStatus &status);
void from_json(const nlohmann::json &json, TaskStatus &status);
void to_json(nlohmann::json &json, const Summary &summary);
void to_json(nlohmann::json &json, const RunRecord &run);
void from_json(const nlohmann::json &json, RunRecord &run);

/**
 * Encode the mutable part of a task (the event payload shape)
 *
 * @param[in] task Task to encode
 * @return {taskId, status, retryCount, lastError?}
 */
[[nodiscard]] nlohmann::json task_state_to_json(const Task &task);

/**
 * Encode a full task record, including its id
 */
[[nodiscard]] nlohmann::json task_to_json(const Task &task);

/**
 * Decode a full task record
 *
 * @param[in] json Task object; "id" may be absent when id is passed explicitly
 * @param[in] id Task id to use when the object has no "id" member
 * @throws nlohmann::json::exception on missing or mistyped fields
 * @throws std::invalid_argument on an unknown status name
 */
[[nodiscard]] Task task_from_json(const nlohmann::json &json, std::string_view id = {});

/**
 * Encode a snapshot in the persisted layout
 *
 * @param[in] snapshot Snapshot to encode
 * @return JSON document including the derived dependencyGraph member
 */
[[nodiscard]] nlohmann::json snapshot_to_json(const StatusSnapshot &snapshot);

/**
 * Decode and structurally validate a persisted snapshot
 *
 * @param[in] json Parsed document
 * @return Snapshot, or CorruptSnapshot naming the first problem found
 */
[[nodiscard]] Result<StatusSnapshot> snapshot_from_json(const nlohmann::json &json);

/**
 * Parse snapshot text
 *
 * @param[in] text File contents
 * @return Snapshot, or CorruptSnapshot when the text is not valid JSON or fails validation
 */
[[nodiscard]] Result<StatusSnapshot> parse_snapshot(std::string_view text);

/**
 * Parse a plan definition produced by the plan document parser
 *
 * @param[in] text JSON plan document
 * @return Plan definition, or ValidationError when the document is malformed
 */
[[nodiscard]] Result<PlanDefinition> parse_plan_definition(std::string_view text);

} // namespace planorch::engine

#endif // PLANORCH_ENGINE_JSON_CODEC_HPP
