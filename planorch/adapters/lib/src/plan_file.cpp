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
 * @file plan_file.cpp
 * @brief Loading plan definitions written by the plan document parser
 */

#include <filesystem> // for path

#include <quill/LogMacros.h>

#include "adapters/adapters_log.hpp"
#include "adapters/plan_file.hpp"
#include "engine/engine_errors.hpp"
#include "engine/file_io.hpp"
#include "engine/json_codec.hpp"
#include "engine/task_types.hpp"
#include "log/planorch_log_macros.hpp"

namespace planorch::adapters {

namespace pe = planorch::engine;

pe::Result<pe::PlanDefinition> load_plan_file(const std::filesystem::path &path) {
    const auto text = pe::read_file(path);
    if (!text) {
        PLANORCH_LOGC_ERROR(
                AdapterLog::PlanFile,
                "Cannot read plan file '{}': {}",
                path.string(),
                text.error().to_string());
        return tl::unexpected(text.error());
    }
    auto plan = pe::parse_plan_definition(*text);
    if (!plan) {
        PLANORCH_LOGC_ERROR(
                AdapterLog::PlanFile,
                "Plan file '{}' rejected: {}",
                path.string(),
                plan.error().to_string());
        return plan;
    }
    PLANORCH_LOGC_INFO(
            AdapterLog::PlanFile,
            "Loaded plan '{}' with {} tasks from '{}'",
            plan->plan_id,
            plan->tasks.size(),
            path.string());
    return plan;
}

} // namespace planorch::adapters
