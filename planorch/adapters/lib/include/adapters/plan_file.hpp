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
 * @file plan_file.hpp
 * @brief Loading plan definitions written by the plan document parser
 */

#ifndef PLANORCH_ADAPTERS_PLAN_FILE_HPP
#define PLANORCH_ADAPTERS_PLAN_FILE_HPP

#include <filesystem>

#include "engine/engine_errors.hpp"
#include "engine/task_types.hpp"

namespace planorch::adapters {

/**
 * Load a JSON plan file
 *
 * @param[in] path Plan file path
 * @return Plan definition; PlanNotFound if the file does not exist, IoError
 *         if it cannot be read, ValidationError if it is malformed
 */
[[nodiscard]] engine::Result<engine::PlanDefinition>
load_plan_file(const std::filesystem::path &path);

} // namespace planorch::adapters

#endif // PLANORCH_ADAPTERS_PLAN_FILE_HPP
