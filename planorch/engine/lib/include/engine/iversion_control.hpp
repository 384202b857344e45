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

#ifndef PLANORCH_ENGINE_IVERSION_CONTROL_HPP
#define PLANORCH_ENGINE_IVERSION_CONTROL_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "engine/engine_errors.hpp"

namespace planorch::engine {

/**
 * @class IVersionControl
 * @brief Interface for the version control collaborator
 *
 * Called only from the commit queue worker and from the orchestrator start
 * sequence, never concurrently with itself.
 */
class IVersionControl {
public:
    /**
     * Default constructor.
     */
    IVersionControl() = default;

    /**
     * Virtual destructor.
     */
    virtual ~IVersionControl() = default;

    IVersionControl(IVersionControl &&) = default;
    IVersionControl &operator=(IVersionControl &&) = default;
    IVersionControl(const IVersionControl &) = delete;
    IVersionControl &operator=(const IVersionControl &) = delete;

    /**
     * Stage files and create one commit
     *
     * @param[in] message Full commit message, including trailers
     * @param[in] files Paths to stage; empty stages all changes
     * @return Commit identifier, or CommitFailed
     */
    [[nodiscard]] virtual Result<std::string>
    commit(const std::string &message, const std::vector<std::string> &files) = 0;

    /**
     * Look up a commit by its queue entry trailer
     *
     * @param[in] entry_id Queue entry id carried as "Queue-Entry: <id>"
     * @return Commit identifier if such a commit exists, std::nullopt otherwise
     */
    [[nodiscard]] virtual Result<std::optional<std::string>>
    find_commit(std::string_view entry_id) = 0;

    /**
     * Check the working tree for uncommitted changes
     */
    [[nodiscard]] virtual Result<bool> has_uncommitted_changes() = 0;

    /**
     * Stash uncommitted changes
     *
     * @param[in] message Stash description
     */
    [[nodiscard]] virtual Status stash(const std::string &message) = 0;
};

} // namespace planorch::engine

#endif // PLANORCH_ENGINE_IVERSION_CONTROL_HPP
