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
 * @file git_version_control.hpp
 * @brief Version control collaborator backed by the git command line
 */

#ifndef PLANORCH_ADAPTERS_GIT_VERSION_CONTROL_HPP
#define PLANORCH_ADAPTERS_GIT_VERSION_CONTROL_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "adapters/process.hpp"
#include "engine/engine_errors.hpp"
#include "engine/iversion_control.hpp"
#include "engine/time.hpp"

namespace planorch::adapters {

/**
 * Git collaborator configuration
 */
struct GitVersionControlConfig final {
    static constexpr engine::Millis DEFAULT_TIMEOUT{60000};

    std::filesystem::path repo_dir;          //!< Working tree; empty uses the current directory
    std::string git{"git"};                  //!< git executable
    engine::Millis timeout{DEFAULT_TIMEOUT}; //!< Limit per git invocation
};

/**
 * @class GitVersionControl
 * @brief Runs git add, commit, log, status and stash in one working tree
 *
 * Commits are created even when nothing is staged so that every queue entry
 * leaves a commit carrying its trailer.
 */
class GitVersionControl final : public engine::IVersionControl {
public:
    /**
     * @param[in] config Repository and git executable
     * @throws std::invalid_argument if git or the timeout is invalid
     */
    explicit GitVersionControl(GitVersionControlConfig config);

    [[nodiscard]] engine::Result<std::string>
    commit(const std::string &message, const std::vector<std::string> &files) override;

    [[nodiscard]] engine::Result<std::optional<std::string>>
    find_commit(std::string_view entry_id) override;

    [[nodiscard]] engine::Result<bool> has_uncommitted_changes() override;

    [[nodiscard]] engine::Status stash(const std::string &message) override;

private:
    /**
     * Run git with arguments
     *
     * @param[in] args Arguments after "git"
     * @param[in] failure Error code reported when git fails
     * @return Captured stdout, or the failure with the stderr tail
     */
    [[nodiscard]] engine::Result<std::string>
    git(std::vector<std::string> args, engine::OrchErrc failure) const;

    GitVersionControlConfig config_;
};

/**
 * Basic regular expression matching exactly one queue entry trailer line
 */
[[nodiscard]] std::string trailer_pattern(std::string_view entry_id);

} // namespace planorch::adapters

#endif // PLANORCH_ADAPTERS_GIT_VERSION_CONTROL_HPP
