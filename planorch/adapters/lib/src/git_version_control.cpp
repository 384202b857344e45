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
 * @file git_version_control.cpp
 * @brief Version control collaborator backed by the git command line
 */

#include <cstddef>     // for size_t
#include <format>      // for format
#include <optional>    // for optional, nullopt
#include <string>      // for string
#include <string_view> // for string_view
#include <utility>     // for move
#include <vector>      // for vector

#include <quill/LogMacros.h>

#include "adapters/adapters_log.hpp"
#include "adapters/git_version_control.hpp"
#include "adapters/process.hpp"
#include "engine/engine_errors.hpp"
#include "log/planorch_log_macros.hpp"

namespace planorch::adapters {

namespace {

namespace pe = planorch::engine;

constexpr std::size_t GIT_ERROR_TAIL_LINES = 5;
constexpr std::string_view TRAILER_KEY = "Queue-Entry: ";

} // namespace

std::string trailer_pattern(const std::string_view entry_id) {
    std::string pattern{"^"};
    pattern += TRAILER_KEY;
    for (const char c : entry_id) {
        if (std::string_view{".[]*^$\\"}.find(c) != std::string_view::npos) {
            pattern += '\\';
        }
        pattern += c;
    }
    pattern += '$';
    return pattern;
}

GitVersionControl::GitVersionControl(GitVersionControlConfig config) : config_{std::move(config)} {
    if (config_.git.empty()) {
        log_and_throw(AdapterLog::Git, "git executable must not be empty");
    }
    if (config_.timeout.count() <= 0) {
        log_and_throw(AdapterLog::Git, "git timeout must be positive");
    }
}

pe::Result<std::string>
GitVersionControl::git(std::vector<std::string> args, const pe::OrchErrc failure) const {
    const auto step = args.empty() ? std::string{} : args.front();
    ProcessSpec spec{};
    spec.executable = config_.git;
    spec.args = std::move(args);
    spec.working_dir = config_.repo_dir;
    spec.timeout = config_.timeout;

    auto finished = run_process(spec);
    if (!finished) {
        return pe::make_error(failure, finished.error().message);
    }
    if (!finished->succeeded()) {
        auto detail = tail_lines(finished->err, GIT_ERROR_TAIL_LINES);
        if (detail.empty()) {
            detail = tail_lines(finished->out, GIT_ERROR_TAIL_LINES);
        }
        const auto message = finished->timed_out
                                     ? std::format("git {} timed out", step)
                                     : std::format(
                                               "git {} failed with status {}: {}",
                                               step,
                                               finished->exit_code.value_or(-1),
                                               detail);
        PLANORCH_LOGC_WARN(AdapterLog::Git, "{}", message);
        return pe::make_error(failure, message);
    }
    return std::move(finished->out);
}

pe::Result<std::string>
GitVersionControl::commit(const std::string &message, const std::vector<std::string> &files) {
    std::vector<std::string> add{"add"};
    if (files.empty()) {
        add.emplace_back("--all");
    } else {
        add.emplace_back("--");
        add.insert(add.end(), files.begin(), files.end());
    }
    if (auto staged = git(std::move(add), pe::OrchErrc::CommitFailed); !staged) {
        return tl::unexpected(staged.error());
    }
    if (auto committed =
                git({"commit", "--allow-empty", "-m", message}, pe::OrchErrc::CommitFailed);
        !committed) {
        return tl::unexpected(committed.error());
    }
    auto head = git({"rev-parse", "HEAD"}, pe::OrchErrc::CommitFailed);
    if (!head) {
        return tl::unexpected(head.error());
    }
    auto lines = split_lines(*head);
    if (lines.empty()) {
        return pe::make_error(pe::OrchErrc::CommitFailed, "git rev-parse printed no commit");
    }
    PLANORCH_LOGC_INFO(AdapterLog::Git, "Committed {}", lines.front());
    return std::move(lines.front());
}

pe::Result<std::optional<std::string>>
GitVersionControl::find_commit(const std::string_view entry_id) {
    auto found = git(
            {"log", "--all", "--format=%H", "-n", "1", "--grep=" + trailer_pattern(entry_id)},
            pe::OrchErrc::IoError);
    if (!found) {
        return tl::unexpected(found.error());
    }
    auto lines = split_lines(*found);
    if (lines.empty()) {
        return std::nullopt;
    }
    return std::move(lines.front());
}

pe::Result<bool> GitVersionControl::has_uncommitted_changes() {
    auto status = git({"status", "--porcelain"}, pe::OrchErrc::IoError);
    if (!status) {
        return tl::unexpected(status.error());
    }
    return !split_lines(*status).empty();
}

pe::Status GitVersionControl::stash(const std::string &message) {
    if (auto stashed = git(
                {"stash", "push", "--include-untracked", "-m", message}, pe::OrchErrc::IoError);
        !stashed) {
        return tl::unexpected(stashed.error());
    }
    PLANORCH_LOGC_NOTICE(AdapterLog::Git, "Stashed uncommitted changes: {}", message);
    return {};
}

} // namespace planorch::adapters
