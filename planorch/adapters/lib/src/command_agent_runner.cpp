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
 * @file command_agent_runner.cpp
 * @brief Agent runner that executes a configured command per task
 */

#include <format>  // for format
#include <string>  // for string
#include <utility> // for move

#include <quill/LogMacros.h>

#include "adapters/adapters_log.hpp"
#include "adapters/command_agent_runner.hpp"
#include "adapters/process.hpp"
#include "engine/iagent_runner.hpp"
#include "log/planorch_log_macros.hpp"

namespace planorch::adapters {

namespace pe = planorch::engine;

void CommandAgentRunnerConfig::validate() const {
    if (executable.empty()) {
        log_and_throw(AdapterLog::Agent, "Agent executable must not be empty");
    }
    if (timeout.count() < 0) {
        log_and_throw(AdapterLog::Agent, "Agent timeout must not be negative");
    }
    if (max_output_bytes == 0) {
        log_and_throw(AdapterLog::Agent, "Agent output limit must be positive");
    }
}

CommandAgentRunner::CommandAgentRunner(CommandAgentRunnerConfig config)
        : config_{std::move(config)} {
    config_.validate();
}

pe::AgentResult
CommandAgentRunner::run(const std::string &task_id, const std::string &description) {
    ProcessSpec spec{};
    spec.executable = config_.executable;
    spec.args = config_.args;
    spec.args.push_back(task_id);
    spec.args.push_back(description);
    spec.working_dir = config_.working_dir;
    spec.timeout = config_.timeout;
    spec.max_output_bytes = config_.max_output_bytes;

    PLANORCH_LOGC_INFO(AdapterLog::Agent, "Task {}: starting '{}'", task_id, config_.executable);
    pe::AgentResult result{};
    auto finished = run_process(spec);
    if (!finished) {
        result.error = finished.error().message;
        PLANORCH_LOGC_ERROR(AdapterLog::Agent, "Task {}: {}", task_id, *result.error);
        return result;
    }

    result.duration = finished->duration;
    result.artifacts = split_lines(finished->out);
    result.success = finished->succeeded();
    if (result.success) {
        PLANORCH_LOGC_INFO(
                AdapterLog::Agent,
                "Task {}: agent succeeded in {} ms",
                task_id,
                result.duration.count());
        return result;
    }

    std::string reason;
    if (finished->timed_out) {
        reason = std::format("agent timed out after {} ms", config_.timeout.count());
    } else if (finished->term_signal.has_value()) {
        reason = std::format("agent killed by signal {}", *finished->term_signal);
    } else {
        reason = std::format("agent exited with status {}", finished->exit_code.value_or(-1));
    }
    if (const auto tail = tail_lines(finished->err, config_.stderr_tail_lines); !tail.empty()) {
        reason += ": " + tail;
    }
    PLANORCH_LOGC_WARN(AdapterLog::Agent, "Task {}: {}", task_id, reason);
    result.error = std::move(reason);
    return result;
}

} // namespace planorch::adapters
