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
 * @file command_agent_runner.hpp
 * @brief Agent runner that executes a configured command per task
 */

#ifndef PLANORCH_ADAPTERS_COMMAND_AGENT_RUNNER_HPP
#define PLANORCH_ADAPTERS_COMMAND_AGENT_RUNNER_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "adapters/process.hpp"
#include "engine/iagent_runner.hpp"
#include "engine/time.hpp"

namespace planorch::adapters {

/**
 * Agent command configuration
 */
struct CommandAgentRunnerConfig final {
    static constexpr engine::Millis DEFAULT_TIMEOUT{600000};
    static constexpr std::size_t DEFAULT_STDERR_TAIL_LINES = 20;

    std::string executable;            //!< Agent executable
    std::vector<std::string> args;     //!< Leading arguments; task id and description follow
    std::filesystem::path working_dir; //!< Directory the agent runs in
    engine::Millis timeout{DEFAULT_TIMEOUT};                  //!< Zero disables the limit
    std::size_t stderr_tail_lines{DEFAULT_STDERR_TAIL_LINES}; //!< Lines kept in the error
    std::size_t max_output_bytes{ProcessSpec::DEFAULT_MAX_OUTPUT_BYTES}; //!< Per stream

    /**
     * Reject invalid values
     *
     * @throws std::invalid_argument naming the first invalid field
     */
    void validate() const;
};

/**
 * @class CommandAgentRunner
 * @brief Runs "<executable> <args...> <task id> <description>" for each task
 *
 * Exit status 0 is success. Non-empty stdout lines become the artifacts;
 * on failure the error carries the exit status and the stderr tail.
 * Thread-safe: every call runs its own child process.
 */
class CommandAgentRunner final : public engine::IAgentRunner {
public:
    /**
     * @param[in] config Agent command configuration
     * @throws std::invalid_argument if config is invalid
     */
    explicit CommandAgentRunner(CommandAgentRunnerConfig config);

    [[nodiscard]] engine::AgentResult
    run(const std::string &task_id, const std::string &description) override;

private:
    CommandAgentRunnerConfig config_;
};

} // namespace planorch::adapters

#endif // PLANORCH_ADAPTERS_COMMAND_AGENT_RUNNER_HPP
