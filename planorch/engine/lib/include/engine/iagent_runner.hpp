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

#ifndef PLANORCH_ENGINE_IAGENT_RUNNER_HPP
#define PLANORCH_ENGINE_IAGENT_RUNNER_HPP

#include <optional>
#include <string>
#include <vector>

#include "engine/time.hpp"

namespace planorch::engine {

/**
 * Outcome of one agent invocation
 */
struct AgentResult final {
    bool success{};                   //!< Task work finished successfully
    std::vector<std::string> artifacts; //!< Output produced by the agent (e.g. stdout lines)
    std::optional<std::string> error; //!< Failure description when success is false
    Millis duration{};                //!< Wall time of the invocation
};

/**
 * @class IAgentRunner
 * @brief Interface for executing one task with an external agent
 *
 * Implementations are called concurrently from the orchestrator worker pool,
 * one call per dispatched task, and must be thread-safe. A call blocks until
 * the agent finishes; failures are reported through AgentResult, never by
 * throwing.
 */
class IAgentRunner {
public:
    /**
     * Default constructor.
     */
    IAgentRunner() = default;

    /**
     * Virtual destructor.
     */
    virtual ~IAgentRunner() = default;

    IAgentRunner(IAgentRunner &&) = default;
    IAgentRunner &operator=(IAgentRunner &&) = default;
    IAgentRunner(const IAgentRunner &) = delete;
    IAgentRunner &operator=(const IAgentRunner &) = delete;

    /**
     * Execute a task
     *
     * @param[in] task_id Task id, e.g. "1.2"
     * @param[in] description Task instruction text
     * @return Result of the invocation
     */
    [[nodiscard]] virtual AgentResult
    run(const std::string &task_id, const std::string &description) = 0;
};

} // namespace planorch::engine

#endif // PLANORCH_ENGINE_IAGENT_RUNNER_HPP
