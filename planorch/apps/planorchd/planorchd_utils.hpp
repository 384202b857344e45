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
 * @file planorchd_utils.hpp
 * @brief Command line handling and wiring helpers of the planorch daemon
 */

#ifndef PLANORCH_APPS_PLANORCHD_UTILS_HPP
#define PLANORCH_APPS_PLANORCHD_UTILS_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

#include "adapters/command_agent_runner.hpp"
#include "engine/orchestrator_types.hpp"
#include "ipc/ipc_server.hpp"

namespace planorch::apps {

/// Default root of the per-plan state directories
inline constexpr std::string_view DEFAULT_STATE_DIR = ".planorch";
/// Default log level name
inline constexpr std::string_view DEFAULT_LOG_LEVEL = "info";
/// Default agent timeout in seconds
constexpr std::uint64_t DEFAULT_AGENT_TIMEOUT_S = 600;
/// Default stuck threshold in seconds
constexpr std::uint64_t DEFAULT_STUCK_THRESHOLD_S = 1800;
/// Default stuck grace period in seconds
constexpr std::uint64_t DEFAULT_STUCK_GRACE_S = 300;
/// Default claim deadline of control requests in milliseconds
constexpr std::uint64_t DEFAULT_IPC_TIMEOUT_MS = 5000;
/// Bound on the wait for queued commits at shutdown in seconds
constexpr std::uint64_t DEFAULT_DRAIN_TIMEOUT_S = 30;

/// Daemon sub-command
enum class DaemonCommand { Init, Run };

/**
 * Daemon command-line arguments
 */
struct DaemonArguments final {
    DaemonCommand command{DaemonCommand::Run};
    std::string state_dir{DEFAULT_STATE_DIR}; //!< Root of the plan directories
    std::string log_level{DEFAULT_LOG_LEVEL}; //!< trace, debug, info, ...
    std::string log_file;                     //!< Rotating log file; console when empty

    // init
    std::string plan_file; //!< Parsed plan JSON

    // run
    std::string plan_id; //!< Plan to execute
    std::uint32_t batch_size{engine::OrchestratorConfig::DEFAULT_BATCH_SIZE};
    std::uint32_t max_retries{engine::OrchestratorConfig::DEFAULT_MAX_RETRIES};
    std::uint64_t stuck_threshold_s{DEFAULT_STUCK_THRESHOLD_S};
    std::uint64_t stuck_grace_s{DEFAULT_STUCK_GRACE_S};
    std::string stuck_action{"none"};                       //!< none, extend, skip, retry
    std::string on_uncommitted{"ignore"};                   //!< ignore, autoStash, abort
    std::string agent;                                      //!< Agent executable
    std::vector<std::string> agent_args;                    //!< Arguments before the task id
    std::uint64_t agent_timeout_s{DEFAULT_AGENT_TIMEOUT_S}; //!< 0 waits forever
    std::string work_dir{"."};                              //!< Agent and git working tree
    bool no_commit{};                                       //!< Disable per-task commits
    bool ignore_sequential{};                               //!< Run groups concurrently
    bool force_dependencies{};                              //!< Ignore unmet dependencies
    std::string socket;                                     //!< Control socket override
    std::uint64_t ipc_timeout_ms{DEFAULT_IPC_TIMEOUT_MS};   //!< Claim deadline of commands
};

/**
 * Configure the logger and register every component
 *
 * @param[in] level Level name accepted by log::parse_log_level()
 * @param[in] log_file Rotating log file; console output when empty
 */
void setup_logging(std::string_view level, const std::string &log_file);

/**
 * Parse command line arguments
 *
 * A file given with --config supplies defaults in TOML or INI form; options on
 * the command line take precedence.
 *
 * @param[in] argc Number of arguments
 * @param[in] argv Argument strings
 * @return Parsed arguments on success, empty string if --help or --version shown, error message on
 * failure
 */
[[nodiscard]] tl::expected<DaemonArguments, std::string>
parse_arguments(int argc, const char **argv);

/**
 * Build the loop configuration of a run
 *
 * @param[in] args Parsed arguments of the run sub-command
 * @return Configuration
 * @throw std::invalid_argument on unknown policy names or out of range values
 */
[[nodiscard]] engine::OrchestratorConfig make_orchestrator_config(const DaemonArguments &args);

/**
 * Build the agent runner configuration of a run
 *
 * @param[in] args Parsed arguments of the run sub-command
 * @return Configuration
 */
[[nodiscard]] adapters::CommandAgentRunnerConfig make_agent_config(const DaemonArguments &args);

/**
 * Build the control server configuration of a run
 *
 * @param[in] args Parsed arguments of the run sub-command
 * @return Configuration listening on --socket or the plan's default path
 */
[[nodiscard]] ipc::IpcServerConfig make_server_config(const DaemonArguments &args);

} // namespace planorch::apps

#endif // PLANORCH_APPS_PLANORCHD_UTILS_HPP
