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
 * @file planorchd_utils.cpp
 * @brief Command line handling and wiring helpers of the planorch daemon
 */

#include <chrono>      // for seconds, milliseconds
#include <format>      // for format
#include <stdexcept>   // for invalid_argument
#include <string>      // for string
#include <string_view> // for string_view

#include <CLI/CLI.hpp>
#include <quill/LogMacros.h>
#include <tl/expected.hpp>

#include "adapters/adapters_log.hpp"
#include "app_log.hpp"
#include "engine/engine_log.hpp"
#include "internal_use_only/config.hpp"
#include "ipc/ipc_log.hpp"
#include "ipc/protocol.hpp"
#include "log/components.hpp"
#include "log/planorch_log.hpp"
#include "log/planorch_log_macros.hpp"
#include "planorchd/planorchd_utils.hpp"

namespace planorch::apps {

namespace pl = planorch::log;

void setup_logging(const std::string_view level, const std::string &log_file) {
    const auto resolved = pl::parse_log_level(level).value_or(pl::LogLevel::Info);
    if (log_file.empty()) {
        pl::Logger::configure(pl::LoggerConfig::console(resolved));
    } else {
        pl::Logger::configure(pl::LoggerConfig::rotating_file(log_file, resolved));
    }
    pl::register_component<engine::EngineLog>(resolved);
    pl::register_component<ipc::IpcLog>(resolved);
    pl::register_component<adapters::AdapterLog>(resolved);
    pl::register_component<AppLog>(resolved);
}

tl::expected<DaemonArguments, std::string> parse_arguments(const int argc, const char **argv) {

    DaemonArguments args{};

    CLI::App app{std::format(
            "Plan orchestration daemon - {} version {}",
            planorch::cmake::project_name,
            planorch::cmake::project_version)};
    app.set_config("--config", "", "Read options from a TOML or INI file");
    app.require_subcommand(1);

    app.add_option("-s,--state-dir", args.state_dir, "Root of the per-plan state directories")
            ->capture_default_str();
    app.add_option("-l,--log-level", args.log_level, "Log level")
            ->check(CLI::Validator(
                    [](std::string &value) {
                        return pl::parse_log_level(value).has_value()
                                       ? std::string{}
                                       : std::format("Unknown log level '{}'", value);
                    },
                    "LEVEL"))
            ->capture_default_str();
    app.add_option("--log-file", args.log_file, "Rotating log file (console when omitted)");

    auto *init = app.add_subcommand("init", "Create the persisted state of a parsed plan");
    init->add_option("-f,--plan-file", args.plan_file, "Plan JSON file")
            ->required()
            ->check(CLI::ExistingFile);

    auto *run = app.add_subcommand("run", "Execute an initialized plan");
    run->add_option("-p,--plan", args.plan_id, "Plan id")->required();
    run->add_option(
               "-b,--batch-size",
               args.batch_size,
               std::format(
                       "Maximum tasks in flight (default: {})",
                       engine::OrchestratorConfig::DEFAULT_BATCH_SIZE))
            ->check(CLI::Range(1U, engine::OrchestratorConfig::MAX_BATCH_SIZE));
    run->add_option(
               "--max-retries",
               args.max_retries,
               std::format(
                       "Failures before a task stays failed (default: {})",
                       engine::OrchestratorConfig::DEFAULT_MAX_RETRIES))
            ->check(CLI::PositiveNumber);
    run->add_option(
               "--stuck-threshold",
               args.stuck_threshold_s,
               std::format(
                       "Seconds before a task is stuck (default: {})", DEFAULT_STUCK_THRESHOLD_S))
            ->check(CLI::PositiveNumber);
    run->add_option(
            "--stuck-grace",
            args.stuck_grace_s,
            std::format("Seconds before the stuck action (default: {})", DEFAULT_STUCK_GRACE_S));
    run->add_option("--stuck-action", args.stuck_action, "Action on stuck tasks")
            ->check(CLI::IsMember({"none", "extend", "skip", "retry"}))
            ->capture_default_str();
    run->add_option("--on-uncommitted", args.on_uncommitted, "Policy for a dirty working tree")
            ->check(CLI::IsMember({"ignore", "autoStash", "abort"}))
            ->capture_default_str();
    run->add_option("-a,--agent", args.agent, "Agent executable")->required();
    run->add_option("--agent-arg", args.agent_args, "Agent argument placed before the task id")
            ->allow_extra_args(false);
    run->add_option(
            "--agent-timeout",
            args.agent_timeout_s,
            std::format(
                    "Agent time limit in seconds, 0 for none (default: {})",
                    DEFAULT_AGENT_TIMEOUT_S));
    run->add_option("-w,--work-dir", args.work_dir, "Working tree of the agent and git")
            ->check(CLI::ExistingDirectory)
            ->capture_default_str();
    run->add_flag("--no-commit", args.no_commit, "Do not commit completed tasks");
    run->add_flag(
            "--ignore-sequential",
            args.ignore_sequential,
            "Let members of a sequential group run concurrently");
    run->add_flag(
            "--force-dependencies",
            args.force_dependencies,
            "Dispatch tasks whose dependencies are not finished");
    run->add_option("--socket", args.socket, "Control socket path (default: per plan)");
    run->add_option(
               "--ipc-timeout",
               args.ipc_timeout_ms,
               std::format(
                       "Claim deadline of control commands in ms (default: {})",
                       DEFAULT_IPC_TIMEOUT_MS))
            ->check(CLI::PositiveNumber);

    app.set_version_flag(
            "--version",
            std::string{planorch::cmake::project_version},
            "Show version information");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        const int exit_code = app.exit(e); // Print help or error message
        if (exit_code == 0) {
            // Success codes (--help or --version) - return empty error string
            return tl::unexpected("");
        }
        const std::string error_msg = std::format("Argument parsing failed: {}", e.what());
        return tl::unexpected(error_msg);
    }

    args.command = init->parsed() ? DaemonCommand::Init : DaemonCommand::Run;
    return args;
}

engine::OrchestratorConfig make_orchestrator_config(const DaemonArguments &args) {
    engine::OrchestratorConfig config{};
    config.plan_id = args.plan_id;
    config.batch_size = args.batch_size;
    config.max_retries = args.max_retries;
    config.stuck_threshold = std::chrono::seconds{args.stuck_threshold_s};
    config.stuck_grace_period = std::chrono::seconds{args.stuck_grace_s};

    const auto action = engine::stuck_action_from_wire(args.stuck_action);
    if (!action.has_value()) {
        throw std::invalid_argument(std::format("Unknown stuck action '{}'", args.stuck_action));
    }
    config.stuck_action = *action;

    const auto policy = engine::uncommitted_policy_from_wire(args.on_uncommitted);
    if (!policy.has_value()) {
        throw std::invalid_argument(
                std::format("Unknown uncommitted changes policy '{}'", args.on_uncommitted));
    }
    config.on_uncommitted_changes = *policy;
    config.commit_on_complete = !args.no_commit;
    config.ignore_sequential = args.ignore_sequential;
    config.force_dependencies = args.force_dependencies;

    config.validate();
    return config;
}

adapters::CommandAgentRunnerConfig make_agent_config(const DaemonArguments &args) {
    adapters::CommandAgentRunnerConfig config{};
    config.executable = args.agent;
    config.args = args.agent_args;
    config.working_dir = args.work_dir;
    config.timeout = std::chrono::seconds{args.agent_timeout_s};
    return config;
}

ipc::IpcServerConfig make_server_config(const DaemonArguments &args) {
    ipc::IpcServerConfig config{};
    config.socket_path =
            args.socket.empty() ? ipc::default_socket_path(args.plan_id) : args.socket;
    config.request_timeout = std::chrono::milliseconds{args.ipc_timeout_ms};
    PLANORCH_LOGC_DEBUG(
            AppLog::Config,
            "Control socket '{}' with {} ms claim deadline",
            config.socket_path.string(),
            args.ipc_timeout_ms);
    return config;
}

} // namespace planorch::apps
