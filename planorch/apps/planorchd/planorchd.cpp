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
 * @file planorchd.cpp
 * @brief Plan orchestration daemon
 *
 * "init" parses a plan file into the persisted status of the plan. "run"
 * executes an initialized plan with a command agent, commits completed
 * tasks through git and serves the control socket until the run ends or
 * SIGINT/SIGTERM cancels it.
 */

#include <atomic>    // for atomic_bool
#include <chrono>    // for milliseconds, seconds
#include <csignal>   // for signal, SIGINT, SIGTERM
#include <cstdlib>   // for EXIT_SUCCESS, EXIT_FAILURE
#include <exception> // for exception
#include <format>    // for format
#include <iostream>  // for cerr
#include <thread>    // for sleep_for

#include <quill/LogMacros.h>

#include "adapters/command_agent_runner.hpp"
#include "adapters/git_version_control.hpp"
#include "adapters/plan_file.hpp"
#include "app_log.hpp"
#include "engine/commit_queue.hpp"
#include "engine/event_bus.hpp"
#include "engine/orchestrator.hpp"
#include "engine/orchestrator_types.hpp"
#include "engine/status_store.hpp"
#include "ipc/ipc_server.hpp"
#include "log/planorch_log.hpp"
#include "log/planorch_log_macros.hpp"
#include "planorchd/planorchd_utils.hpp"

namespace {

namespace pa = planorch::adapters;
namespace papp = planorch::apps;
namespace pe = planorch::engine;
namespace pi = planorch::ipc;

using papp::AppLog;

/// Period of the stop-request check while a run is active
constexpr std::chrono::milliseconds STATE_POLL_INTERVAL{100};

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
std::atomic_bool g_stop_requested{false};

void signal_handler(const int /*signal*/) { g_stop_requested.store(true); }

int init_plan(const papp::DaemonArguments &args) {
    const auto plan = pa::load_plan_file(args.plan_file);
    if (!plan.has_value()) {
        PLANORCH_LOGC_ERROR(AppLog::Daemon, "{}", plan.error().to_string());
        return EXIT_FAILURE;
    }

    pe::StatusStore store{pe::StatusStoreConfig{.state_dir = args.state_dir}};
    const auto snapshot = store.init(*plan);
    if (!snapshot.has_value()) {
        PLANORCH_LOGC_ERROR(
                AppLog::Daemon,
                "Cannot initialize plan '{}': {}",
                plan->plan_id,
                snapshot.error().to_string());
        return EXIT_FAILURE;
    }
    PLANORCH_LOGC_NOTICE(
            AppLog::Daemon,
            "Plan '{}' initialized with {} tasks in '{}'",
            snapshot->plan_id,
            snapshot->summary.total_tasks,
            store.plan_dir(snapshot->plan_id).string());
    return EXIT_SUCCESS;
}

int run_plan(const papp::DaemonArguments &args) {
    const auto orchestrator_config = papp::make_orchestrator_config(args);

    pe::StatusStore store{pe::StatusStoreConfig{.state_dir = args.state_dir}};
    if (!store.exists(args.plan_id)) {
        PLANORCH_LOGC_ERROR(
                AppLog::Daemon,
                "Plan '{}' is not initialized under '{}'",
                args.plan_id,
                args.state_dir);
        return EXIT_FAILURE;
    }
    const auto plan_dir = store.plan_dir(args.plan_id);

    pe::EventBus events{pe::EventBusConfig{.log_dir = plan_dir}};
    pa::CommandAgentRunner runner{papp::make_agent_config(args)};
    pa::GitVersionControl vcs{pa::GitVersionControlConfig{.repo_dir = args.work_dir}};
    pe::CommitQueue queue{pe::CommitQueueConfig{.state_dir = plan_dir}, vcs};

    const bool commits_enabled = !args.no_commit;
    if (commits_enabled) {
        if (const auto started = queue.start(); !started.has_value()) {
            PLANORCH_LOGC_ERROR(
                    AppLog::Daemon,
                    "Cannot start the commit queue: {}",
                    started.error().to_string());
            return EXIT_FAILURE;
        }
    }

    pe::Orchestrator orchestrator{
            orchestrator_config,
            pe::OrchestratorDeps{
                    .store = store,
                    .events = events,
                    .runner = runner,
                    .vcs = &vcs,
                    .commits = commits_enabled ? &queue : nullptr}};

    pi::IpcServer server{papp::make_server_config(args), orchestrator, &events};
    if (const auto listening = server.start(); !listening.has_value()) {
        PLANORCH_LOGC_ERROR(
                AppLog::Daemon,
                "Cannot serve '{}': {}",
                server.socket_path().string(),
                listening.error().to_string());
        queue.stop();
        return EXIT_FAILURE;
    }

    std::signal(SIGINT, signal_handler);  // NOLINT(cert-err33-c)
    std::signal(SIGTERM, signal_handler); // NOLINT(cert-err33-c)

    if (const auto started = orchestrator.start(); !started.has_value()) {
        PLANORCH_LOGC_ERROR(
                AppLog::Daemon,
                "Cannot start plan '{}': {}",
                args.plan_id,
                started.error().to_string());
        server.stop();
        queue.stop();
        return EXIT_FAILURE;
    }
    PLANORCH_LOGC_INFO(
            AppLog::Daemon,
            "Running plan '{}', control socket '{}'",
            args.plan_id,
            server.socket_path().string());

    bool cancel_sent = false;
    while (orchestrator.state() != pe::OrchestratorState::Stopped) {
        if (g_stop_requested.load() && !cancel_sent) {
            PLANORCH_LOGC_NOTICE(AppLog::Daemon, "Stop requested, cancelling the run");
            if (const auto cancelled = orchestrator.cancel(); !cancelled.has_value()) {
                PLANORCH_LOGC_WARN(
                        AppLog::Daemon, "Cancel rejected: {}", cancelled.error().to_string());
            }
            cancel_sent = true;
        }
        std::this_thread::sleep_for(STATE_POLL_INTERVAL);
    }

    const auto outcome = orchestrator.wait();
    server.stop();
    if (commits_enabled) {
        if (!queue.wait_for_drain(std::chrono::seconds{papp::DEFAULT_DRAIN_TIMEOUT_S})) {
            PLANORCH_LOGC_WARN(
                    AppLog::Daemon,
                    "Commit queue not drained after {} s, pending entries stay persisted",
                    papp::DEFAULT_DRAIN_TIMEOUT_S);
        }
        queue.stop();
    }

    if (!outcome.has_value()) {
        PLANORCH_LOGC_ERROR(
                AppLog::Daemon, "Plan '{}' failed: {}", args.plan_id, outcome.error().to_string());
        return EXIT_FAILURE;
    }

    const auto &summary = outcome->summary;
    PLANORCH_LOGC_NOTICE(
            AppLog::Daemon,
            "Run '{}' {}: {} completed, {} failed, {} skipped, {} pending of {} tasks",
            outcome->run_id,
            outcome->end_reason,
            summary.completed,
            summary.failed,
            summary.skipped,
            summary.pending,
            summary.total_tasks);
    return outcome->end_reason == "completed" && summary.failed == 0 ? EXIT_SUCCESS
                                                                      : EXIT_FAILURE;
}

} // namespace

/**
 * Plan orchestration daemon entry point
 *
 * @param[in] argc Number of command line arguments
 * @param[in] argv Array of command line argument strings
 * @return EXIT_SUCCESS when the command succeeded and a run completed without
 *         failed tasks, EXIT_FAILURE otherwise
 */
int main(int argc, const char **argv) {
    try {
        const auto args = papp::parse_arguments(argc, argv);
        if (!args.has_value()) {
            // Empty error string means --help or --version was shown (success)
            // Non-empty error string means parse error (failure)
            if (!args.error().empty()) {
                std::cerr << args.error() << '\n';
                return EXIT_FAILURE;
            }
            return EXIT_SUCCESS;
        }

        papp::setup_logging(args->log_level, args->log_file);

        const int status =
                args->command == papp::DaemonCommand::Init ? init_plan(*args) : run_plan(*args);
        planorch::log::Logger::flush();
        return status;
    } catch (const std::exception &e) {
        std::cerr << std::format("Unhandled exception: {}\n", e.what());
        return EXIT_FAILURE;
    } catch (...) {
        std::cerr << "Unknown exception occurred\n";
        return EXIT_FAILURE;
    }
}
