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
 * @file planctl.cpp
 * @brief Control client of a running planorch daemon
 *
 * Sends one command over the plan's control socket and prints the response
 * data as JSON. Failures are printed to stderr with exit status 1.
 */

#include <chrono>    // for milliseconds
#include <cstdint>   // for uint32_t, uint64_t
#include <cstdlib>   // for EXIT_SUCCESS, EXIT_FAILURE
#include <exception> // for exception
#include <format>    // for format
#include <iostream>  // for cout, cerr
#include <optional>  // for optional
#include <string>    // for string

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include "internal_use_only/config.hpp"
#include "ipc/command_dispatcher.hpp"
#include "ipc/ipc_client.hpp"
#include "ipc/protocol.hpp"

namespace {

namespace pi = planorch::ipc;

/**
 * Client command-line arguments
 */
struct CtlArguments final {
    std::string socket;                       //!< Explicit socket path
    std::string plan_id;                      //!< Plan whose default socket is used
    std::uint64_t timeout_ms{static_cast<std::uint64_t>(
            pi::IpcClientConfig::DEFAULT_TIMEOUT.count())}; //!< Response deadline
    std::optional<std::string> request_id;    //!< Replay-safe request id
    pi::Command command{pi::Command::Status}; //!< Command to send
    nlohmann::json payload = nlohmann::json::object();
};

/**
 * Parse command line arguments
 *
 * @param[in] argc Number of arguments
 * @param[in] argv Argument strings
 * @return Parsed arguments on success, empty string if --help or --version shown, error message on
 * failure
 */
tl::expected<CtlArguments, std::string> parse_arguments(const int argc, const char **argv) {
    CtlArguments args{};

    CLI::App app{std::format(
            "Plan orchestration control client - {} version {}",
            planorch::cmake::project_name,
            planorch::cmake::project_version)};
    app.require_subcommand(1);

    auto *socket_opt = app.add_option("-s,--socket", args.socket, "Control socket path");
    app.add_option("-p,--plan", args.plan_id, "Plan id selecting the default socket")
            ->excludes(socket_opt);
    app.add_option(
               "-t,--timeout-ms",
               args.timeout_ms,
               std::format(
                       "Response deadline in ms (default: {})",
                       pi::IpcClientConfig::DEFAULT_TIMEOUT.count()))
            ->check(CLI::PositiveNumber);
    app.add_option("--id", args.request_id, "Request id; a repeated id replays the first response");

    const auto simple = [&app, &args](const pi::Command command, const std::string &help) {
        app.add_subcommand(std::string{pi::to_wire(command)}, help)
                ->callback([&args, command] { args.command = command; });
    };
    simple(pi::Command::Status, "Show the loop status");
    simple(pi::Command::Ping, "Check that the daemon answers");
    simple(pi::Command::Pause, "Stop dispatching new tasks");
    simple(pi::Command::Resume, "Resume dispatching");
    simple(pi::Command::Cancel, "Cancel the run");
    simple(pi::Command::Shutdown, "Cancel the run and let the daemon exit");

    std::uint32_t batch_size{};
    auto *batch = app.add_subcommand("batch", "Change the number of tasks in flight");
    batch->add_option("n", batch_size, "New batch size")->required();
    batch->callback([&args, &batch_size] {
        args.command = pi::Command::SetBatchSize;
        args.payload["n"] = batch_size;
    });

    std::string task_id;
    const auto task_command = [&app, &args, &task_id](
                                      const std::string &name,
                                      const pi::Command command,
                                      const std::string &help) {
        auto *sub = app.add_subcommand(name, help);
        sub->add_option("task", task_id, "Task id")->required();
        sub->callback([&args, &task_id, command] {
            args.command = command;
            args.payload["taskId"] = task_id;
        });
    };
    task_command("retry", pi::Command::RetryTask, "Reset a failed task to pending");
    task_command("skip", pi::Command::SkipTask, "Skip a task");
    task_command("extend", pi::Command::ExtendTask, "Restart the stuck clock of a task");

    std::uint64_t since_id{};
    std::optional<std::uint64_t> limit;
    auto *events = app.add_subcommand("events", "List recent events");
    events->add_option("--since", since_id, "Only events with a larger id");
    events->add_option("--limit", limit, "Maximum events returned");
    events->callback([&args, &since_id, &limit] {
        args.command = pi::Command::Events;
        args.payload["sinceId"] = since_id;
        if (limit.has_value()) {
            args.payload["limit"] = *limit;
        }
    });

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
        return tl::unexpected(std::format("Argument parsing failed: {}", e.what()));
    }

    if (args.socket.empty() && args.plan_id.empty()) {
        return tl::unexpected("Either --socket or --plan is required");
    }
    return args;
}

} // namespace

/**
 * Control client entry point
 *
 * @param[in] argc Number of command line arguments
 * @param[in] argv Array of command line argument strings
 * @return EXIT_SUCCESS when the daemon applied the command, EXIT_FAILURE otherwise
 */
int main(int argc, const char **argv) {
    try {
        const auto args = parse_arguments(argc, argv);
        if (!args.has_value()) {
            if (!args.error().empty()) {
                std::cerr << args.error() << '\n';
                return EXIT_FAILURE;
            }
            return EXIT_SUCCESS;
        }

        const pi::IpcClient client{pi::IpcClientConfig{
                .socket_path = args->socket.empty() ? pi::default_socket_path(args->plan_id)
                                                    : args->socket,
                .timeout = std::chrono::milliseconds{args->timeout_ms}}};

        const auto response = client.send(
                std::string{pi::to_wire(args->command)}, args->payload, args->request_id);
        if (!response.has_value()) {
            std::cerr << std::format("Request failed: {}\n", response.error().to_string());
            return EXIT_FAILURE;
        }
        if (!response->success()) {
            std::cerr << std::format("{}\n", response->error->to_string());
            return EXIT_FAILURE;
        }
        std::cout << response->data.dump(2) << '\n';
        return EXIT_SUCCESS;
    } catch (const std::exception &e) {
        std::cerr << std::format("Unhandled exception: {}\n", e.what());
        return EXIT_FAILURE;
    } catch (...) {
        std::cerr << "Unknown exception occurred\n";
        return EXIT_FAILURE;
    }
}
