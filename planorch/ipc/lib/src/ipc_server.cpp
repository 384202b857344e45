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
 * @file ipc_server.cpp
 * @brief Unix-domain socket control server
 */

#include <algorithm>    // for count_if
#include <atomic>       // for atomic
#include <cstddef>      // for size_t
#include <filesystem>   // for remove
#include <format>       // for format
#include <memory>       // for make_unique
#include <mutex>        // for lock_guard, unique_lock
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <system_error> // for error_code
#include <thread>       // for thread, sleep_for
#include <utility>      // for move

#include <gsl-lite/gsl-lite.hpp>
#include <quill/LogMacros.h>

#include "engine/engine_errors.hpp"
#include "ipc/command_dispatcher.hpp"
#include "ipc/ipc_log.hpp"
#include "ipc/ipc_server.hpp"
#include "ipc/protocol.hpp"
#include "ipc/unix_socket.hpp"
#include "log/planorch_log_macros.hpp"

namespace planorch::ipc {

namespace {

namespace pe = planorch::engine;

IpcServerConfig validated(IpcServerConfig config) {
    config.validate();
    return config;
}

Response to_response(std::string id, pe::Result<nlohmann::json> result) {
    if (!result) {
        return make_failure(std::move(id), std::move(result.error()));
    }
    return make_success(std::move(id), std::move(*result));
}

} // namespace

void IpcServerConfig::validate() const {
    if (socket_path.empty()) {
        log_and_throw(IpcLog::Server, "IPC socket path must not be empty");
    }
    if (request_timeout.count() <= 0) {
        log_and_throw(IpcLog::Server, "IPC request timeout must be positive");
    }
    if (dedup_capacity == 0) {
        log_and_throw(IpcLog::Server, "IPC dedup capacity must be at least 1");
    }
    if (max_line_bytes == 0) {
        log_and_throw(IpcLog::Server, "IPC max line size must be positive");
    }
    if (max_connections == 0) {
        log_and_throw(IpcLog::Server, "IPC max connections must be at least 1");
    }
    if (backlog <= 0) {
        log_and_throw(IpcLog::Server, "IPC listen backlog must be positive, got {}", backlog);
    }
    if (poll_interval.count() <= 0) {
        log_and_throw(IpcLog::Server, "IPC poll interval must be positive");
    }
}

IpcServer::IpcServer(IpcServerConfig config, pe::IControlTarget &target, pe::EventBus *events)
        : config_{validated(std::move(config))},
          dispatcher_{DispatcherConfig{.control_timeout = config_.request_timeout}, target, events},
          cache_{config_.dedup_capacity} {}

IpcServer::~IpcServer() { stop(); }

pe::Status IpcServer::start() {
    if (is_running()) {
        return pe::make_error(
                pe::OrchErrc::AlreadyRunning,
                std::format("server on '{}' already started", config_.socket_path.string()));
    }
    auto listener = UnixSocket::listen(config_.socket_path, config_.backlog);
    if (!listener) {
        PLANORCH_LOGC_ERROR(
                IpcLog::Server,
                "Cannot listen on '{}': {}",
                config_.socket_path.string(),
                listener.error().to_string());
        return tl::unexpected(listener.error());
    }
    listener_ = std::move(*listener);
    stop_flag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);
    accept_thread_ = std::thread([this] { accept_loop(); });
    PLANORCH_LOGC_INFO(IpcLog::Server, "Listening on '{}'", config_.socket_path.string());
    return {};
}

void IpcServer::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    stop_flag_.store(true, std::memory_order_release);
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    listener_.close();
    {
        const std::lock_guard lock{connections_mutex_};
        for (const auto &connection : connections_) {
            connection->socket.shutdown();
        }
    }
    reap_connections(true);

    std::error_code ec;
    std::filesystem::remove(config_.socket_path, ec);
    if (ec) {
        PLANORCH_LOGC_WARN(
                IpcLog::Server,
                "Cannot remove socket '{}': {}",
                config_.socket_path.string(),
                ec.message());
    }
    PLANORCH_LOGC_INFO(IpcLog::Server, "Stopped listening on '{}'", config_.socket_path.string());
}

std::size_t IpcServer::connection_count() const {
    const std::lock_guard lock{connections_mutex_};
    return static_cast<std::size_t>(
            std::count_if(connections_.begin(), connections_.end(), [](const auto &connection) {
                return !connection->finished.load(std::memory_order_acquire);
            }));
}

void IpcServer::accept_loop() {
    while (!stop_flag_.load(std::memory_order_acquire)) {
        reap_connections(false);

        auto accepted = listener_.accept(config_.poll_interval);
        if (!accepted) {
            PLANORCH_LOGC_ERROR(IpcLog::Server, "Accept failed: {}", accepted.error().to_string());
            std::this_thread::sleep_for(config_.poll_interval);
            continue;
        }
        if (!accepted->has_value()) {
            continue;
        }

        if (connection_count() >= config_.max_connections) {
            const auto rejected = make_failure(
                    next_server_id(),
                    pe::Error{
                            pe::make_error_code(pe::OrchErrc::ProtocolError),
                            std::format(
                                    "connection limit of {} reached", config_.max_connections)});
            if (auto sent = (*accepted)->write_all(encode_response(rejected) + '\n'); !sent) {
                PLANORCH_LOGC_DEBUG(IpcLog::Server, "{}", sent.error().to_string());
            }
            PLANORCH_LOGEC_WARN(
                    IpcLog::Server,
                    IpcEvent::RequestRejected,
                    "Connection refused: limit of {} reached",
                    config_.max_connections);
            continue;
        }

        auto connection = std::make_unique<Connection>();
        connection->socket = std::move(**accepted);
        Connection &serving = *connection;
        const std::lock_guard lock{connections_mutex_};
        connections_.push_back(std::move(connection));
        serving.thread = std::thread([this, &serving] { serve(serving); });
        PLANORCH_LOGEC_DEBUG(
                IpcLog::Server,
                IpcEvent::ClientConnected,
                "Client connected ({} open)",
                connections_.size());
    }
}

void IpcServer::reap_connections(const bool all) {
    const std::lock_guard lock{connections_mutex_};
    for (auto it = connections_.begin(); it != connections_.end();) {
        auto &connection = **it;
        if (!all && !connection.finished.load(std::memory_order_acquire)) {
            ++it;
            continue;
        }
        if (connection.thread.joinable()) {
            connection.thread.join();
        }
        it = connections_.erase(it);
    }
}

void IpcServer::serve(Connection &connection) {
    const auto mark_finished = gsl_lite::finally(
            [&connection] { connection.finished.store(true, std::memory_order_release); });
    LineReader reader{connection.socket, config_.max_line_bytes};

    while (!stop_flag_.load(std::memory_order_acquire)) {
        auto line = reader.read_line(config_.poll_interval);
        if (!line) {
            if (line.error().is(pe::OrchErrc::IpcTimeout)) {
                continue;
            }
            if (line.error().is(pe::OrchErrc::ProtocolError)) {
                PLANORCH_LOGEC_WARN(
                        IpcLog::Connection,
                        IpcEvent::LineTooLong,
                        "Closing connection: {}",
                        line.error().message);
                const auto rejected = make_failure(next_server_id(), line.error());
                if (auto sent = connection.socket.write_all(encode_response(rejected) + '\n');
                    !sent) {
                    PLANORCH_LOGC_DEBUG(IpcLog::Connection, "{}", sent.error().to_string());
                }
            } else {
                PLANORCH_LOGC_DEBUG(
                        IpcLog::Connection, "Read failed: {}", line.error().to_string());
            }
            break;
        }
        if (!line->has_value()) {
            break;
        }
        if ((*line)->empty()) {
            continue;
        }

        const auto response = handle_line(**line);
        if (auto sent = connection.socket.write_all(encode_response(response) + '\n'); !sent) {
            PLANORCH_LOGC_DEBUG(
                    IpcLog::Connection,
                    "Response {} not delivered: {}",
                    response.id,
                    sent.error().to_string());
            break;
        }
    }
    PLANORCH_LOGEC_DEBUG(IpcLog::Connection, IpcEvent::ClientDisconnected, "Client disconnected");
}

Response IpcServer::handle_line(const std::string_view line) {
    auto request = decode_request(line);
    if (!request) {
        auto id = peek_request_id(line).value_or(next_server_id());
        PLANORCH_LOGEC_WARN(
                IpcLog::Connection,
                IpcEvent::RequestRejected,
                "Request {} rejected: {}",
                id,
                request.error().message);
        return make_failure(std::move(id), std::move(request.error()));
    }
    return handle_request(std::move(*request));
}

Response IpcServer::handle_request(Request request) {
    if (!request.id.has_value()) {
        auto id = next_server_id();
        PLANORCH_LOGC_DEBUG(IpcLog::Connection, "Request {}: {}", id, request.command);
        return to_response(std::move(id), dispatcher_.dispatch(request.command, request.payload));
    }

    const std::string id = *request.id;
    {
        std::unique_lock lock{in_progress_mutex_};
        in_progress_cv_.wait(lock, [this, &id] { return !in_progress_.contains(id); });
        if (auto cached = cache_.find(id); cached.has_value()) {
            PLANORCH_LOGEC_DEBUG(
                    IpcLog::Connection,
                    IpcEvent::ResponseReplayed,
                    "Request {} is a replay, returning the cached response",
                    id);
            return std::move(*cached);
        }
        in_progress_.insert(id);
    }
    const auto release = gsl_lite::finally([this, &id] {
        {
            const std::lock_guard lock{in_progress_mutex_};
            in_progress_.erase(id);
        }
        in_progress_cv_.notify_all();
    });

    PLANORCH_LOGC_DEBUG(IpcLog::Connection, "Request {}: {}", id, request.command);
    auto response = to_response(id, dispatcher_.dispatch(request.command, request.payload));
    // An abandoned command was never applied, so a retry under the same id may run it
    if (!response.error.has_value() || !response.error->is(pe::OrchErrc::IpcTimeout)) {
        cache_.insert(id, response);
    }
    return response;
}

std::string IpcServer::next_server_id() {
    return std::format(
            "{}{}", SERVER_ID_PREFIX, next_server_id_.fetch_add(1, std::memory_order_relaxed));
}

} // namespace planorch::ipc
