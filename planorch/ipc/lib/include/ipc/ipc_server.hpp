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
 * @file ipc_server.hpp
 * @brief Unix-domain socket control server
 */

#ifndef PLANORCH_IPC_IPC_SERVER_HPP
#define PLANORCH_IPC_IPC_SERVER_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <thread>

#include "engine/engine_errors.hpp"
#include "engine/event_bus.hpp"
#include "engine/icontrol_target.hpp"
#include "engine/time.hpp"
#include "ipc/command_dispatcher.hpp"
#include "ipc/protocol.hpp"
#include "ipc/response_cache.hpp"
#include "ipc/unix_socket.hpp"

namespace planorch::ipc {

/**
 * Control server configuration
 */
struct IpcServerConfig final {
    static constexpr std::size_t DEFAULT_MAX_CONNECTIONS = 32;
    static constexpr int DEFAULT_BACKLOG = 16;
    static constexpr engine::Millis DEFAULT_POLL_INTERVAL{100};

    std::filesystem::path socket_path; //!< Listening path
    engine::Millis request_timeout{DispatcherConfig::DEFAULT_CONTROL_TIMEOUT}; //!< Claim deadline
    std::size_t dedup_capacity{ResponseCache::DEFAULT_CAPACITY}; //!< Remembered request ids
    std::size_t max_line_bytes{MAX_LINE_BYTES};                  //!< Request line limit
    std::size_t max_connections{DEFAULT_MAX_CONNECTIONS};        //!< Concurrent clients
    int backlog{DEFAULT_BACKLOG};                                //!< listen() backlog
    engine::Millis poll_interval{DEFAULT_POLL_INTERVAL}; //!< Stop check period of blocked threads

    /**
     * Reject invalid values
     *
     * @throws std::invalid_argument naming the first invalid field
     */
    void validate() const;
};

/**
 * @class IpcServer
 * @brief Serves newline-delimited JSON control requests
 *
 * One accept thread plus one thread per connection. Each connection may
 * carry any number of requests; each request line gets exactly one
 * response line. Requests carrying an id are deduplicated: a replayed id
 * receives the cached response and the command is not executed again.
 * Requests without an id get a server-assigned "srv-<n>" id.
 */
class IpcServer final {
public:
    /**
     * @param[in] config Server configuration
     * @param[in] target Loop receiving control commands; must outlive the server
     * @param[in] events Event bus for the events command; nullptr disables it
     * @throws std::invalid_argument if config is invalid
     */
    IpcServer(IpcServerConfig config, engine::IControlTarget &target, engine::EventBus *events);

    /**
     * Stops the server
     */
    ~IpcServer();

    IpcServer(const IpcServer &) = delete;
    IpcServer &operator=(const IpcServer &) = delete;
    IpcServer(IpcServer &&) = delete;
    IpcServer &operator=(IpcServer &&) = delete;

    /**
     * Bind the socket and start accepting
     *
     * @return Empty on success; AlreadyRunning, InvalidParameter or IoError
     */
    [[nodiscard]] engine::Status start();

    /**
     * Close every connection, stop accepting and remove the socket file
     */
    void stop();

    /**
     * Process one request line as a connection would
     *
     * @param[in] line Raw request line
     * @return Response to send back
     */
    [[nodiscard]] Response handle_line(std::string_view line);

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const std::filesystem::path &socket_path() const noexcept {
        return config_.socket_path;
    }

    [[nodiscard]] std::size_t connection_count() const;

private:
    struct Connection final {
        UnixSocket socket;
        std::thread thread;
        std::atomic<bool> finished{false};
    };

    void accept_loop();
    void serve(Connection &connection);
    void reap_connections(bool all);
    [[nodiscard]] Response handle_request(Request request);
    [[nodiscard]] std::string next_server_id();

    IpcServerConfig config_;
    CommandDispatcher dispatcher_;
    ResponseCache cache_;

    UnixSocket listener_;
    std::thread accept_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_flag_{false};
    std::atomic<std::uint64_t> next_server_id_{1};

    mutable std::mutex connections_mutex_;
    std::list<std::unique_ptr<Connection>> connections_;

    std::mutex in_progress_mutex_;
    std::condition_variable in_progress_cv_;
    std::set<std::string, std::less<>> in_progress_; //!< Client ids being executed
};

} // namespace planorch::ipc

#endif // PLANORCH_IPC_IPC_SERVER_HPP
