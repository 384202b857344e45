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
 * @file ipc_client.hpp
 * @brief Control surface client
 */

#ifndef PLANORCH_IPC_IPC_CLIENT_HPP
#define PLANORCH_IPC_IPC_CLIENT_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "engine/engine_errors.hpp"
#include "engine/time.hpp"
#include "ipc/protocol.hpp"

namespace planorch::ipc {

/**
 * Control client configuration
 */
struct IpcClientConfig final {
    static constexpr engine::Millis DEFAULT_TIMEOUT{10000};

    std::filesystem::path socket_path;          //!< Server socket
    engine::Millis timeout{DEFAULT_TIMEOUT};    //!< Wait for each response
    std::size_t max_line_bytes{MAX_LINE_BYTES}; //!< Response line limit
};

/**
 * @class IpcClient
 * @brief Sends one request per connection and waits for its response
 */
class IpcClient final {
public:
    /**
     * @param[in] config Client configuration
     * @throws std::invalid_argument if the path is empty or a limit is not positive
     */
    explicit IpcClient(IpcClientConfig config);

    /**
     * Send a command
     *
     * Supplying an id makes the request safe to retry: the server answers a
     * replayed id from its cache without executing the command again.
     *
     * @param[in] command Wire command name
     * @param[in] payload Command payload object
     * @param[in] id Request id; the server assigns one when absent
     * @return Response, whose error carries any command failure; IoError if
     *         the server cannot be reached, IpcTimeout if no response arrives
     *         in time, ProtocolError for an unreadable response
     */
    [[nodiscard]] engine::Result<Response> send(
            std::string command,
            nlohmann::json payload = nlohmann::json::object(),
            std::optional<std::string> id = std::nullopt) const;

    /**
     * Check whether a server accepts connections on the socket
     */
    [[nodiscard]] bool is_available() const;

    [[nodiscard]] const IpcClientConfig &config() const noexcept { return config_; }

private:
    IpcClientConfig config_;
};

} // namespace planorch::ipc

#endif // PLANORCH_IPC_IPC_CLIENT_HPP
