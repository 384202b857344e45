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
 * @file ipc_client.cpp
 * @brief Control surface client
 */

#include <optional>    // for optional
#include <string>      // for string
#include <utility>     // for move

#include <nlohmann/json.hpp>
#include <quill/LogMacros.h>

#include "engine/engine_errors.hpp"
#include "ipc/ipc_client.hpp"
#include "ipc/ipc_log.hpp"
#include "ipc/protocol.hpp"
#include "ipc/unix_socket.hpp"
#include "log/planorch_log_macros.hpp"

namespace planorch::ipc {

namespace pe = planorch::engine;

IpcClient::IpcClient(IpcClientConfig config) : config_{std::move(config)} {
    if (config_.socket_path.empty()) {
        log_and_throw(IpcLog::Client, "IPC client socket path must not be empty");
    }
    if (config_.timeout.count() <= 0) {
        log_and_throw(IpcLog::Client, "IPC client timeout must be positive");
    }
    if (config_.max_line_bytes == 0) {
        log_and_throw(IpcLog::Client, "IPC client max line size must be positive");
    }
}

pe::Result<Response> IpcClient::send(
        std::string command, nlohmann::json payload, std::optional<std::string> id) const {
    auto socket = UnixSocket::connect(config_.socket_path);
    if (!socket) {
        PLANORCH_LOGC_DEBUG(IpcLog::Client, "{}", socket.error().to_string());
        return tl::unexpected(socket.error());
    }

    Request request{};
    request.id = std::move(id);
    request.command = std::move(command);
    request.payload = std::move(payload);
    if (auto sent = socket->write_all(encode_request(request) + '\n'); !sent) {
        return tl::unexpected(sent.error());
    }

    LineReader reader{*socket, config_.max_line_bytes};
    auto line = reader.read_line(config_.timeout);
    if (!line) {
        PLANORCH_LOGC_DEBUG(
                IpcLog::Client,
                "No response to '{}': {}",
                request.command,
                line.error().to_string());
        return tl::unexpected(line.error());
    }
    if (!line->has_value()) {
        return pe::make_error(
                pe::OrchErrc::IoError, "server closed the connection before responding");
    }
    return decode_response(**line);
}

bool IpcClient::is_available() const {
    return UnixSocket::connect(config_.socket_path).has_value();
}

} // namespace planorch::ipc
