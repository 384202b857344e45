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
 * @file protocol.hpp
 * @brief Control surface wire format: newline-delimited JSON requests and responses
 */

#ifndef PLANORCH_IPC_PROTOCOL_HPP
#define PLANORCH_IPC_PROTOCOL_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "engine/engine_errors.hpp"

namespace planorch::ipc {

/// Version carried in every request and response
inline constexpr std::int64_t PROTOCOL_VERSION = 1;

/// Largest accepted line, newline excluded
inline constexpr std::size_t MAX_LINE_BYTES = 64UL * 1024UL;

/// Prefix of ids assigned by the server to requests that carry none
inline constexpr std::string_view SERVER_ID_PREFIX = "srv-";

/**
 * Control request
 *
 * Wire form: {protocolVersion, id?, command, payload, timestamp}
 */
struct Request final {
    std::int64_t protocol_version{PROTOCOL_VERSION};
    std::optional<std::string> id; //!< Client chosen id; replays return the cached response
    std::string command;           //!< status, pause, resume, setBatchSize, ...
    nlohmann::json payload = nlohmann::json::object();
    std::string timestamp;         //!< ISO-8601 UTC, informational
};

/**
 * Control response
 *
 * Wire form: {protocolVersion, id, success, data} or
 * {protocolVersion, id, success, error: {code, message}}
 */
struct Response final {
    std::int64_t protocol_version{PROTOCOL_VERSION};
    std::string id;
    nlohmann::json data;                //!< Command result when successful
    std::optional<engine::Error> error; //!< Failure when unsuccessful

    [[nodiscard]] bool success() const noexcept { return !error.has_value(); }
};

/**
 * Build a successful response
 */
[[nodiscard]] Response make_success(std::string id, nlohmann::json data);

/**
 * Build a failed response
 */
[[nodiscard]] Response make_failure(std::string id, engine::Error error);

/**
 * Encode a request as one JSON line (without the trailing newline)
 */
[[nodiscard]] std::string encode_request(const Request &request);

/**
 * Encode a response as one JSON line (without the trailing newline)
 */
[[nodiscard]] std::string encode_response(const Response &response);

/**
 * Decode a request line
 *
 * @param[in] line One line without its newline
 * @return Request, or ProtocolError for malformed JSON, missing fields or a
 *         protocol version mismatch
 */
[[nodiscard]] engine::Result<Request> decode_request(std::string_view line);

/**
 * Best-effort id of a request line that failed to decode
 *
 * @param[in] line Raw line
 * @return The "id" string member if the line is a JSON object carrying one
 */
[[nodiscard]] std::optional<std::string> peek_request_id(std::string_view line);

/**
 * Decode a response line
 *
 * Error codes are matched by name against engine::OrchErrc; an unknown name
 * decodes as ProtocolError carrying the original message.
 *
 * @param[in] line One line without its newline
 * @return Response, or ProtocolError for malformed input
 */
[[nodiscard]] engine::Result<Response> decode_response(std::string_view line);

/**
 * Default control socket of a plan
 *
 * @param[in] plan_id Plan identifier
 * @return "/tmp/orchestrator-<plan_id>.sock"
 */
[[nodiscard]] std::string default_socket_path(std::string_view plan_id);

} // namespace planorch::ipc

#endif // PLANORCH_IPC_PROTOCOL_HPP
