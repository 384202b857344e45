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
 * @file protocol.cpp
 * @brief Control surface wire format
 */

#include <cstdint>     // for int64_t
#include <exception>   // for exception
#include <format>      // for format
#include <optional>    // for optional, nullopt
#include <string>      // for string
#include <string_view> // for string_view
#include <utility>     // for move

#include <nlohmann/json.hpp>
#include <wise_enum.h>

#include "engine/engine_errors.hpp"
#include "engine/time.hpp"
#include "ipc/protocol.hpp"

namespace planorch::ipc {

namespace {

namespace pe = planorch::engine;

tl::unexpected<pe::Error> protocol_error(std::string message) {
    return pe::make_error(pe::OrchErrc::ProtocolError, std::move(message));
}

pe::Result<nlohmann::json> parse_object(const std::string_view line, const std::string_view what) {
    auto json = nlohmann::json::parse(line, nullptr, false);
    if (json.is_discarded()) {
        return protocol_error(std::format("{} is not valid JSON", what));
    }
    if (!json.is_object()) {
        return protocol_error(std::format("{} must be a JSON object", what));
    }
    return json;
}

pe::Status check_version(const nlohmann::json &json) {
    const auto it = json.find("protocolVersion");
    if (it == json.end() || !it->is_number_integer()) {
        return protocol_error("missing integer protocolVersion");
    }
    if (const auto version = it->get<std::int64_t>(); version != PROTOCOL_VERSION) {
        return protocol_error(std::format(
                "unsupported protocolVersion {} (expected {})", version, PROTOCOL_VERSION));
    }
    return {};
}

} // namespace

Response make_success(std::string id, nlohmann::json data) {
    Response response{};
    response.id = std::move(id);
    response.data = std::move(data);
    return response;
}

Response make_failure(std::string id, pe::Error error) {
    Response response{};
    response.id = std::move(id);
    response.error = std::move(error);
    return response;
}

std::string encode_request(const Request &request) {
    nlohmann::json json{
            {"protocolVersion", request.protocol_version},
            {"command", request.command},
            {"payload", request.payload.is_null() ? nlohmann::json::object() : request.payload},
            {"timestamp",
             request.timestamp.empty() ? pe::Time::now_iso8601() : request.timestamp}};
    if (request.id.has_value()) {
        json["id"] = *request.id;
    }
    return json.dump();
}

std::string encode_response(const Response &response) {
    nlohmann::json json{
            {"protocolVersion", response.protocol_version},
            {"id", response.id},
            {"success", response.success()}};
    if (response.error.has_value()) {
        json["error"] = {
                {"code", pe::get_error_name(response.error->code)},
                {"message", response.error->message}};
    } else {
        json["data"] = response.data;
    }
    // Replacement keeps invalid UTF-8 in agent output from breaking the stream
    return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

pe::Result<Request> decode_request(const std::string_view line) {
    auto json = parse_object(line, "request");
    if (!json) {
        return tl::unexpected(json.error());
    }
    if (auto version = check_version(*json); !version) {
        return tl::unexpected(version.error());
    }

    Request request{};
    const auto command = json->find("command");
    if (command == json->end() || !command->is_string() || command->get<std::string>().empty()) {
        return protocol_error("missing command");
    }
    request.command = command->get<std::string>();

    if (const auto id = json->find("id"); id != json->end() && !id->is_null()) {
        if (!id->is_string() || id->get<std::string>().empty()) {
            return protocol_error("id must be a non-empty string");
        }
        request.id = id->get<std::string>();
    }
    if (const auto payload = json->find("payload"); payload != json->end() && !payload->is_null()) {
        if (!payload->is_object()) {
            return protocol_error("payload must be a JSON object");
        }
        request.payload = *payload;
    }
    if (const auto timestamp = json->find("timestamp");
        timestamp != json->end() && timestamp->is_string()) {
        request.timestamp = timestamp->get<std::string>();
    }
    return request;
}

std::optional<std::string> peek_request_id(const std::string_view line) {
    const auto json = nlohmann::json::parse(line, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }
    const auto id = json.find("id");
    if (id == json.end() || !id->is_string() || id->get<std::string>().empty()) {
        return std::nullopt;
    }
    return id->get<std::string>();
}

pe::Result<Response> decode_response(const std::string_view line) {
    auto json = parse_object(line, "response");
    if (!json) {
        return tl::unexpected(json.error());
    }
    if (auto version = check_version(*json); !version) {
        return tl::unexpected(version.error());
    }

    try {
        Response response{};
        response.id = json->at("id").get<std::string>();
        if (json->at("success").get<bool>()) {
            response.data = json->value("data", nlohmann::json{});
            return response;
        }
        const auto &error = json->at("error");
        const auto name = error.at("code").get<std::string>();
        auto message = error.value("message", std::string{});
        const auto code = ::wise_enum::from_string<pe::OrchErrc>(name);
        if (!code.has_value()) {
            response.error = pe::Error{
                    pe::make_error_code(pe::OrchErrc::ProtocolError),
                    std::format("{}: {}", name, message)};
        } else {
            response.error = pe::Error{pe::make_error_code(*code), std::move(message)};
        }
        return response;
    } catch (const std::exception &e) {
        return protocol_error(std::format("malformed response: {}", e.what()));
    }
}

std::string default_socket_path(const std::string_view plan_id) {
    return std::format("/tmp/orchestrator-{}.sock", plan_id);
}

} // namespace planorch::ipc
