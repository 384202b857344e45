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
 * @file protocol_tests.cpp
 * @brief Unit tests for the control surface wire format
 */

#include <string>

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include "engine/engine_errors.hpp"
#include "ipc/protocol.hpp"

namespace {
namespace pe = planorch::engine;
namespace pi = planorch::ipc;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

TEST(Protocol, EncodedRequestCarriesVersionAndTimestamp) {
    pi::Request request{};
    request.id = "req-1";
    request.command = "setBatchSize";
    request.payload = {{"n", 3}};

    const auto json = nlohmann::json::parse(pi::encode_request(request));
    EXPECT_EQ(json.at("protocolVersion"), 1);
    EXPECT_EQ(json.at("id"), "req-1");
    EXPECT_EQ(json.at("command"), "setBatchSize");
    EXPECT_EQ(json.at("payload").at("n"), 3);
    EXPECT_FALSE(json.at("timestamp").get<std::string>().empty());

    const auto decoded = pi::decode_request(pi::encode_request(request));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().to_string();
    EXPECT_EQ(decoded->id, "req-1");
    EXPECT_EQ(decoded->payload.at("n"), 3);
}

TEST(Protocol, RequestWithoutIdOrPayload) {
    const auto decoded = pi::decode_request(R"({"protocolVersion":1,"command":"status"})");
    ASSERT_TRUE(decoded.has_value()) << decoded.error().to_string();
    EXPECT_FALSE(decoded->id.has_value());
    EXPECT_EQ(decoded->command, "status");
    EXPECT_TRUE(decoded->payload.is_object());
    EXPECT_TRUE(decoded->payload.empty());
}

TEST(Protocol, MalformedRequestsAreProtocolErrors) {
    const char *lines[] = {
            "not json",
            "[1,2,3]",
            R"({"command":"status"})",
            R"({"protocolVersion":2,"command":"status"})",
            R"({"protocolVersion":"1","command":"status"})",
            R"({"protocolVersion":1})",
            R"({"protocolVersion":1,"command":""})",
            R"({"protocolVersion":1,"command":"status","id":7})",
            R"({"protocolVersion":1,"command":"status","payload":[1]})",
    };
    for (const char *line : lines) {
        const auto decoded = pi::decode_request(line);
        ASSERT_FALSE(decoded.has_value()) << line;
        EXPECT_TRUE(decoded.error().is(pe::OrchErrc::ProtocolError)) << line;
    }
}

TEST(Protocol, PeekRecoversIdOfRejectedRequest) {
    EXPECT_EQ(pi::peek_request_id(R"({"protocolVersion":9,"id":"abc"})"), "abc");
    EXPECT_FALSE(pi::peek_request_id("{broken").has_value());
    EXPECT_FALSE(pi::peek_request_id(R"({"id":42})").has_value());
}

TEST(Protocol, SuccessResponseShape) {
    const auto line = pi::encode_response(pi::make_success("r1", {{"state", "running"}}));
    const auto json = nlohmann::json::parse(line);
    EXPECT_EQ(json.at("protocolVersion"), 1);
    EXPECT_EQ(json.at("id"), "r1");
    EXPECT_TRUE(json.at("success").get<bool>());
    EXPECT_EQ(json.at("data").at("state"), "running");
    EXPECT_FALSE(json.contains("error"));

    const auto decoded = pi::decode_response(line);
    ASSERT_TRUE(decoded.has_value()) << decoded.error().to_string();
    EXPECT_TRUE(decoded->success());
    EXPECT_EQ(decoded->data.at("state"), "running");
}

TEST(Protocol, FailureResponseCarriesErrorName) {
    const auto failure = pi::make_failure(
            "r2",
            pe::Error{pe::make_error_code(pe::OrchErrc::TaskNotFound), "no task 9.9"});
    const auto line = pi::encode_response(failure);
    const auto json = nlohmann::json::parse(line);
    EXPECT_FALSE(json.at("success").get<bool>());
    EXPECT_EQ(json.at("error").at("code"), "TaskNotFound");
    EXPECT_EQ(json.at("error").at("message"), "no task 9.9");
    EXPECT_FALSE(json.contains("data"));

    const auto decoded = pi::decode_response(line);
    ASSERT_TRUE(decoded.has_value()) << decoded.error().to_string();
    ASSERT_FALSE(decoded->success());
    EXPECT_TRUE(decoded->error->is(pe::OrchErrc::TaskNotFound));
    EXPECT_EQ(decoded->error->message, "no task 9.9");
}

TEST(Protocol, UnknownErrorNameDecodesAsProtocolError) {
    const auto decoded = pi::decode_response(R"({"protocolVersion":1,"id":"x","success":false,)"
                                             R"("error":{"code":"Mystery","message":"m"}})");
    ASSERT_TRUE(decoded.has_value()) << decoded.error().to_string();
    ASSERT_FALSE(decoded->success());
    EXPECT_TRUE(decoded->error->is(pe::OrchErrc::ProtocolError));
    EXPECT_NE(decoded->error->message.find("Mystery"), std::string::npos);
}

TEST(Protocol, ResponseMissingFieldsIsRejected) {
    const auto decoded = pi::decode_response(R"({"protocolVersion":1,"success":true})");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_TRUE(decoded.error().is(pe::OrchErrc::ProtocolError));
}

TEST(Protocol, InvalidUtf8IsReplaced) {
    const std::string bad_output = std::string{"agent said "} + '\xff';
    const auto line = pi::encode_response(pi::make_success("r3", {{"output", bad_output}}));
    const auto json = nlohmann::json::parse(line);
    EXPECT_EQ(json.at("id"), "r3");
}

TEST(Protocol, DefaultSocketPath) {
    EXPECT_EQ(pi::default_socket_path("auth-rework"), "/tmp/orchestrator-auth-rework.sock");
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

} // namespace
