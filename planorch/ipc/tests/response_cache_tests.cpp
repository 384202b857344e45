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
 * @file response_cache_tests.cpp
 * @brief Unit tests for the request id response cache
 */

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include "ipc/protocol.hpp"
#include "ipc/response_cache.hpp"

namespace {
namespace pi = planorch::ipc;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

pi::Response response(const std::string &id, const int value) {
    return pi::make_success(id, {{"value", value}});
}

TEST(ResponseCache, ZeroCapacityIsRejected) {
    EXPECT_THROW(pi::ResponseCache{0}, std::invalid_argument);
}

TEST(ResponseCache, FindsInsertedResponse) {
    pi::ResponseCache cache{4};
    EXPECT_FALSE(cache.find("a").has_value());

    cache.insert("a", response("a", 1));
    const auto found = cache.find("a");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->data.at("value"), 1);
    EXPECT_EQ(cache.size(), 1U);
}

TEST(ResponseCache, EvictsLeastRecentlyUsed) {
    pi::ResponseCache cache{2};
    cache.insert("a", response("a", 1));
    cache.insert("b", response("b", 2));
    ASSERT_TRUE(cache.find("a").has_value()); // a is now the most recent

    cache.insert("c", response("c", 3));
    EXPECT_EQ(cache.size(), 2U);
    EXPECT_TRUE(cache.find("a").has_value());
    EXPECT_FALSE(cache.find("b").has_value());
    EXPECT_TRUE(cache.find("c").has_value());
}

TEST(ResponseCache, ReinsertReplacesEntry) {
    pi::ResponseCache cache{2};
    cache.insert("a", response("a", 1));
    cache.insert("a", response("a", 5));
    EXPECT_EQ(cache.size(), 1U);
    EXPECT_EQ(cache.find("a")->data.at("value"), 5);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

} // namespace
