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
 * @file plan_file_tests.cpp
 * @brief Unit tests for plan file loading
 */

#include <gtest/gtest.h>

#include "adapters/plan_file.hpp"
#include "engine/engine_errors.hpp"
#include "temp_file.hpp"

namespace {
namespace pa = planorch::adapters;
namespace pe = planorch::engine;
namespace pt = planorch::testing;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

TEST(PlanFile, LoadsParserOutput) {
    pt::TempDir dir{"planfile"};
    pt::write_file_contents(dir.file("plan.json"), R"({
        "planId": "auth",
        "phases": ["1", "2"],
        "tasks": [
            {"id": "1.1", "description": "schema", "dependencies": []},
            {"id": "2.1", "description": "api", "dependencies": ["1.1"],
             "sequentialGroup": "api", "fileReferences": ["src/api.cpp"]}
        ]
    })");

    const auto plan = pa::load_plan_file(dir.file("plan.json"));
    ASSERT_TRUE(plan.has_value()) << plan.error().to_string();
    EXPECT_EQ(plan->plan_id, "auth");
    ASSERT_EQ(plan->tasks.size(), 2U);
    EXPECT_EQ(plan->tasks[1].dependencies.at(0), "1.1");
}

TEST(PlanFile, MissingFile) {
    pt::TempDir dir{"planfile"};
    const auto plan = pa::load_plan_file(dir.file("absent.json"));
    ASSERT_FALSE(plan.has_value());
    EXPECT_TRUE(plan.error().is(pe::OrchErrc::PlanNotFound));
}

TEST(PlanFile, MalformedFile) {
    pt::TempDir dir{"planfile"};
    pt::write_file_contents(dir.file("plan.json"), R"({"planId": "p", "tasks": "none"})");
    const auto plan = pa::load_plan_file(dir.file("plan.json"));
    ASSERT_FALSE(plan.has_value());
    EXPECT_TRUE(plan.error().is(pe::OrchErrc::ValidationError));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

} // namespace
