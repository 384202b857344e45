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
 * @file planorch_log_tests.cpp
 * @brief Unit tests for the planorch logger wrapper and component levels
 */

#include <filesystem>    // for exists
#include <stdexcept>     // for invalid_argument
#include <string>        // for string
#include <unordered_map> // for unordered_map

#include <gtest/gtest.h>

#include "log/components.hpp"
#include "log/planorch_log.hpp"
#include "log/planorch_log_macros.hpp"
#include "temp_file.hpp"

namespace {

namespace pl = ::planorch::log;
namespace pt = ::planorch::testing;

DECLARE_LOG_COMPONENT(TestComponent, Store, Scheduler, Ipc);
DECLARE_LOG_EVENT(TestEvent, TaskStarted, TaskFailed);

class PlanorchLogTest : public ::testing::Test {
protected:
    void TearDown() override {
        pl::register_component<TestComponent>(pl::LogLevel::Info);
        pl::Logger::configure(pl::LoggerConfig::console());
    }

    pt::TempDir temp_dir_{"log"};
};

TEST_F(PlanorchLogTest, FileSinkWritesMessages) {
    const auto log_file = temp_dir_.file("plain.log").string();
    pl::Logger::configure(pl::LoggerConfig::file(log_file, pl::LogLevel::Debug));

    PLANORCH_LOG_DEBUG("debug value {}", 42);
    PLANORCH_LOG_INFO("info value {}", "alpha");
    PLANORCH_LOG_WARN("warn message");
    pl::Logger::flush();

    const auto actual = pl::Logger::get_actual_log_file();
    EXPECT_TRUE(std::filesystem::exists(actual));
    EXPECT_TRUE(pt::file_contains(actual, "debug value 42"));
    EXPECT_TRUE(pt::file_contains(actual, "info value alpha"));
    EXPECT_TRUE(pt::file_contains(actual, "warn message"));
}

TEST_F(PlanorchLogTest, ComponentPrefixAndEventName) {
    const auto log_file = temp_dir_.file("component.log").string();
    pl::Logger::configure(pl::LoggerConfig::file(log_file, pl::LogLevel::Debug));
    pl::register_component<TestComponent>(pl::LogLevel::Debug);

    PLANORCH_LOGC_INFO(TestComponent::Store, "snapshot written for {}", "plan-a");
    PLANORCH_LOGEC_WARN(TestComponent::Scheduler, TestEvent::TaskFailed, "task {}", "1.2");
    pl::Logger::flush();

    const auto actual = pl::Logger::get_actual_log_file();
    EXPECT_TRUE(pt::file_contains(actual, "[Store] snapshot written for plan-a"));
    EXPECT_TRUE(pt::file_contains(actual, "[Scheduler] EVENT [TaskFailed] task 1.2"));
}

TEST_F(PlanorchLogTest, ComponentLevelFiltersMessages) {
    const auto log_file = temp_dir_.file("filtered.log").string();
    pl::Logger::configure(pl::LoggerConfig::file(log_file, pl::LogLevel::Debug));
    pl::register_component<TestComponent>(
            std::unordered_map<TestComponent, pl::LogLevel>{
                    {TestComponent::Store, pl::LogLevel::Warn},
                    {TestComponent::Ipc, pl::LogLevel::Debug}});

    PLANORCH_LOGC_INFO(TestComponent::Store, "store info hidden");
    PLANORCH_LOGC_ERROR(TestComponent::Store, "store error shown");
    PLANORCH_LOGC_DEBUG(TestComponent::Ipc, "ipc debug shown");
    pl::Logger::flush();

    const auto actual = pl::Logger::get_actual_log_file();
    EXPECT_FALSE(pt::file_contains(actual, "store info hidden"));
    EXPECT_TRUE(pt::file_contains(actual, "store error shown"));
    EXPECT_TRUE(pt::file_contains(actual, "ipc debug shown"));
    EXPECT_EQ(pl::get_component_level(TestComponent::Store), pl::LogLevel::Warn);
}

TEST_F(PlanorchLogTest, GlobalLevelFiltersMessages) {
    const auto log_file = temp_dir_.file("global.log").string();
    pl::Logger::configure(pl::LoggerConfig::file(log_file, pl::LogLevel::Warn));
    EXPECT_EQ(pl::Logger::get_current_level(), pl::LogLevel::Warn);

    PLANORCH_LOG_INFO("global info hidden");
    PLANORCH_LOG_ERROR("global error shown");
    pl::Logger::flush();

    const auto actual = pl::Logger::get_actual_log_file();
    EXPECT_FALSE(pt::file_contains(actual, "global info hidden"));
    EXPECT_TRUE(pt::file_contains(actual, "global error shown"));
}

TEST_F(PlanorchLogTest, RotatingSinkCreatesFile) {
    const auto log_file = temp_dir_.file("rotating.log").string();
    pl::Logger::configure(pl::LoggerConfig::rotating_file(log_file, pl::LogLevel::Info)
                                  .with_rotation_size(1024 * 1024)
                                  .with_max_backup_files(2));
    EXPECT_EQ(pl::Logger::get_sink_type(), pl::SinkType::RotatingFile);

    PLANORCH_LOG_INFO("rotating message");
    pl::Logger::flush();
    EXPECT_TRUE(pt::file_contains(pl::Logger::get_actual_log_file(), "rotating message"));
}

TEST_F(PlanorchLogTest, FileSinkWithoutPathThrows) {
    EXPECT_THROW(pl::Logger::configure(pl::LoggerConfig::file("")), std::invalid_argument);
    // The previous logger is still usable
    PLANORCH_LOG_INFO("still logging");
}

TEST(PlanorchLogLevels, ParseLogLevel) {
    EXPECT_EQ(pl::parse_log_level("Debug"), pl::LogLevel::Debug);
    EXPECT_EQ(pl::parse_log_level("debug"), pl::LogLevel::Debug);
    EXPECT_EQ(pl::parse_log_level("WARN"), pl::LogLevel::Warn);
    EXPECT_EQ(pl::parse_log_level("warning"), pl::LogLevel::Warn);
    EXPECT_EQ(pl::parse_log_level("trace"), pl::LogLevel::TraceL1);
    EXPECT_FALSE(pl::parse_log_level("verbose").has_value());
}

} // namespace
