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
 * @file task_types_tests.cpp
 * @brief Unit tests for task types, id ordering and the JSON codec
 */

#include <algorithm>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include "engine/engine_errors.hpp"
#include "engine/json_codec.hpp"
#include "engine/task_types.hpp"
#include "engine_test_support.hpp"

namespace {
namespace pe = planorch::engine;
namespace pt = planorch::testing;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

TEST(TaskIds, NaturalOrdering) {
    EXPECT_LT(pe::compare_task_ids("1.2", "1.10"), 0);
    EXPECT_GT(pe::compare_task_ids("2.1", "1.10"), 0);
    EXPECT_EQ(pe::compare_task_ids("3.4", "3.4"), 0);
    EXPECT_LT(pe::compare_task_ids("1", "1.1"), 0);
    EXPECT_LT(pe::compare_task_ids("1.9", "1.a"), 0);
    EXPECT_LT(pe::compare_task_ids("setup.a", "setup.b"), 0);

    std::vector<std::string> ids{"10.1", "2.10", "2.2", "1.1", "2.1"};
    std::sort(ids.begin(), ids.end(), [](const auto &a, const auto &b) {
        return pe::compare_task_ids(a, b) < 0;
    });
    EXPECT_EQ(ids, (std::vector<std::string>{"1.1", "2.1", "2.2", "2.10", "10.1"}));
}

TEST(TaskIds, PhaseIsLeadingSegment) {
    EXPECT_EQ(pe::derive_phase("3.2"), "3");
    EXPECT_EQ(pe::derive_phase("setup.init.a"), "setup");
    EXPECT_EQ(pe::derive_phase("single"), "single");
}

TEST(TaskStatus, WireNamesAndPredicates) {
    EXPECT_EQ(pe::to_wire(pe::TaskStatus::InProgress), "in_progress");
    EXPECT_EQ(pe::task_status_from_wire("skipped"), pe::TaskStatus::Skipped);
    EXPECT_FALSE(pe::task_status_from_wire("running").has_value());

    EXPECT_TRUE(pe::is_terminal(pe::TaskStatus::Failed));
    EXPECT_FALSE(pe::is_terminal(pe::TaskStatus::InProgress));
    EXPECT_TRUE(pe::satisfies_dependency(pe::TaskStatus::Skipped));
    EXPECT_FALSE(pe::satisfies_dependency(pe::TaskStatus::Failed));
}

TEST(StatusSnapshot, SummaryTracksStatuses) {
    auto snapshot = pt::make_snapshot(
            {pt::make_task("1.1"), pt::make_task("1.2"), pt::make_task("2.1"), pt::make_task("2.2")});
    pt::set_status(snapshot, "1.1", pe::TaskStatus::Completed);
    pt::set_status(snapshot, "1.2", pe::TaskStatus::InProgress);
    pt::set_status(snapshot, "2.1", pe::TaskStatus::Skipped);

    EXPECT_EQ(snapshot.summary.total_tasks, 4);
    EXPECT_EQ(snapshot.summary.completed, 1);
    EXPECT_EQ(snapshot.summary.in_progress, 1);
    EXPECT_EQ(snapshot.summary.skipped, 1);
    EXPECT_EQ(snapshot.summary.pending, 1);
    EXPECT_EQ(snapshot.summary, pe::compute_summary(snapshot));
    EXPECT_EQ(snapshot.phase_rank("2"), 1);
    EXPECT_EQ(snapshot.phase_rank("9"), snapshot.phase_order.size());
}

TEST(JsonCodec, SnapshotSurvivesPersistence) {
    auto snapshot = pt::make_snapshot(
            {pt::make_task("1.1", {}, "db", {"schema.sql"}),
             pt::make_task("1.2", {"1.1"}, "db"),
             pt::make_task("2.1", {"1.2"})});
    auto &task = *snapshot.find("1.2");
    task.status = pe::TaskStatus::Failed;
    task.retry_count = 2;
    task.last_error = "exit code 3";
    snapshot.runs.push_back(pe::RunRecord{
            .run_id = "run-1",
            .started_at = "2025-01-01T00:00:00.000Z",
            .completed_at = "2025-01-01T00:01:00.000Z",
            .tasks_attempted = 3,
            .tasks_failed = 1,
            .end_reason = "blocked"});
    snapshot.recalculate_summary();

    const auto document = pe::snapshot_to_json(snapshot);
    EXPECT_EQ(document.at("tasks").at("1.2").at("status"), "failed");
    EXPECT_EQ(document.at("dependencyGraph").at("2.1"), nlohmann::json::array({"1.2"}));
    EXPECT_EQ(document.at("summary").at("failed"), 1);
    EXPECT_FALSE(document.at("tasks").at("2.1").contains("lastError"));

    const auto parsed = pe::parse_snapshot(document.dump());
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    EXPECT_TRUE(parsed->equivalent_to(snapshot));
}

TEST(JsonCodec, CorruptSnapshotsAreRejected) {
    EXPECT_EQ(pe::parse_snapshot("{not json").error().code, pe::OrchErrc::CorruptSnapshot);
    EXPECT_EQ(pe::parse_snapshot("[]").error().code, pe::OrchErrc::CorruptSnapshot);
    EXPECT_EQ(pe::parse_snapshot(R"({"tasks": {}})").error().code, pe::OrchErrc::CorruptSnapshot);

    const auto bad_status = pe::parse_snapshot(
            R"({"planId": "p", "tasks": {"1.1": {"status": "running"}}})");
    ASSERT_FALSE(bad_status.has_value());
    EXPECT_EQ(bad_status.error().code, pe::OrchErrc::CorruptSnapshot);

    const auto dangling = pe::parse_snapshot(
            R"({"planId": "p", "tasks": {"1.1": {"dependencies": ["4.4"]}}})");
    ASSERT_FALSE(dangling.has_value());
    EXPECT_EQ(dangling.error().code, pe::OrchErrc::CorruptSnapshot);

    const auto future_schema =
            pe::parse_snapshot(R"({"schemaVersion": 99, "planId": "p", "tasks": {}})");
    ASSERT_FALSE(future_schema.has_value());
    EXPECT_EQ(future_schema.error().code, pe::OrchErrc::CorruptSnapshot);
}

TEST(JsonCodec, MissingTaskOrderFallsBackToNaturalOrder) {
    const auto parsed = pe::parse_snapshot(
            R"({"planId": "p", "tasks": {"1.10": {}, "1.2": {}, "1.1": {"status": "completed"}}})");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->task_order, (std::vector<std::string>{"1.1", "1.2", "1.10"}));
    EXPECT_EQ(parsed->summary.completed, 1);
    EXPECT_EQ(parsed->phase_order, (std::vector<std::string>{"1"}));
}

TEST(JsonCodec, PlanDefinitionIgnoresExecutionState) {
    const auto plan = pe::parse_plan_definition(R"({
        "planId": "feature-x",
        "phases": ["1", "2"],
        "tasks": [
            {"id": "1.1", "description": "schema", "status": "completed", "retryCount": 4},
            {"id": "2.1", "description": "api", "dependencies": ["1.1"],
             "fileReferences": ["src/api.cpp"], "sequentialGroup": "api"}
        ]
    })");
    ASSERT_TRUE(plan.has_value()) << plan.error().message;
    EXPECT_EQ(plan->plan_id, "feature-x");
    ASSERT_EQ(plan->tasks.size(), 2U);
    EXPECT_EQ(plan->tasks[0].status, pe::TaskStatus::Pending);
    EXPECT_EQ(plan->tasks[0].retry_count, 0U);
    EXPECT_EQ(plan->tasks[1].phase, "2");
    EXPECT_EQ(plan->tasks[1].sequential_group, "api");
    EXPECT_EQ(plan->tasks[1].file_references, (std::vector<std::string>{"src/api.cpp"}));
}

TEST(JsonCodec, InvalidPlanDefinition) {
    EXPECT_EQ(pe::parse_plan_definition("").error().code, pe::OrchErrc::ValidationError);
    EXPECT_EQ(
            pe::parse_plan_definition(R"({"planId": "", "tasks": []})").error().code,
            pe::OrchErrc::ValidationError);
    EXPECT_EQ(
            pe::parse_plan_definition(R"({"planId": "p"})").error().code,
            pe::OrchErrc::ValidationError);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

} // namespace
