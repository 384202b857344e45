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
 * @file scheduler_tests.cpp
 * @brief Unit tests for constraint derivation and ready-task selection
 */

#include <algorithm>
#include <cstddef>
#include <map>
#include <numeric>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "engine/scheduler.hpp"
#include "engine/task_types.hpp"
#include "engine_test_support.hpp"

namespace {
namespace pe = planorch::engine;
namespace pt = planorch::testing;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

using Ids = std::vector<std::string>;

Ids ready_ids(const pe::StatusSnapshot &snapshot, const pe::ScheduleOptions &options = {}) {
    return pt::ids_of(pe::Scheduler::ready_tasks(snapshot, options).ready);
}

TEST(Scheduler, DiamondReleasesByGeneration) {
    auto snapshot = pt::make_snapshot(
            {pt::make_task("1.1"),
             pt::make_task("1.2", {"1.1"}),
             pt::make_task("1.3", {"1.1"}),
             pt::make_task("1.4", {"1.2", "1.3"})});

    EXPECT_EQ(ready_ids(snapshot), (Ids{"1.1"}));

    pt::set_status(snapshot, "1.1", pe::TaskStatus::Completed);
    EXPECT_EQ(ready_ids(snapshot), (Ids{"1.2", "1.3"}));

    pt::set_status(snapshot, "1.2", pe::TaskStatus::Completed);
    pt::set_status(snapshot, "1.3", pe::TaskStatus::InProgress);
    const auto partial = pe::Scheduler::ready_tasks(snapshot);
    EXPECT_TRUE(partial.ready.empty());
    EXPECT_EQ(partial.blocked.at("1.4"), "dependency:1.3");

    pt::set_status(snapshot, "1.3", pe::TaskStatus::Completed);
    EXPECT_EQ(ready_ids(snapshot), (Ids{"1.4"}));
}

TEST(Scheduler, SkippedDependencySatisfiesFailedDoesNot) {
    auto snapshot = pt::make_snapshot(
            {pt::make_task("1.1"), pt::make_task("1.2"), pt::make_task("2.1", {"1.1"}),
             pt::make_task("2.2", {"1.2"})});
    pt::set_status(snapshot, "1.1", pe::TaskStatus::Skipped);
    pt::set_status(snapshot, "1.2", pe::TaskStatus::Failed);

    const auto result = pe::Scheduler::ready_tasks(snapshot);
    EXPECT_EQ(pt::ids_of(result.ready), (Ids{"2.1"}));
    EXPECT_EQ(result.blocked.at("2.2"), "dependency:1.2");
}

TEST(Scheduler, SequentialGroupRunsOneAtATime) {
    auto snapshot = pt::make_snapshot(
            {pt::make_task("3.1", {}, "migrations"),
             pt::make_task("3.2", {}, "migrations"),
             pt::make_task("3.3", {}, "migrations"),
             pt::make_task("3.4", {}, "migrations")});
    const pe::ScheduleOptions batch{.max_count = 4};

    auto result = pe::Scheduler::ready_tasks(snapshot, batch);
    EXPECT_EQ(pt::ids_of(result.ready), (Ids{"3.1"}));
    EXPECT_EQ(result.blocked.at("3.2"), "sequential:migrations");
    EXPECT_EQ(result.blocked.size(), 3);

    pt::set_status(snapshot, "3.1", pe::TaskStatus::InProgress);
    EXPECT_TRUE(ready_ids(snapshot, batch).empty());

    pt::set_status(snapshot, "3.1", pe::TaskStatus::Completed);
    EXPECT_EQ(ready_ids(snapshot, batch), (Ids{"3.2"}));

    pt::set_status(snapshot, "3.2", pe::TaskStatus::Skipped);
    EXPECT_EQ(ready_ids(snapshot, batch), (Ids{"3.3"}));
}

TEST(Scheduler, FailedGroupHeadBlocksTheGroup) {
    auto snapshot = pt::make_snapshot(
            {pt::make_task("3.1", {}, "g"), pt::make_task("3.2", {}, "g"), pt::make_task("4.1")});
    pt::set_status(snapshot, "3.1", pe::TaskStatus::Failed);

    const auto result = pe::Scheduler::ready_tasks(snapshot);
    EXPECT_EQ(pt::ids_of(result.ready), (Ids{"4.1"}));
    EXPECT_EQ(result.blocked.at("3.2"), "sequential:g");
}

TEST(Scheduler, IgnoreSequentialOption) {
    const auto snapshot = pt::make_snapshot(
            {pt::make_task("3.1", {}, "g"), pt::make_task("3.2", {}, "g")});

    EXPECT_EQ(ready_ids(snapshot, {.ignore_sequential = true}), (Ids{"3.1", "3.2"}));
}

TEST(Scheduler, SharedFileAdmitsOneTask) {
    auto snapshot = pt::make_snapshot(
            {pt::make_task("5.1", {}, std::nullopt, {"src/api.ts"}),
             pt::make_task("5.2", {}, std::nullopt, {"src/api.ts"}),
             pt::make_task("5.3", {}, std::nullopt, {"src/other.ts"})});

    auto result = pe::Scheduler::ready_tasks(snapshot);
    EXPECT_EQ(pt::ids_of(result.ready), (Ids{"5.1", "5.3"}));
    EXPECT_EQ(result.blocked.at("5.2"), "fileConflict:5.1");

    pt::set_status(snapshot, "5.1", pe::TaskStatus::InProgress);
    pt::set_status(snapshot, "5.3", pe::TaskStatus::InProgress);
    result = pe::Scheduler::ready_tasks(snapshot);
    EXPECT_TRUE(result.ready.empty());
    EXPECT_EQ(result.blocked.at("5.2"), "fileConflict:5.1");

    pt::set_status(snapshot, "5.1", pe::TaskStatus::Failed);
    EXPECT_EQ(ready_ids(snapshot), (Ids{"5.2"}));
}

TEST(Scheduler, DerivedConstraints) {
    const auto snapshot = pt::make_snapshot(
            {pt::make_task("2.1", {}, "db", {"a.sql"}),
             pt::make_task("1.1", {}, std::nullopt, {"a.sql"}),
             pt::make_task("2.2", {}, "db"),
             pt::make_task("2.3", {}, std::nullopt, {"b.sql"})});

    const auto constraints = pe::derive_constraints(snapshot);
    ASSERT_EQ(constraints.size(), 2);
    EXPECT_EQ(constraints[0].kind, pe::ConstraintKind::Sequential);
    EXPECT_EQ(constraints[0].name, "db");
    EXPECT_EQ(constraints[0].members, (Ids{"2.1", "2.2"}));
    EXPECT_EQ(constraints[1].kind, pe::ConstraintKind::FileConflict);
    EXPECT_EQ(constraints[1].name, "a.sql");
    // Phase "2" is declared first, so 2.1 outranks 1.1
    EXPECT_EQ(constraints[1].members, (Ids{"2.1", "1.1"}));
}

TEST(Scheduler, ExplicitConflictSet) {
    const auto snapshot = pt::make_snapshot({pt::make_task("1.1"), pt::make_task("1.2")});
    const std::vector<pe::ExecutionConstraint> constraints{pe::ExecutionConstraint{
            .kind = pe::ConstraintKind::FileConflict,
            .name = "shared-db",
            .members = {"1.1", "1.2"},
            .reason = "operator"}};

    const auto result = pe::Scheduler::ready_tasks(snapshot, constraints);
    EXPECT_EQ(pt::ids_of(result.ready), (Ids{"1.1"}));
    EXPECT_EQ(result.blocked.at("1.2"), "fileConflict:1.1");
}

TEST(Scheduler, MaxCountTruncatesInPriorityOrder) {
    const auto snapshot = pt::make_snapshot(
            {pt::make_task("2.1"), pt::make_task("1.10"), pt::make_task("1.2"), pt::make_task("1.1")});

    EXPECT_EQ(ready_ids(snapshot, {.max_count = 2}), (Ids{"2.1", "1.1"}));
    EXPECT_TRUE(ready_ids(snapshot, {.max_count = 0}).empty());
}

TEST(Scheduler, PhaseOrderIsPriority) {
    const auto snapshot = pt::make_snapshot(
            {pt::make_task("1.1"), pt::make_task("1.10"), pt::make_task("1.2"), pt::make_task("2.1")});

    EXPECT_EQ(ready_ids(snapshot, {.max_count = 3}), (Ids{"1.1", "1.2", "1.10"}));
}

TEST(Scheduler, ForceDependencies) {
    const auto snapshot = pt::make_snapshot({pt::make_task("1.1"), pt::make_task("1.2", {"1.1"})});

    const auto result = pe::Scheduler::ready_tasks(snapshot, {.force_dependencies = true});
    EXPECT_EQ(pt::ids_of(result.ready), (Ids{"1.1", "1.2"}));
    EXPECT_EQ(result.forced, (Ids{"1.2"}));
    EXPECT_TRUE(result.blocked.empty());
}

TEST(Scheduler, DeterministicForEqualInput) {
    auto snapshot = pt::make_snapshot(
            {pt::make_task("1.1", {}, std::nullopt, {"x"}),
             pt::make_task("1.2", {}, "g", {"x"}),
             pt::make_task("1.3", {}, "g"),
             pt::make_task("2.1", {"1.1"}),
             pt::make_task("2.2", {}, std::nullopt, {"y"}),
             pt::make_task("2.3", {}, std::nullopt, {"y"})});
    pt::set_status(snapshot, "1.3", pe::TaskStatus::Completed);

    const auto first = pe::Scheduler::ready_tasks(snapshot, {.max_count = 3});
    for (int i = 0; i < 20; ++i) {
        const auto next = pe::Scheduler::ready_tasks(snapshot, {.max_count = 3});
        EXPECT_EQ(pt::ids_of(next.ready), pt::ids_of(first.ready));
        EXPECT_EQ(next.blocked, first.blocked);
    }
}

TEST(Scheduler, FileConflictsIgnoreDeclarationOrder) {
    const std::vector<pe::Task> tasks{
            pt::make_task("1.1", {}, std::nullopt, {"a"}),
            pt::make_task("1.2", {}, std::nullopt, {"a", "b"}),
            pt::make_task("1.3", {}, std::nullopt, {"b"}),
            pt::make_task("2.1", {"1.1"}, std::nullopt, {"c"}),
            pt::make_task("2.2", {}, std::nullopt, {"c"}),
            pt::make_task("2.3", {}, std::nullopt, {"a"})};

    std::vector<std::size_t> order(tasks.size());
    std::iota(order.begin(), order.end(), 0U);
    std::size_t permutations = 0;
    do {
        std::vector<pe::Task> declared;
        for (const auto index : order) {
            declared.push_back(tasks[index]);
        }
        auto snapshot = pt::make_snapshot(std::move(declared));
        snapshot.phase_order = {"1", "2"};
        pt::set_status(snapshot, "2.3", pe::TaskStatus::InProgress);

        const auto result = pe::Scheduler::ready_tasks(snapshot);
        ASSERT_EQ(pt::ids_of(result.ready), (Ids{"1.3", "2.2"})) << snapshot.task_order.front();
        ASSERT_EQ(
                result.blocked,
                (std::map<std::string, std::string>{
                        {"1.1", "fileConflict:2.3"},
                        {"1.2", "fileConflict:2.3"},
                        {"2.1", "dependency:1.1"}}));

        const auto constraints = pe::derive_constraints(snapshot);
        ASSERT_EQ(constraints.size(), 3U);
        EXPECT_EQ(constraints[0].name, "a");
        EXPECT_EQ(constraints[0].members, (Ids{"1.1", "1.2", "2.3"}));
        ++permutations;
    } while (std::next_permutation(order.begin(), order.end()));
    EXPECT_EQ(permutations, 720U);
}

TEST(Scheduler, ReadyTasksAreNeverMutuallyConstrained) {
    const auto snapshot = pt::make_snapshot(
            {pt::make_task("1.1", {}, "g", {"a"}),
             pt::make_task("1.2", {}, "g", {"b"}),
             pt::make_task("1.3", {}, std::nullopt, {"a", "b"}),
             pt::make_task("1.4", {}, std::nullopt, {"b"}),
             pt::make_task("1.5", {}, std::nullopt, {"c"}),
             pt::make_task("1.6", {}, std::nullopt, {"c", "d"})});
    const auto constraints = pe::derive_constraints(snapshot);

    const auto result = pe::Scheduler::ready_tasks(snapshot, constraints);
    for (const auto &constraint : constraints) {
        int members_ready = 0;
        for (const auto &task : result.ready) {
            for (const auto &member : constraint.members) {
                members_ready += static_cast<int>(member == task.id);
            }
        }
        EXPECT_LE(members_ready, 1) << constraint.name;
    }
    EXPECT_EQ(pt::ids_of(result.ready), (Ids{"1.1", "1.4", "1.5"}));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

} // namespace
