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
 * @file status_store_tests.cpp
 * @brief Unit tests for the durable status store
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include "engine/engine_errors.hpp"
#include "engine/file_io.hpp"
#include "engine/json_codec.hpp"
#include "engine/status_store.hpp"
#include "engine/task_types.hpp"
#include "engine_test_support.hpp"
#include "temp_file.hpp"

namespace {
namespace pe = planorch::engine;
namespace pt = planorch::testing;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

using namespace std::chrono_literals;

pe::PlanDefinition three_task_plan(const std::string &plan_id = "alpha") {
    return pt::make_plan(
            plan_id,
            {pt::make_task("1.1"), pt::make_task("1.2", {"1.1"}), pt::make_task("2.1", {"1.2"})});
}

pe::Status set_task(pe::StatusSnapshot &snapshot, const std::string &id, const pe::TaskStatus status) {
    pe::Task *task = snapshot.find(id);
    if (task == nullptr) {
        return pe::make_error(pe::OrchErrc::TaskNotFound, id);
    }
    task->status = status;
    return {};
}

TEST(StatusStore, RejectsInvalidConfiguration) {
    EXPECT_THROW(pe::StatusStore(pe::StatusStoreConfig{}), std::invalid_argument);

    const pt::TempDir dir{"store"};
    EXPECT_THROW(
            pe::StatusStore(pe::StatusStoreConfig{.state_dir = dir.path(), .lock_timeout = 0ms}),
            std::invalid_argument);
}

TEST(StatusStore, InitPersistsPendingSnapshot) {
    const pt::TempDir dir{"store"};
    pe::StatusStore store{pe::StatusStoreConfig{.state_dir = dir.path()}};

    const auto created = store.init(three_task_plan());
    ASSERT_TRUE(created.has_value()) << created.error().message;
    EXPECT_TRUE(store.exists("alpha"));
    EXPECT_EQ(store.status_path("alpha"), dir.path() / "alpha" / "status.json");
    EXPECT_EQ(created->summary.total_tasks, 3);
    EXPECT_EQ(created->summary.pending, 3);
    EXPECT_EQ(created->phase_order, (std::vector<std::string>{"1", "2"}));
    EXPECT_EQ(created->find("1.1")->dependents, (std::vector<std::string>{"1.2"}));

    const auto reread = store.read("alpha");
    ASSERT_TRUE(reread.has_value());
    EXPECT_TRUE(reread->equivalent_to(*created));

    const auto document = nlohmann::json::parse(pt::read_file_contents(store.status_path("alpha")));
    EXPECT_EQ(document.at("summary").at("pending"), 3);
    EXPECT_EQ(document.at("tasks").at("1.2").at("status"), "pending");
}

TEST(StatusStore, InitRejectsExistingPlanAndInvalidGraphs) {
    const pt::TempDir dir{"store"};
    pe::StatusStore store{pe::StatusStoreConfig{.state_dir = dir.path()}};

    ASSERT_TRUE(store.init(three_task_plan()).has_value());
    const auto again = store.init(three_task_plan());
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, pe::OrchErrc::PlanExists);

    const auto cyclic = store.init(pt::make_plan(
            "cyclic", {pt::make_task("1.1", {"1.2"}), pt::make_task("1.2", {"1.1"})}));
    ASSERT_FALSE(cyclic.has_value());
    EXPECT_EQ(cyclic.error().code, pe::OrchErrc::CycleError);
    EXPECT_FALSE(store.exists("cyclic"));

    const auto bad_id = store.init(pt::make_plan("../escape", {pt::make_task("1.1")}));
    ASSERT_FALSE(bad_id.has_value());
    EXPECT_EQ(bad_id.error().code, pe::OrchErrc::InvalidParameter);
}

TEST(StatusStore, ReadMissingPlan) {
    const pt::TempDir dir{"store"};
    const pe::StatusStore store{pe::StatusStoreConfig{.state_dir = dir.path()}};

    const auto missing = store.read("nothing");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, pe::OrchErrc::PlanNotFound);
    EXPECT_FALSE(store.exists("nothing"));
}

TEST(StatusStore, MutatePersistsAndRecalculatesSummary) {
    const pt::TempDir dir{"store"};
    pe::StatusStore store{pe::StatusStoreConfig{.state_dir = dir.path()}};
    ASSERT_TRUE(store.init(three_task_plan()).has_value());

    const auto updated = store.mutate("alpha", [](pe::StatusSnapshot &snapshot) {
        return set_task(snapshot, "1.1", pe::TaskStatus::Completed);
    });
    ASSERT_TRUE(updated.has_value()) << updated.error().message;
    EXPECT_EQ(updated->summary.completed, 1);
    EXPECT_EQ(updated->summary.pending, 2);

    const auto reread = store.read("alpha");
    ASSERT_TRUE(reread.has_value());
    EXPECT_EQ(reread->find("1.1")->status, pe::TaskStatus::Completed);
    EXPECT_EQ(reread->summary, updated->summary);
}

TEST(StatusStore, FailedMutationLeavesFileUntouched) {
    const pt::TempDir dir{"store"};
    pe::StatusStore store{pe::StatusStoreConfig{.state_dir = dir.path()}};
    ASSERT_TRUE(store.init(three_task_plan()).has_value());
    const auto before = pt::read_file_contents(store.status_path("alpha"));

    const auto missing = store.mutate("alpha", [](pe::StatusSnapshot &snapshot) {
        return set_task(snapshot, "9.9", pe::TaskStatus::Completed);
    });
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, pe::OrchErrc::TaskNotFound);
    EXPECT_EQ(pt::read_file_contents(store.status_path("alpha")), before);
}

TEST(StatusStore, StructuralMutationsAreRejected) {
    const pt::TempDir dir{"store"};
    pe::StatusStore store{pe::StatusStoreConfig{.state_dir = dir.path()}};
    ASSERT_TRUE(store.init(three_task_plan()).has_value());
    const auto before = pt::read_file_contents(store.status_path("alpha"));

    const auto expect_invalid = [&store](const pe::StatusStore::Mutation &mutation) {
        const auto result = store.mutate("alpha", mutation);
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().code, pe::OrchErrc::InvalidMutation);
    };

    expect_invalid([](pe::StatusSnapshot &snapshot) -> pe::Status {
        snapshot.find("2.1")->dependencies.clear();
        return {};
    });
    expect_invalid([](pe::StatusSnapshot &snapshot) -> pe::Status {
        snapshot.tasks.erase("2.1");
        return {};
    });
    expect_invalid([](pe::StatusSnapshot &snapshot) -> pe::Status {
        snapshot.find("1.1")->description = "rewritten";
        return {};
    });
    expect_invalid([](pe::StatusSnapshot &snapshot) -> pe::Status {
        std::swap(snapshot.task_order[0], snapshot.task_order[1]);
        return {};
    });
    EXPECT_EQ(pt::read_file_contents(store.status_path("alpha")), before);
}

TEST(StatusStore, RetryCountNeverDecreases) {
    const pt::TempDir dir{"store"};
    pe::StatusStore store{pe::StatusStoreConfig{.state_dir = dir.path()}};
    ASSERT_TRUE(store.init(three_task_plan()).has_value());

    ASSERT_TRUE(store.mutate("alpha", [](pe::StatusSnapshot &snapshot) -> pe::Status {
                         snapshot.find("1.1")->retry_count = 2;
                         return {};
                     }).has_value());

    const auto lowered = store.mutate("alpha", [](pe::StatusSnapshot &snapshot) -> pe::Status {
        snapshot.find("1.1")->retry_count = 1;
        return {};
    });
    ASSERT_FALSE(lowered.has_value());
    EXPECT_EQ(lowered.error().code, pe::OrchErrc::InvalidMutation);
}

TEST(StatusStore, ConcurrentMutationsAreSerialized) {
    const pt::TempDir dir{"store"};
    pe::StatusStore store{pe::StatusStoreConfig{.state_dir = dir.path()}};
    ASSERT_TRUE(store.init(three_task_plan()).has_value());

    static constexpr int THREADS = 4;
    static constexpr int UPDATES_PER_THREAD = 10;
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    threads.reserve(THREADS);
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&store, &failures] {
            for (int i = 0; i < UPDATES_PER_THREAD; ++i) {
                const auto result = store.mutate("alpha", [](pe::StatusSnapshot &snapshot) -> pe::Status {
                    ++snapshot.find("1.1")->retry_count;
                    return {};
                });
                if (!result) {
                    failures.fetch_add(1);
                }
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0);
    const auto final_state = store.read("alpha");
    ASSERT_TRUE(final_state.has_value());
    EXPECT_EQ(final_state->find("1.1")->retry_count, THREADS * UPDATES_PER_THREAD);
}

TEST(StatusStore, LockHeldElsewhereTimesOut) {
    const pt::TempDir dir{"store"};
    pe::StatusStore store{pe::StatusStoreConfig{.state_dir = dir.path(), .lock_timeout = 100ms}};
    ASSERT_TRUE(store.init(three_task_plan()).has_value());

    // A second descriptor stands in for another process holding the plan lock
    auto foreign = pe::FileLock::acquire(store.plan_dir("alpha") / "status.lock", 1000ms);
    ASSERT_TRUE(foreign.has_value());

    const auto blocked = store.mutate("alpha", [](pe::StatusSnapshot &snapshot) {
        return set_task(snapshot, "1.1", pe::TaskStatus::Completed);
    });
    ASSERT_FALSE(blocked.has_value());
    EXPECT_EQ(blocked.error().code, pe::OrchErrc::LockTimeout);

    foreign->release();
    EXPECT_TRUE(store.mutate("alpha", [](pe::StatusSnapshot &snapshot) {
                         return set_task(snapshot, "1.1", pe::TaskStatus::Completed);
                     }).has_value());
}

TEST(StatusStore, LoadRecoversInterruptedTasks) {
    const pt::TempDir dir{"store"};
    pe::StatusStore store{pe::StatusStoreConfig{.state_dir = dir.path()}};
    ASSERT_TRUE(store.init(three_task_plan()).has_value());
    ASSERT_TRUE(store.mutate("alpha", [](pe::StatusSnapshot &snapshot) {
                         return set_task(snapshot, "1.1", pe::TaskStatus::InProgress);
                     }).has_value());

    const auto loaded = store.load("alpha");
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(loaded->recovered_ids, (std::vector<std::string>{"1.1"}));
    EXPECT_FALSE(loaded->summary_repaired);

    const pe::Task *task = loaded->snapshot.find("1.1");
    EXPECT_EQ(task->status, pe::TaskStatus::Pending);
    EXPECT_EQ(task->retry_count, 1);
    ASSERT_TRUE(task->last_error.has_value());
    EXPECT_NE(task->last_error->find("interrupted"), std::string::npos);

    // The repair is persisted, so a second load finds nothing to do
    const auto again = store.load("alpha");
    ASSERT_TRUE(again.has_value());
    EXPECT_TRUE(again->recovered_ids.empty());
    EXPECT_EQ(again->snapshot.summary.in_progress, 0);
}

TEST(StatusStore, LoadRepairsStaleSummary) {
    const pt::TempDir dir{"store"};
    pe::StatusStore store{pe::StatusStoreConfig{.state_dir = dir.path()}};
    ASSERT_TRUE(store.init(three_task_plan()).has_value());

    auto document = nlohmann::json::parse(pt::read_file_contents(store.status_path("alpha")));
    document["summary"]["completed"] = 7;
    pt::write_file_contents(store.status_path("alpha"), document.dump());

    const auto loaded = store.load("alpha");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(loaded->summary_repaired);
    EXPECT_EQ(loaded->snapshot.summary.completed, 0);

    const auto fixed = nlohmann::json::parse(pt::read_file_contents(store.status_path("alpha")));
    EXPECT_EQ(fixed.at("summary").at("completed"), 0);
}

TEST(StatusStore, CrashMidWriteKeepsPreviousSnapshot) {
    const pt::TempDir dir{"store"};
    pe::StatusStore store{pe::StatusStoreConfig{.state_dir = dir.path()}};
    ASSERT_TRUE(store.init(three_task_plan()).has_value());
    ASSERT_TRUE(store.mutate("alpha", [](pe::StatusSnapshot &snapshot) {
                         return set_task(snapshot, "1.1", pe::TaskStatus::Completed);
                     }).has_value());

    // A writer that died before rename leaves only a partial temporary file
    const auto partial = store.status_path("alpha").string() + ".tmp.99999.0";
    pt::write_file_contents(partial, R"({"planId": "alpha", "tasks": {"1.1": {"sta)");

    const auto loaded = store.load("alpha");
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(loaded->snapshot.find("1.1")->status, pe::TaskStatus::Completed);
    EXPECT_EQ(loaded->snapshot.summary.completed, 1);

    EXPECT_TRUE(store.mutate("alpha", [](pe::StatusSnapshot &snapshot) {
                         return set_task(snapshot, "1.2", pe::TaskStatus::Completed);
                     }).has_value());
    const auto parsed = pe::parse_snapshot(pt::read_file_contents(store.status_path("alpha")));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->summary.completed, 2);
}

TEST(StatusStore, CorruptFileIsReported) {
    const pt::TempDir dir{"store"};
    pe::StatusStore store{pe::StatusStoreConfig{.state_dir = dir.path()}};
    ASSERT_TRUE(store.init(three_task_plan()).has_value());
    pt::write_file_contents(store.status_path("alpha"), "{\"planId\": \"alpha\", \"tas");

    const auto loaded = store.load("alpha");
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, pe::OrchErrc::CorruptSnapshot);
}

TEST(StatusStore, RunRecordsAreAppendOnly) {
    const pt::TempDir dir{"store"};
    pe::StatusStore store{pe::StatusStoreConfig{.state_dir = dir.path()}};
    ASSERT_TRUE(store.init(three_task_plan()).has_value());

    const auto first = store.start_run("alpha");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->rfind("run-", 0), 0);
    const auto second = store.start_run("alpha");
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(*first, *second);

    const auto completed = store.complete_run("alpha", *first, 3, 1, "blocked");
    ASSERT_TRUE(completed.has_value());
    ASSERT_EQ(completed->runs.size(), 2);
    EXPECT_EQ(completed->runs[0].end_reason, "blocked");
    EXPECT_EQ(completed->runs[0].tasks_attempted, 3);
    EXPECT_TRUE(completed->runs[0].completed_at.has_value());
    EXPECT_FALSE(completed->runs[1].completed_at.has_value());

    const auto twice = store.complete_run("alpha", *first, 4, 1, "completed");
    ASSERT_FALSE(twice.has_value());
    EXPECT_EQ(twice.error().code, pe::OrchErrc::InvalidTransition);

    const auto unknown = store.complete_run("alpha", "run-0", 0, 0, "completed");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, pe::OrchErrc::InvalidParameter);

    const auto rewrite = store.mutate("alpha", [](pe::StatusSnapshot &snapshot) -> pe::Status {
        snapshot.runs[0].tasks_failed = 0;
        return {};
    });
    ASSERT_FALSE(rewrite.has_value());
    EXPECT_EQ(rewrite.error().code, pe::OrchErrc::InvalidMutation);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

} // namespace
