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
 * @file commit_queue_tests.cpp
 * @brief Unit tests for the serial commit queue
 */

#include <chrono>
#include <cstddef>
#include <format>
#include <future>
#include <initializer_list>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include "engine/commit_queue.hpp"
#include "engine/engine_errors.hpp"
#include "engine_test_support.hpp"
#include "temp_file.hpp"

namespace {
namespace pe = planorch::engine;
namespace pt = planorch::testing;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

using namespace std::chrono_literals;

pe::CommitQueueConfig fast_config(const pt::TempDir &dir) {
    return pe::CommitQueueConfig{
            .state_dir = dir.path(), .max_attempts = 3, .retry_delay = 5ms, .max_failed_entries = 2};
}

pe::Result<pe::CommitResult> get_result(pe::CommitQueue::Future &future) {
    EXPECT_EQ(future.wait_for(5s), std::future_status::ready);
    return future.get();
}

nlohmann::json read_state(const pe::CommitQueue &queue) {
    return nlohmann::json::parse(pt::read_file_contents(queue.state_path()));
}

TEST(CommitQueue, RejectsInvalidConfiguration) {
    pt::FakeVersionControl vcs;
    EXPECT_THROW(pe::CommitQueue(pe::CommitQueueConfig{}, vcs), std::invalid_argument);

    const pt::TempDir dir{"queue"};
    auto config = fast_config(dir);
    config.max_attempts = 0;
    EXPECT_THROW(pe::CommitQueue(config, vcs), std::invalid_argument);
}

TEST(CommitQueue, EnqueueBeforeStartIsRejected) {
    const pt::TempDir dir{"queue"};
    pt::FakeVersionControl vcs;
    pe::CommitQueue queue{fast_config(dir), vcs};

    auto future = queue.enqueue("early", {});
    const auto result = get_result(future);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, pe::OrchErrc::QueueStopped);
    EXPECT_TRUE(vcs.commits().empty());
}

TEST(CommitQueue, CommitsWithTrailer) {
    const pt::TempDir dir{"queue"};
    pt::FakeVersionControl vcs;
    pe::CommitQueue queue{fast_config(dir), vcs};
    ASSERT_TRUE(queue.start().has_value());
    EXPECT_EQ(queue.start().error().code, pe::OrchErrc::AlreadyRunning);

    auto future = queue.enqueue("complete task 1.1", {"src/a.cpp"});
    const auto result = get_result(future);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->entry_id, "cq-1");
    EXPECT_EQ(result->commit_id, "c1");
    EXPECT_EQ(result->attempts, 1);
    EXPECT_FALSE(result->dropped);

    const auto commits = vcs.commits();
    ASSERT_EQ(commits.size(), 1);
    EXPECT_EQ(commits[0].message, "complete task 1.1\n\nQueue-Entry: cq-1");
    EXPECT_EQ(commits[0].files, (std::vector<std::string>{"src/a.cpp"}));

    ASSERT_TRUE(queue.wait_for_drain(1s));
    const auto status = queue.status();
    EXPECT_EQ(status.total_commits, 1);
    EXPECT_EQ(status.last_processed_id, 1);
    EXPECT_FALSE(status.processing);

    const auto state = read_state(queue);
    EXPECT_TRUE(state.at("entries").empty());
    EXPECT_EQ(state.at("lastProcessedId"), 1);
    EXPECT_EQ(state.at("nextId"), 2);
}

TEST(CommitQueue, ConcurrentEnqueuesCommitSeriallyInFifoOrder) {
    const pt::TempDir dir{"queue"};
    pt::FakeVersionControl vcs;
    vcs.set_commit_delay(1ms);
    pe::CommitQueue queue{fast_config(dir), vcs};
    ASSERT_TRUE(queue.start().has_value());

    static constexpr int PRODUCERS = 4;
    static constexpr int PER_PRODUCER = 5;
    std::mutex futures_mutex;
    std::vector<std::pair<std::string, pe::CommitQueue::Future>> futures;
    std::vector<std::thread> producers;
    for (int p = 0; p < PRODUCERS; ++p) {
        producers.emplace_back([&, p] {
            for (int i = 0; i < PER_PRODUCER; ++i) {
                // Hold the lock across enqueue so the recorded order is the queue order
                const std::lock_guard lock{futures_mutex};
                auto message = std::format("p{} item {}", p, i);
                futures.emplace_back(message, queue.enqueue(message, {}));
            }
        });
    }
    for (auto &producer : producers) {
        producer.join();
    }

    for (auto &[message, future] : futures) {
        const auto result = get_result(future);
        ASSERT_TRUE(result.has_value()) << message;
    }

    const auto commits = vcs.commits();
    ASSERT_EQ(commits.size(), futures.size());
    for (std::size_t i = 0; i < commits.size(); ++i) {
        EXPECT_EQ(
                commits[i].message,
                std::format("{}\n\nQueue-Entry: cq-{}", futures[i].first, i + 1));
    }
}

TEST(CommitQueue, RetriesTransientFailures) {
    const pt::TempDir dir{"queue"};
    pt::FakeVersionControl vcs;
    vcs.fail_next(2);
    pe::CommitQueue queue{fast_config(dir), vcs};
    ASSERT_TRUE(queue.start().has_value());

    auto future = queue.enqueue("flaky", {});
    const auto result = get_result(future);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->attempts, 3);
    EXPECT_EQ(vcs.attempts(), 3);
    EXPECT_EQ(vcs.commits().size(), 1);
}

TEST(CommitQueue, ExhaustedAttemptsGoToBoundedFailedList) {
    const pt::TempDir dir{"queue"};
    pt::FakeVersionControl vcs;
    vcs.fail_next(9);
    pe::CommitQueue queue{fast_config(dir), vcs};
    ASSERT_TRUE(queue.start().has_value());

    auto first = queue.enqueue("one", {});
    auto second = queue.enqueue("two", {});
    auto third = queue.enqueue("three", {});
    for (auto *future : {&first, &second, &third}) {
        const auto result = get_result(*future);
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().code, pe::OrchErrc::CommitFailed);
    }
    EXPECT_EQ(vcs.attempts(), 9);

    ASSERT_TRUE(queue.wait_for_drain(1s));
    const auto status = queue.status();
    EXPECT_EQ(status.failed_commits, 3);
    ASSERT_TRUE(status.last_error.has_value());
    EXPECT_NE(status.last_error->find("index.lock"), std::string::npos);

    const auto state = read_state(queue);
    ASSERT_EQ(state.at("failed").size(), 2);
    EXPECT_EQ(state.at("failed")[0].at("id"), 2);
    EXPECT_EQ(state.at("failedCommits"), 3);

    // The queue keeps working after failures
    auto next = queue.enqueue("four", {});
    EXPECT_TRUE(get_result(next).has_value());
}

TEST(CommitQueue, RestartRequeuesPendingEntries) {
    const pt::TempDir dir{"queue"};
    pt::FakeVersionControl vcs;
    pt::write_file_contents(dir.file("commit-queue.json"), R"({
        "entries": [
            {"id": 4, "message": "later", "files": [], "state": "pending"},
            {"id": 3, "message": "earlier", "files": ["x"], "state": "pending"}
        ],
        "nextId": 5,
        "totalCommits": 2,
        "failed": []
    })");

    pe::CommitQueue queue{fast_config(dir), vcs};
    ASSERT_TRUE(queue.start().has_value());
    ASSERT_TRUE(queue.wait_for_drain(5s));

    const auto commits = vcs.commits();
    ASSERT_EQ(commits.size(), 2);
    EXPECT_EQ(commits[0].message, "earlier\n\nQueue-Entry: cq-3");
    EXPECT_EQ(commits[1].message, "later\n\nQueue-Entry: cq-4");
    EXPECT_EQ(queue.status().total_commits, 4);

    auto next = queue.enqueue("new", {});
    const auto result = get_result(next);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->entry_id, "cq-5");
}

TEST(CommitQueue, CommittingEntryFoundByTrailerIsNotRepeated) {
    const pt::TempDir dir{"queue"};
    pt::FakeVersionControl vcs;
    // The previous process committed cq-7 but died before removing the entry
    vcs.add_existing_commit("done before crash\n\nQueue-Entry: cq-7");
    pt::write_file_contents(dir.file("commit-queue.json"), R"({
        "entries": [
            {"id": 7, "message": "done before crash", "state": "committing"},
            {"id": 8, "message": "not started", "state": "pending"}
        ],
        "nextId": 9
    })");

    pe::CommitQueue queue{fast_config(dir), vcs};
    ASSERT_TRUE(queue.start().has_value());
    ASSERT_TRUE(queue.wait_for_drain(5s));

    const auto commits = vcs.commits();
    ASSERT_EQ(commits.size(), 2);
    EXPECT_EQ(commits[1].message, "not started\n\nQueue-Entry: cq-8");
    EXPECT_EQ(queue.status().last_processed_id, 8);
}

TEST(CommitQueue, CommittingEntryWithoutCommitIsRetried) {
    const pt::TempDir dir{"queue"};
    pt::FakeVersionControl vcs;
    pt::write_file_contents(
            dir.file("commit-queue.json"),
            R"({"entries": [{"id": 1, "message": "lost", "state": "committing"}], "nextId": 2})");

    pe::CommitQueue queue{fast_config(dir), vcs};
    ASSERT_TRUE(queue.start().has_value());
    ASSERT_TRUE(queue.wait_for_drain(5s));

    const auto commits = vcs.commits();
    ASSERT_EQ(commits.size(), 1);
    EXPECT_EQ(commits[0].message, "lost\n\nQueue-Entry: cq-1");
}

TEST(CommitQueue, CorruptStateFileFailsStart) {
    const pt::TempDir dir{"queue"};
    pt::FakeVersionControl vcs;
    pt::write_file_contents(dir.file("commit-queue.json"), "{\"entries\": [");

    pe::CommitQueue queue{fast_config(dir), vcs};
    const auto started = queue.start();
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, pe::OrchErrc::CorruptSnapshot);
    EXPECT_FALSE(queue.is_running());
}

TEST(CommitQueue, ClearDropsOrRejectsPendingEntries) {
    const pt::TempDir dir{"queue"};
    pt::FakeVersionControl vcs;
    vcs.set_commit_delay(500ms);
    pe::CommitQueue queue{fast_config(dir), vcs};
    ASSERT_TRUE(queue.start().has_value());

    auto active = queue.enqueue("active", {});
    ASSERT_TRUE(pt::eventually([&queue] { return queue.status().processing; }));
    auto dropped = queue.enqueue("dropped", {});
    EXPECT_EQ(queue.clear(false), 1);

    const auto dropped_result = get_result(dropped);
    ASSERT_TRUE(dropped_result.has_value());
    EXPECT_TRUE(dropped_result->dropped);
    EXPECT_EQ(dropped_result->entry_id, "cq-2");

    auto rejected = queue.enqueue("rejected", {});
    EXPECT_EQ(queue.clear(true), 1);
    const auto rejected_result = get_result(rejected);
    ASSERT_FALSE(rejected_result.has_value());
    EXPECT_EQ(rejected_result.error().code, pe::OrchErrc::QueueStopped);

    // The entry already with the collaborator still finishes
    EXPECT_TRUE(get_result(active).has_value());
    EXPECT_EQ(vcs.commits().size(), 1);
}

TEST(CommitQueue, StopKeepsPendingEntriesForNextStart) {
    const pt::TempDir dir{"queue"};
    pt::FakeVersionControl vcs;
    vcs.set_commit_delay(100ms);
    {
        pe::CommitQueue queue{fast_config(dir), vcs};
        ASSERT_TRUE(queue.start().has_value());
        auto first = queue.enqueue("first", {});
        ASSERT_TRUE(pt::eventually([&queue] { return queue.status().processing; }));
        auto second = queue.enqueue("second", {});
        queue.stop();

        EXPECT_TRUE(get_result(first).has_value());
        const auto second_result = get_result(second);
        ASSERT_FALSE(second_result.has_value());
        EXPECT_EQ(second_result.error().code, pe::OrchErrc::QueueStopped);

        auto after_stop = queue.enqueue("after", {});
        EXPECT_EQ(get_result(after_stop).error().code, pe::OrchErrc::QueueStopped);
    }
    EXPECT_EQ(vcs.commits().size(), 1);

    vcs.set_commit_delay(0ms);
    pe::CommitQueue restarted{fast_config(dir), vcs};
    ASSERT_TRUE(restarted.start().has_value());
    ASSERT_TRUE(restarted.wait_for_drain(5s));
    const auto commits = vcs.commits();
    ASSERT_EQ(commits.size(), 2);
    EXPECT_EQ(commits[1].message, "second\n\nQueue-Entry: cq-2");
}

TEST(CommitQueue, StopInterruptsRetryWait) {
    const pt::TempDir dir{"queue"};
    pt::FakeVersionControl vcs;
    vcs.fail_next(100);
    auto config = fast_config(dir);
    config.retry_delay = 10s;
    pe::CommitQueue queue{config, vcs};
    ASSERT_TRUE(queue.start().has_value());

    auto future = queue.enqueue("stuck", {});
    ASSERT_TRUE(pt::eventually([&vcs] { return vcs.attempts() == 1; }));
    const auto started = std::chrono::steady_clock::now();
    queue.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);

    const auto result = get_result(future);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, pe::OrchErrc::QueueStopped);

    const auto state = read_state(queue);
    ASSERT_EQ(state.at("entries").size(), 1);
    EXPECT_EQ(state.at("entries")[0].at("state"), "pending");
}

TEST(CommitQueue, DirectCommitBypassesQueue) {
    const pt::TempDir dir{"queue"};
    pt::FakeVersionControl vcs;
    pe::CommitQueue queue{fast_config(dir), vcs};

    const auto direct = queue.commit_direct("hotfix", {"a"});
    ASSERT_TRUE(direct.has_value());
    EXPECT_EQ(vcs.commits().at(0).message, "hotfix");
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

} // namespace
