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
 * @file commit_queue.hpp
 * @brief Serial, crash-recoverable queue of version control commits
 */

#ifndef PLANORCH_ENGINE_COMMIT_QUEUE_HPP
#define PLANORCH_ENGINE_COMMIT_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <wise_enum.h>

#include "engine/engine_errors.hpp"
#include "engine/iversion_control.hpp"
#include "engine/time.hpp"

namespace planorch::engine {

/**
 * Persisted state of a queue entry
 */
enum class CommitEntryState : std::uint8_t {
    Pending,   //!< Waiting for the worker
    Committing //!< Handed to the collaborator; outcome unknown until removed
};

} // namespace planorch::engine

WISE_ENUM_ADAPT(planorch::engine::CommitEntryState, Pending, Committing)

namespace planorch::engine {

/**
 * Commit queue configuration
 */
struct CommitQueueConfig final {
    static constexpr std::uint32_t DEFAULT_MAX_ATTEMPTS = 3;
    static constexpr Millis DEFAULT_RETRY_DELAY{1000};
    static constexpr std::size_t DEFAULT_MAX_FAILED_ENTRIES = 50;
    static constexpr std::string_view STATE_FILE_NAME = "commit-queue.json";

    std::filesystem::path state_dir;                            //!< Holds commit-queue.json
    std::uint32_t max_attempts{DEFAULT_MAX_ATTEMPTS};             //!< Collaborator calls per entry
    Millis retry_delay{DEFAULT_RETRY_DELAY};                      //!< Pause between attempts
    std::size_t max_failed_entries{DEFAULT_MAX_FAILED_ENTRIES};   //!< Bound of the failed list
};

/**
 * One queued commit
 */
struct CommitEntry final {
    std::uint64_t id{};                               //!< Monotonic entry number
    std::string message;                              //!< Commit message without trailer
    std::vector<std::string> files;                   //!< Paths to stage; empty stages everything
    CommitEntryState state{CommitEntryState::Pending}; //!< Persisted progress marker
    std::string enqueued_at;                          //!< ISO-8601 UTC

    /**
     * Identifier carried in the commit message trailer
     *
     * @return "cq-<id>"
     */
    [[nodiscard]] std::string entry_id() const;

    /**
     * Message handed to the collaborator: message plus "Queue-Entry: <entry_id>"
     */
    [[nodiscard]] std::string message_with_trailer() const;
};

/**
 * Entry that exhausted its attempts
 */
struct FailedCommit final {
    std::uint64_t id{};
    std::string message;
    std::string error;
    std::string failed_at;
};

/**
 * Outcome delivered through the enqueue() future
 */
struct CommitResult final {
    std::string entry_id;    //!< "cq-<id>"
    std::string commit_id;   //!< Collaborator commit identifier; empty when dropped
    std::uint32_t attempts{}; //!< Collaborator calls made
    bool dropped{};          //!< Entry was removed by clear() without rejection
};

/**
 * Snapshot of queue progress
 */
struct CommitQueueStatus final {
    std::size_t pending_count{};                  //!< Entries waiting, excluding the active one
    bool processing{};                            //!< An entry is with the collaborator
    std::optional<std::uint64_t> last_processed_id; //!< Last entry committed
    std::uint64_t total_commits{};                //!< Successful commits since the file was created
    std::uint64_t failed_commits{};               //!< Entries that exhausted their attempts
    std::optional<std::string> last_error;        //!< Most recent collaborator error
};

/**
 * Serial commit queue with a single worker thread
 *
 * Entries are committed one at a time in FIFO order so concurrent task
 * completions never race on the working tree. The queue state lives in
 * "<state_dir>/commit-queue.json" and is replaced atomically on every change.
 * An entry is persisted as Committing before the collaborator call and removed
 * only after the call succeeds, so a restart either finds the commit through
 * its "Queue-Entry" trailer or commits it again.
 *
 * Thread-safe.
 */
class CommitQueue final {
public:
    using Future = std::future<Result<CommitResult>>;

    /**
     * Create a stopped queue
     *
     * @param[in] config Queue configuration
     * @param[in] vcs Version control collaborator; must outlive the queue
     * @throws std::invalid_argument if state_dir is empty or max_attempts is zero
     */
    CommitQueue(CommitQueueConfig config, IVersionControl &vcs);

    /**
     * Stops the worker
     */
    ~CommitQueue();

    CommitQueue(const CommitQueue &) = delete;
    CommitQueue &operator=(const CommitQueue &) = delete;
    CommitQueue(CommitQueue &&) = delete;
    CommitQueue &operator=(CommitQueue &&) = delete;

    /**
     * Recover persisted entries and start the worker
     *
     * Pending entries are requeued in id order. A Committing entry is looked
     * up with IVersionControl::find_commit() and dropped as done when found,
     * else requeued.
     *
     * @return Empty on success, AlreadyRunning, CorruptSnapshot if the state
     *         file is unreadable, IoError
     */
    [[nodiscard]] Status start();

    /**
     * Queue a commit
     *
     * @param[in] message Commit message
     * @param[in] files Paths to stage
     * @return Future resolved with the commit, CommitFailed after the last
     *         attempt, or QueueStopped if the queue is stopped or cleared
     */
    [[nodiscard]] Future enqueue(std::string message, std::vector<std::string> files);

    /**
     * Commit immediately on the calling thread, bypassing the queue
     *
     * Unsafe against concurrent queued commits; logged as such.
     *
     * @param[in] message Commit message
     * @param[in] files Paths to stage
     * @return Commit identifier, or CommitFailed
     */
    [[nodiscard]] Result<std::string>
    commit_direct(const std::string &message, const std::vector<std::string> &files);

    [[nodiscard]] CommitQueueStatus status() const;

    /**
     * Block until no entry is pending or processing
     *
     * @param[in] timeout Maximum wait
     * @return true if drained, false on timeout
     */
    [[nodiscard]] bool wait_for_drain(Millis timeout) const;

    /**
     * Remove all pending entries (the active entry is left to finish)
     *
     * @param[in] reject_pending Resolve waiting futures with QueueStopped;
     *            otherwise they resolve with CommitResult::dropped set
     * @return Number of entries removed
     */
    std::size_t clear(bool reject_pending);

    /**
     * Finish the active entry and stop the worker
     *
     * Entries still pending stay persisted for the next start(); their
     * futures resolve with QueueStopped.
     */
    void stop();

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::filesystem::path state_path() const;

private:
    void worker_loop();

    /**
     * Call the collaborator with retries
     *
     * @return Commit identifier and attempts, or the last error; QueueStopped
     *         when interrupted by stop()
     */
    [[nodiscard]] Result<CommitResult> process_entry(const CommitEntry &entry);

    /**
     * Write the current state; caller holds mutex_
     */
    void persist_locked();

    void resolve(std::uint64_t id, Result<CommitResult> result);

    [[nodiscard]] Status load_state();

    CommitQueueConfig config_;
    IVersionControl &vcs_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;         //!< Signals new entries and stop
    mutable std::condition_variable drained_cv_; //!< Signals progress to wait_for_drain()
    std::deque<CommitEntry> queue_;
    std::optional<CommitEntry> active_;
    std::map<std::uint64_t, std::promise<Result<CommitResult>>> promises_;
    std::vector<FailedCommit> failed_;
    std::uint64_t next_id_{1};
    std::optional<std::uint64_t> last_processed_id_;
    std::uint64_t total_commits_{};
    std::uint64_t failed_commits_{};
    std::optional<std::string> last_error_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_flag_{false};
    std::thread worker_;
};

} // namespace planorch::engine

#endif // PLANORCH_ENGINE_COMMIT_QUEUE_HPP
