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

#include <algorithm>  // for max, sort
#include <chrono>     // for milliseconds
#include <cstddef>    // for size_t
#include <cstdint>    // for uint64_t, uint32_t
#include <deque>      // for deque
#include <exception>  // for exception
#include <filesystem> // for path, exists
#include <format>     // for format
#include <future>     // for promise, future
#include <map>        // for map
#include <mutex>      // for unique_lock, lock_guard
#include <optional>   // for optional
#include <stdexcept>  // for invalid_argument
#include <string>     // for string
#include <system_error> // for error_code
#include <utility>    // for move
#include <vector>     // for vector

#include <nlohmann/json.hpp>
#include <quill/LogMacros.h>

#include "engine/commit_queue.hpp"
#include "engine/engine_errors.hpp"
#include "engine/engine_log.hpp"
#include "engine/file_io.hpp"
#include "engine/time.hpp"
#include "log/planorch_log_macros.hpp"

namespace planorch::engine {

namespace {

std::string_view state_to_wire(const CommitEntryState state) noexcept {
    return state == CommitEntryState::Committing ? "committing" : "pending";
}

std::optional<CommitEntryState> state_from_wire(const std::string_view name) noexcept {
    if (name == "pending") {
        return CommitEntryState::Pending;
    }
    if (name == "committing") {
        return CommitEntryState::Committing;
    }
    return std::nullopt;
}

nlohmann::json entry_to_json(const CommitEntry &entry) {
    return nlohmann::json{
            {"id", entry.id},
            {"message", entry.message},
            {"files", entry.files},
            {"state", state_to_wire(entry.state)},
            {"enqueuedAt", entry.enqueued_at}};
}

CommitEntry entry_from_json(const nlohmann::json &json) {
    CommitEntry entry{};
    entry.id = json.at("id").get<std::uint64_t>();
    entry.message = json.at("message").get<std::string>();
    entry.files = json.value("files", std::vector<std::string>{});
    const auto state = state_from_wire(json.value("state", std::string{"pending"}));
    if (!state.has_value()) {
        throw std::invalid_argument(std::format("entry {} has an unknown state", entry.id));
    }
    entry.state = *state;
    entry.enqueued_at = json.value("enqueuedAt", std::string{});
    return entry;
}

} // namespace

std::string CommitEntry::entry_id() const { return std::format("cq-{}", id); }

std::string CommitEntry::message_with_trailer() const {
    return std::format("{}\n\nQueue-Entry: {}", message, entry_id());
}

CommitQueue::CommitQueue(CommitQueueConfig config, IVersionControl &vcs)
        : config_{std::move(config)}, vcs_{vcs} {
    if (config_.state_dir.empty()) {
        log_and_throw(EngineLog::CommitQueue, "Commit queue state_dir must not be empty");
    }
    if (config_.max_attempts == 0) {
        log_and_throw(EngineLog::CommitQueue, "Commit queue max_attempts must be at least 1");
    }
    if (config_.retry_delay.count() < 0) {
        log_and_throw(EngineLog::CommitQueue, "Commit queue retry_delay must not be negative");
    }
}

CommitQueue::~CommitQueue() { stop(); }

std::filesystem::path CommitQueue::state_path() const {
    return config_.state_dir / CommitQueueConfig::STATE_FILE_NAME;
}

Status CommitQueue::load_state() {
    const auto path = state_path();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return {};
    }
    auto text = read_file(path);
    if (!text) {
        return tl::unexpected(text.error());
    }

    try {
        const auto json = nlohmann::json::parse(*text);
        std::vector<CommitEntry> entries;
        for (const auto &item : json.at("entries")) {
            entries.push_back(entry_from_json(item));
        }
        std::sort(entries.begin(), entries.end(), [](const auto &lhs, const auto &rhs) {
            return lhs.id < rhs.id;
        });

        const std::lock_guard lock{mutex_};
        queue_.assign(entries.begin(), entries.end());
        next_id_ = json.value("nextId", std::uint64_t{1});
        for (const auto &entry : queue_) {
            next_id_ = std::max(next_id_, entry.id + 1);
        }
        if (const auto it = json.find("lastProcessedId"); it != json.end() && !it->is_null()) {
            last_processed_id_ = it->get<std::uint64_t>();
        }
        total_commits_ = json.value("totalCommits", std::uint64_t{0});
        failed_commits_ = json.value("failedCommits", std::uint64_t{0});
        if (const auto it = json.find("lastError"); it != json.end() && it->is_string()) {
            last_error_ = it->get<std::string>();
        }
        failed_.clear();
        for (const auto &item : json.value("failed", nlohmann::json::array())) {
            failed_.push_back(FailedCommit{
                    .id = item.at("id").get<std::uint64_t>(),
                    .message = item.value("message", std::string{}),
                    .error = item.value("error", std::string{}),
                    .failed_at = item.value("failedAt", std::string{})});
        }
    } catch (const std::exception &e) {
        return make_error(
                OrchErrc::CorruptSnapshot,
                std::format("commit queue state '{}': {}", path.string(), e.what()));
    }
    return {};
}

void CommitQueue::persist_locked() {
    nlohmann::json entries = nlohmann::json::array();
    if (active_.has_value()) {
        entries.push_back(entry_to_json(*active_));
    }
    for (const auto &entry : queue_) {
        entries.push_back(entry_to_json(entry));
    }
    nlohmann::json failed = nlohmann::json::array();
    for (const auto &item : failed_) {
        failed.push_back(
                {{"id", item.id},
                 {"message", item.message},
                 {"error", item.error},
                 {"failedAt", item.failed_at}});
    }

    nlohmann::json doc{
            {"entries", std::move(entries)},
            {"lastProcessedId", nullptr},
            {"nextId", next_id_},
            {"failed", std::move(failed)},
            {"totalCommits", total_commits_},
            {"failedCommits", failed_commits_},
            {"isProcessing", active_.has_value()},
            {"updatedAt", Time::now_iso8601()}};
    if (last_processed_id_.has_value()) {
        doc["lastProcessedId"] = *last_processed_id_;
    }
    if (last_error_.has_value()) {
        doc["lastError"] = *last_error_;
    }

    std::error_code ec;
    std::filesystem::create_directories(config_.state_dir, ec);
    if (const auto written = write_file_atomic(state_path(), doc.dump(2)); !written) {
        PLANORCH_LOGC_ERROR(
                EngineLog::CommitQueue,
                "Failed to persist commit queue state: {}",
                written.error().to_string());
    }
}

Status CommitQueue::start() {
    if (running_.load(std::memory_order_acquire)) {
        return make_error(OrchErrc::AlreadyRunning, "commit queue already started");
    }
    if (const auto loaded = load_state(); !loaded) {
        return loaded;
    }

    // Resolve entries whose outcome was unknown when the previous process died
    std::deque<CommitEntry> recovered;
    std::deque<CommitEntry> loaded_entries;
    {
        const std::lock_guard lock{mutex_};
        loaded_entries.swap(queue_);
    }
    for (auto &entry : loaded_entries) {
        if (entry.state == CommitEntryState::Committing) {
            const auto found = vcs_.find_commit(entry.entry_id());
            if (found && found->has_value()) {
                PLANORCH_LOGC_INFO(
                        EngineLog::CommitQueue,
                        "Entry {} already committed as {}, dropping",
                        entry.entry_id(),
                        **found);
                const std::lock_guard lock{mutex_};
                last_processed_id_ = entry.id;
                ++total_commits_;
                continue;
            }
            if (!found) {
                PLANORCH_LOGC_WARN(
                        EngineLog::CommitQueue,
                        "Lookup of entry {} failed ({}), committing again",
                        entry.entry_id(),
                        found.error().to_string());
            }
            entry.state = CommitEntryState::Pending;
        }
        recovered.push_back(std::move(entry));
    }

    {
        const std::lock_guard lock{mutex_};
        for (auto &entry : recovered) {
            queue_.push_back(std::move(entry));
        }
        if (!queue_.empty()) {
            PLANORCH_LOGC_INFO(
                    EngineLog::CommitQueue, "Recovered {} pending commit(s)", queue_.size());
        }
        persist_locked();
    }

    stop_flag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);
    worker_ = std::thread([this] { worker_loop(); });
    PLANORCH_LOGC_DEBUG(EngineLog::CommitQueue, "Commit queue started");
    return {};
}

CommitQueue::Future CommitQueue::enqueue(std::string message, std::vector<std::string> files) {
    std::promise<Result<CommitResult>> promise;
    auto future = promise.get_future();

    const std::lock_guard lock{mutex_};
    if (!running_.load(std::memory_order_acquire) || stop_flag_.load(std::memory_order_acquire)) {
        promise.set_value(make_error(OrchErrc::QueueStopped, "commit queue is not running"));
        return future;
    }

    CommitEntry entry{
            .id = next_id_++,
            .message = std::move(message),
            .files = std::move(files),
            .state = CommitEntryState::Pending,
            .enqueued_at = Time::now_iso8601()};
    PLANORCH_LOGC_DEBUG(EngineLog::CommitQueue, "Queued commit {}", entry.entry_id());
    promises_.emplace(entry.id, std::move(promise));
    queue_.push_back(std::move(entry));
    persist_locked();
    cv_.notify_one();
    return future;
}

Result<std::string>
CommitQueue::commit_direct(const std::string &message, const std::vector<std::string> &files) {
    PLANORCH_LOGC_WARN(
            EngineLog::CommitQueue,
            "Direct commit bypasses the queue and may race with queued commits");
    return vcs_.commit(message, files);
}

Result<CommitResult> CommitQueue::process_entry(const CommitEntry &entry) {
    Error last_error{};
    for (std::uint32_t attempt = 1; attempt <= config_.max_attempts; ++attempt) {
        auto committed = vcs_.commit(entry.message_with_trailer(), entry.files);
        if (committed) {
            return CommitResult{
                    .entry_id = entry.entry_id(),
                    .commit_id = std::move(*committed),
                    .attempts = attempt,
                    .dropped = false};
        }
        last_error = committed.error();
        PLANORCH_LOGC_WARN(
                EngineLog::CommitQueue,
                "Commit {} attempt {}/{} failed: {}",
                entry.entry_id(),
                attempt,
                config_.max_attempts,
                last_error.message);

        if (attempt == config_.max_attempts) {
            break;
        }
        std::unique_lock lock{mutex_};
        const bool stopping = cv_.wait_for(lock, config_.retry_delay, [this] {
            return stop_flag_.load(std::memory_order_acquire);
        });
        if (stopping) {
            return make_error(
                    OrchErrc::QueueStopped,
                    std::format("commit {} interrupted by stop", entry.entry_id()));
        }
    }
    return make_error(
            OrchErrc::CommitFailed,
            std::format(
                    "commit {} failed after {} attempt(s): {}",
                    entry.entry_id(),
                    config_.max_attempts,
                    last_error.message));
}

void CommitQueue::resolve(const std::uint64_t id, Result<CommitResult> result) {
    std::optional<std::promise<Result<CommitResult>>> promise;
    {
        const std::lock_guard lock{mutex_};
        if (const auto it = promises_.find(id); it != promises_.end()) {
            promise = std::move(it->second);
            promises_.erase(it);
        }
    }
    if (promise.has_value()) {
        promise->set_value(std::move(result));
    }
}

void CommitQueue::worker_loop() {
    while (true) {
        std::unique_lock lock{mutex_};
        cv_.wait(lock, [this] {
            return stop_flag_.load(std::memory_order_acquire) || !queue_.empty();
        });
        if (stop_flag_.load(std::memory_order_acquire)) {
            break;
        }

        active_ = std::move(queue_.front());
        queue_.pop_front();
        active_->state = CommitEntryState::Committing;
        persist_locked();
        const CommitEntry entry = *active_;
        lock.unlock();

        auto result = process_entry(entry);

        lock.lock();
        if (result) {
            last_processed_id_ = entry.id;
            ++total_commits_;
            PLANORCH_LOGC_INFO(
                    EngineLog::CommitQueue,
                    "Committed {} as {}",
                    entry.entry_id(),
                    result->commit_id);
        } else if (result.error().is(OrchErrc::QueueStopped)) {
            // Keep it persisted for the next start()
            active_->state = CommitEntryState::Pending;
            queue_.push_front(std::move(*active_));
        } else {
            ++failed_commits_;
            last_error_ = result.error().message;
            failed_.push_back(FailedCommit{
                    .id = entry.id,
                    .message = entry.message,
                    .error = result.error().message,
                    .failed_at = Time::now_iso8601()});
            if (failed_.size() > config_.max_failed_entries) {
                failed_.erase(
                        failed_.begin(),
                        failed_.begin() +
                                static_cast<std::ptrdiff_t>(
                                        failed_.size() - config_.max_failed_entries));
            }
            PLANORCH_LOGC_ERROR(EngineLog::CommitQueue, "{}", result.error().message);
        }
        active_.reset();
        persist_locked();
        lock.unlock();

        resolve(entry.id, std::move(result));
        drained_cv_.notify_all();
    }
}

CommitQueueStatus CommitQueue::status() const {
    const std::lock_guard lock{mutex_};
    return CommitQueueStatus{
            .pending_count = queue_.size(),
            .processing = active_.has_value(),
            .last_processed_id = last_processed_id_,
            .total_commits = total_commits_,
            .failed_commits = failed_commits_,
            .last_error = last_error_};
}

bool CommitQueue::wait_for_drain(const Millis timeout) const {
    std::unique_lock lock{mutex_};
    return drained_cv_.wait_for(lock, timeout, [this] {
        return queue_.empty() && !active_.has_value();
    });
}

std::size_t CommitQueue::clear(const bool reject_pending) {
    std::vector<std::pair<CommitEntry, std::optional<std::promise<Result<CommitResult>>>>> removed;
    {
        const std::lock_guard lock{mutex_};
        for (auto &entry : queue_) {
            std::optional<std::promise<Result<CommitResult>>> promise;
            if (const auto it = promises_.find(entry.id); it != promises_.end()) {
                promise = std::move(it->second);
                promises_.erase(it);
            }
            removed.emplace_back(std::move(entry), std::move(promise));
        }
        queue_.clear();
        persist_locked();
    }

    for (auto &[entry, promise] : removed) {
        if (!promise.has_value()) {
            continue;
        }
        if (reject_pending) {
            promise->set_value(make_error(
                    OrchErrc::QueueStopped, std::format("commit {} cleared", entry.entry_id())));
        } else {
            promise->set_value(CommitResult{
                    .entry_id = entry.entry_id(), .commit_id = {}, .attempts = 0, .dropped = true});
        }
    }
    drained_cv_.notify_all();
    PLANORCH_LOGC_INFO(EngineLog::CommitQueue, "Cleared {} pending commit(s)", removed.size());
    return removed.size();
}

void CommitQueue::stop() {
    {
        const std::lock_guard lock{mutex_};
        stop_flag_.store(true, std::memory_order_release);
        cv_.notify_all();
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }

    std::map<std::uint64_t, std::promise<Result<CommitResult>>> abandoned;
    {
        const std::lock_guard lock{mutex_};
        abandoned.swap(promises_);
        persist_locked();
    }
    for (auto &[id, promise] : abandoned) {
        promise.set_value(make_error(
                OrchErrc::QueueStopped, std::format("commit cq-{} left pending at stop", id)));
    }
    drained_cv_.notify_all();
    PLANORCH_LOGC_DEBUG(EngineLog::CommitQueue, "Commit queue stopped");
}

} // namespace planorch::engine
