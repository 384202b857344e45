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

#include <cstddef>      // for size_t
#include <cstdint>      // for uint64_t
#include <exception>    // for exception
#include <filesystem>   // for path, exists, rename, file_size
#include <format>       // for format
#include <fstream>      // for ifstream, ofstream
#include <iterator>     // for istreambuf_iterator
#include <memory>       // for shared_ptr, make_shared
#include <mutex>        // for lock_guard, unique_lock
#include <optional>     // for optional
#include <string>       // for string, getline
#include <string_view>  // for string_view
#include <system_error> // for error_code
#include <utility>      // for move
#include <vector>       // for vector, erase

#include <nlohmann/json.hpp>
#include <quill/LogMacros.h>

#include "engine/engine_errors.hpp"
#include "engine/engine_log.hpp"
#include "engine/event.hpp"
#include "engine/event_bus.hpp"
#include "engine/time.hpp"
#include "log/planorch_log_macros.hpp"

namespace planorch::engine {

namespace {

constexpr std::string_view LOG_FILE_NAME = "events.jsonl";

std::filesystem::path segment_path(const std::filesystem::path &log_dir, const std::size_t index) {
    if (index == 0) {
        return log_dir / LOG_FILE_NAME;
    }
    return log_dir / std::format("{}.{}", LOG_FILE_NAME, index);
}

/// Number of consecutive archives events.jsonl.1 .. .N present in log_dir
std::size_t count_archives(const std::filesystem::path &log_dir) {
    std::error_code ec;
    std::size_t count = 0;
    while (std::filesystem::exists(segment_path(log_dir, count + 1), ec)) {
        ++count;
    }
    return count;
}

/**
 * Parse one segment, appending to events
 *
 * A torn final line in the active segment is tolerated; anything else
 * unparsable is corruption.
 */
Status read_segment(
        const std::filesystem::path &path, const bool is_active, std::vector<Event> &events) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_error(OrchErrc::IoError, std::format("cannot open '{}'", path.string()));
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) {
            lines.push_back(std::move(line));
        }
    }

    for (std::size_t i = 0; i < lines.size(); ++i) {
        const bool last = i + 1 == lines.size();
        const auto json = nlohmann::json::parse(lines[i], nullptr, false);
        if (json.is_discarded()) {
            if (is_active && last) {
                PLANORCH_LOGC_WARN(
                        EngineLog::EventBus, "Ignoring torn last line of '{}'", path.string());
                break;
            }
            return make_error(
                    OrchErrc::CorruptSnapshot,
                    std::format("'{}' line {} is not valid JSON", path.string(), i + 1));
        }
        auto event = event_from_json(json);
        if (!event) {
            return tl::unexpected(event.error());
        }
        events.push_back(std::move(*event));
    }
    return {};
}

/**
 * Cut a partial final line left by a crash mid-append, so later appends
 * start on a fresh line
 */
void repair_torn_tail(const std::filesystem::path &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return;
    }
    const std::string contents{
            std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    file.close();
    if (contents.empty() || contents.back() == '\n') {
        return;
    }
    const auto last_newline = contents.find_last_of('\n');
    const std::uintmax_t keep = last_newline == std::string::npos ? 0 : last_newline + 1;
    std::error_code ec;
    std::filesystem::resize_file(path, keep, ec);
    if (ec) {
        PLANORCH_LOGC_WARN(
                EngineLog::EventBus,
                "Cannot truncate torn line of '{}': {}",
                path.string(),
                ec.message());
        return;
    }
    PLANORCH_LOGC_WARN(
            EngineLog::EventBus,
            "Dropped {} bytes of a torn last line in '{}'",
            contents.size() - keep,
            path.string());
}

} // namespace

Subscription::Subscription(const std::uint64_t id, EventFilter filter, const std::size_t capacity)
        : id_{id}, filter_{std::move(filter)}, capacity_{capacity} {}

bool Subscription::push(const Event &event) {
    bool evicted = false;
    {
        const std::lock_guard lock{mutex_};
        if (closed_.load(std::memory_order_acquire)) {
            return false;
        }
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            dropped_.fetch_add(1, std::memory_order_relaxed);
            evicted = true;
        }
        queue_.push_back(event);
    }
    cv_.notify_one();
    return evicted;
}

std::optional<Event> Subscription::try_next() {
    const std::lock_guard lock{mutex_};
    if (queue_.empty()) {
        return std::nullopt;
    }
    Event event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::optional<Event> Subscription::wait_next(const Millis timeout) {
    std::unique_lock lock{mutex_};
    cv_.wait_for(lock, timeout, [this] {
        return !queue_.empty() || closed_.load(std::memory_order_acquire);
    });
    if (queue_.empty()) {
        return std::nullopt;
    }
    Event event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::size_t Subscription::size() const {
    const std::lock_guard lock{mutex_};
    return queue_.size();
}

void Subscription::close() {
    {
        const std::lock_guard lock{mutex_};
        closed_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

EventBus::EventBus(EventBusConfig config) : config_{std::move(config)} {
    if (config_.ring_size == 0) {
        log_and_throw(EngineLog::EventBus, "Event bus ring_size must be at least 1");
    }
    if (config_.subscriber_queue_size == 0) {
        log_and_throw(EngineLog::EventBus, "Event bus subscriber_queue_size must be at least 1");
    }
    if (config_.max_log_bytes == 0) {
        log_and_throw(EngineLog::EventBus, "Event bus max_log_bytes must be at least 1");
    }
    if (config_.log_dir.empty()) {
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(config_.log_dir, ec);
    if (ec) {
        log_and_throw(
                EngineLog::EventBus,
                "Cannot create event log directory '{}': {}",
                config_.log_dir.string(),
                ec.message());
    }
    repair_torn_tail(log_path());
    archive_count_ = count_archives(config_.log_dir);
    resume_ids();

    const auto path = log_path();
    log_bytes_ = std::filesystem::exists(path, ec) ? std::filesystem::file_size(path, ec) : 0;
    log_.open(path, std::ios::app);
    if (!log_.is_open()) {
        log_and_throw(EngineLog::EventBus, "Cannot open event log '{}'", path.string());
    }
}

EventBus::~EventBus() {
    const std::lock_guard lock{mutex_};
    for (const auto &subscriber : subscribers_) {
        subscriber->close();
    }
    subscribers_.clear();
}

std::filesystem::path EventBus::log_path() const {
    if (config_.log_dir.empty()) {
        return {};
    }
    return segment_path(config_.log_dir, 0);
}

void EventBus::resume_ids() {
    // Newest first: the active file, then archives from the highest index
    for (std::size_t step = 0; step <= archive_count_; ++step) {
        const std::size_t index = step == 0 ? 0 : archive_count_ + 1 - step;
        const auto path = segment_path(config_.log_dir, index);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            continue;
        }
        std::vector<Event> events;
        if (const auto read = read_segment(path, index == 0, events); !read) {
            PLANORCH_LOGC_WARN(
                    EngineLog::EventBus,
                    "Cannot resume event ids from '{}': {}",
                    path.string(),
                    read.error().to_string());
            continue;
        }
        if (!events.empty()) {
            next_id_ = events.back().id + 1;
            PLANORCH_LOGC_DEBUG(
                    EngineLog::EventBus, "Resuming event ids at {}", next_id_);
            return;
        }
    }
}

void EventBus::rotate_log() {
    log_.close();
    const auto archive = segment_path(config_.log_dir, archive_count_ + 1);
    std::error_code ec;
    std::filesystem::rename(log_path(), archive, ec);
    if (ec) {
        // Keep appending to the active file; retry after another max_log_bytes
        PLANORCH_LOGC_ERROR(
                EngineLog::EventBus,
                "Event log rotation to '{}' failed: {}",
                archive.string(),
                ec.message());
        log_.open(log_path(), std::ios::app);
        log_bytes_ = 0;
        return;
    }
    ++archive_count_;
    log_.open(log_path(), std::ios::app);
    log_bytes_ = 0;
    PLANORCH_LOGC_DEBUG(EngineLog::EventBus, "Archived event log as '{}'", archive.string());
}

void EventBus::append_to_log(const Event &event) {
    if (config_.log_dir.empty()) {
        return;
    }
    const std::string line = event_to_json(event).dump() + "\n";
    if (log_bytes_ > 0 && log_bytes_ + line.size() > config_.max_log_bytes) {
        rotate_log();
    }
    log_ << line;
    log_.flush();
    if (!log_.good()) {
        PLANORCH_LOGC_ERROR(
                EngineLog::EventBus,
                "Failed to append event {} to '{}'",
                event.id,
                log_path().string());
        log_.clear();
        return;
    }
    log_bytes_ += line.size();
}

Event EventBus::emit(const EventType type, nlohmann::json payload) {
    const std::lock_guard lock{mutex_};
    Event event{
            .id = next_id_++,
            .type = type,
            .timestamp = Time::now_iso8601(),
            .payload = std::move(payload)};

    append_to_log(event);

    ring_.push_back(event);
    while (ring_.size() > config_.ring_size) {
        ring_.pop_front();
    }

    for (const auto &subscriber : subscribers_) {
        if (!event.matches(subscriber->filter())) {
            continue;
        }
        if (subscriber->push(event)) {
            PLANORCH_LOGC_WARN(
                    EngineLog::EventBus,
                    "Subscriber {} is slow, dropped oldest event ({} dropped so far)",
                    subscriber->id(),
                    subscriber->dropped());
        }
    }
    PLANORCH_LOGC_TRACE_L1(EngineLog::EventBus, "Emitted event {} {}", event.id, to_wire(type));
    return event;
}

std::shared_ptr<Subscription>
EventBus::subscribe(EventFilter filter, const std::optional<std::uint64_t> replay_since_id) {
    const std::lock_guard lock{mutex_};
    auto subscription = std::make_shared<Subscription>(
            next_subscriber_id_++, std::move(filter), config_.subscriber_queue_size);

    if (replay_since_id.has_value()) {
        const bool ring_covers = ring_.empty() || ring_.front().id <= *replay_since_id + 1;
        std::vector<Event> history;
        if (!ring_covers && !config_.log_dir.empty()) {
            auto logged = read_log(config_.log_dir);
            if (logged) {
                history = std::move(*logged);
            } else {
                PLANORCH_LOGC_WARN(
                        EngineLog::EventBus,
                        "Replay from the durable log failed, using the ring buffer: {}",
                        logged.error().to_string());
            }
        }
        if (history.empty()) {
            history.assign(ring_.begin(), ring_.end());
        }
        for (const auto &event : history) {
            if (event.id > *replay_since_id && event.matches(subscription->filter())) {
                subscription->push(event);
            }
        }
    }

    subscribers_.push_back(subscription);
    return subscription;
}

void EventBus::unsubscribe(const std::shared_ptr<Subscription> &subscription) {
    if (!subscription) {
        return;
    }
    {
        const std::lock_guard lock{mutex_};
        std::erase(subscribers_, subscription);
    }
    subscription->close();
}

std::vector<Event> EventBus::recent(const std::uint64_t since_id, const std::size_t limit) const {
    const std::lock_guard lock{mutex_};
    std::vector<Event> events;
    for (const auto &event : ring_) {
        if (events.size() >= limit) {
            break;
        }
        if (event.id > since_id) {
            events.push_back(event);
        }
    }
    return events;
}

Result<std::vector<Event>> EventBus::read_log() const {
    if (config_.log_dir.empty()) {
        return std::vector<Event>{};
    }
    // Appends are flushed per line, so the files are current
    return read_log(config_.log_dir);
}

Result<std::vector<Event>> EventBus::read_log(const std::filesystem::path &log_dir) {
    std::vector<Event> events;
    // Archives oldest first, then the active file
    const std::size_t archives = count_archives(log_dir);
    for (std::size_t index = 1; index <= archives; ++index) {
        const auto read = read_segment(segment_path(log_dir, index), false, events);
        if (!read) {
            return tl::unexpected(read.error());
        }
    }
    std::error_code ec;
    const auto active = segment_path(log_dir, 0);
    if (std::filesystem::exists(active, ec)) {
        if (const auto read = read_segment(active, true, events); !read) {
            return tl::unexpected(read.error());
        }
    }
    return events;
}

std::uint64_t EventBus::last_id() const {
    const std::lock_guard lock{mutex_};
    return next_id_ - 1;
}

std::size_t EventBus::subscriber_count() const {
    const std::lock_guard lock{mutex_};
    return subscribers_.size();
}

} // namespace planorch::engine
