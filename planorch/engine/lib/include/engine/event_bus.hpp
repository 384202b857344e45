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
 * @file event_bus.hpp
 * @brief In-process publish/subscribe with a durable JSON-lines log
 */

#ifndef PLANORCH_ENGINE_EVENT_BUS_HPP
#define PLANORCH_ENGINE_EVENT_BUS_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

#include "engine/engine_errors.hpp"
#include "engine/event.hpp"
#include "engine/time.hpp"

namespace planorch::engine {

/**
 * Event bus configuration
 */
struct EventBusConfig final {
    static constexpr std::size_t DEFAULT_RING_SIZE = 1000;
    static constexpr std::size_t DEFAULT_SUBSCRIBER_QUEUE_SIZE = 256;
    static constexpr std::uint64_t DEFAULT_MAX_LOG_BYTES = 10ULL * 1024 * 1024;

    std::filesystem::path log_dir; //!< Directory of events.jsonl; empty disables the durable log
    std::size_t ring_size{DEFAULT_RING_SIZE};                         //!< Recent events in memory
    std::size_t subscriber_queue_size{DEFAULT_SUBSCRIBER_QUEUE_SIZE}; //!< Per-subscriber bound
    std::uint64_t max_log_bytes{DEFAULT_MAX_LOG_BYTES};               //!< Rotation threshold
};

/**
 * Bounded event queue owned by one subscriber
 *
 * The bus pushes without blocking: when the queue is full the oldest event
 * is discarded and counted.
 */
class Subscription final {
public:
    Subscription(std::uint64_t id, EventFilter filter, std::size_t capacity);

    /**
     * Pop the next event without waiting
     */
    [[nodiscard]] std::optional<Event> try_next();

    /**
     * Pop the next event, waiting up to timeout
     *
     * @param[in] timeout Maximum wait
     * @return Event, or std::nullopt on timeout or after close
     */
    [[nodiscard]] std::optional<Event> wait_next(Millis timeout);

    [[nodiscard]] std::uint64_t id() const noexcept { return id_; }
    [[nodiscard]] const EventFilter &filter() const noexcept { return filter_; }
    [[nodiscard]] std::uint64_t dropped() const noexcept {
        return dropped_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] bool is_closed() const noexcept {
        return closed_.load(std::memory_order_acquire);
    }
    [[nodiscard]] std::size_t size() const;

private:
    friend class EventBus;

    /**
     * Enqueue an event, evicting the oldest when full
     *
     * @return true if an event was evicted
     */
    bool push(const Event &event);

    void close();

    std::uint64_t id_;
    EventFilter filter_;
    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> queue_;
    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<bool> closed_{false};
};

/**
 * Event bus for one plan
 *
 * emit() assigns the next id, appends the event to
 * "<log_dir>/events.jsonl", keeps it in a ring buffer and fans it out to
 * matching subscribers. When the active file exceeds max_log_bytes it is
 * archived as events.jsonl.N, N counting up from 1; archives are never
 * removed, so the log holds every event emitted. Ids continue from the last
 * event in the durable log. Emission never blocks on subscribers.
 *
 * Thread-safe.
 */
class EventBus final {
public:
    /**
     * Create a bus, resuming ids from an existing log
     *
     * @param[in] config Bus configuration
     * @throws std::invalid_argument if a size bound is zero
     */
    explicit EventBus(EventBusConfig config);

    ~EventBus();

    EventBus(const EventBus &) = delete;
    EventBus &operator=(const EventBus &) = delete;
    EventBus(EventBus &&) = delete;
    EventBus &operator=(EventBus &&) = delete;

    /**
     * Publish an event
     *
     * A failure to append to the durable log is logged; the event is still
     * delivered.
     *
     * @param[in] type Event type
     * @param[in] payload Type specific payload
     * @return Emitted event with its id and timestamp
     */
    Event emit(EventType type, nlohmann::json payload);

    /**
     * Register a subscriber
     *
     * @param[in] filter Types to receive; empty receives all
     * @param[in] replay_since_id When set, events with id greater than this are queued first
     * @return Subscription handle
     */
    [[nodiscard]] std::shared_ptr<Subscription>
    subscribe(EventFilter filter = {}, std::optional<std::uint64_t> replay_since_id = std::nullopt);

    /**
     * Remove a subscriber and wake any waiter on it
     */
    void unsubscribe(const std::shared_ptr<Subscription> &subscription);

    /**
     * Events from the ring buffer
     *
     * @param[in] since_id Return events with id greater than this
     * @param[in] limit Maximum number of events (oldest first)
     * @return Matching events in id order
     */
    [[nodiscard]] std::vector<Event> recent(std::uint64_t since_id, std::size_t limit) const;

    /**
     * Read every event in the durable log, oldest first
     *
     * @return Events, or CorruptSnapshot on an unparsable line, IoError
     */
    [[nodiscard]] Result<std::vector<Event>> read_log() const;

    [[nodiscard]] std::uint64_t last_id() const;
    [[nodiscard]] std::size_t subscriber_count() const;

    /**
     * Active log file path, empty when the durable log is disabled
     */
    [[nodiscard]] std::filesystem::path log_path() const;

    /**
     * Read the durable log of a directory
     *
     * @param[in] log_dir Directory holding events.jsonl and its archives
     * @return Events oldest first, or CorruptSnapshot, IoError
     */
    [[nodiscard]] static Result<std::vector<Event>> read_log(const std::filesystem::path &log_dir);

private:
    void append_to_log(const Event &event);
    void rotate_log();
    void resume_ids();

    EventBusConfig config_;
    mutable std::mutex mutex_;
    std::uint64_t next_id_{1};
    std::deque<Event> ring_;
    std::vector<std::shared_ptr<Subscription>> subscribers_;
    std::uint64_t next_subscriber_id_{1};
    std::ofstream log_;
    std::uint64_t log_bytes_{};
    std::size_t archive_count_{}; //!< Highest archive index present
};

} // namespace planorch::engine

#endif // PLANORCH_ENGINE_EVENT_BUS_HPP
