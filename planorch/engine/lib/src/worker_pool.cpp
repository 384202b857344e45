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

#include <algorithm> // for min
#include <cstddef>   // for size_t
#include <exception> // for exception
#include <mutex>     // for lock_guard, unique_lock
#include <thread>    // for thread
#include <utility>   // for move

#include <quill/LogMacros.h>

#include "engine/engine_log.hpp"
#include "engine/worker_pool.hpp"
#include "log/planorch_log_macros.hpp"

namespace planorch::engine {

WorkerPool::~WorkerPool() {
    {
        const std::lock_guard lock{mutex_};
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto &thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void WorkerPool::ensure_threads(const std::size_t count) {
    const std::lock_guard lock{mutex_};
    const auto target = std::min(count, MAX_THREADS);
    while (threads_.size() < target) {
        threads_.emplace_back([this] { worker_loop(); });
    }
    PLANORCH_LOGC_TRACE_L1(EngineLog::Orchestrator, "Worker pool has {} threads", threads_.size());
}

void WorkerPool::submit(Job job) {
    {
        const std::lock_guard lock{mutex_};
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
}

std::size_t WorkerPool::thread_count() const {
    const std::lock_guard lock{mutex_};
    return threads_.size();
}

std::size_t WorkerPool::busy_count() const {
    const std::lock_guard lock{mutex_};
    return jobs_.size() + running_jobs_;
}

void WorkerPool::worker_loop() {
    std::unique_lock lock{mutex_};
    while (true) {
        cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
        if (jobs_.empty()) {
            return; // stopping and drained
        }
        Job job = std::move(jobs_.front());
        jobs_.pop_front();
        ++running_jobs_;
        lock.unlock();

        try {
            job();
        } catch (const std::exception &e) {
            PLANORCH_LOGC_ERROR(EngineLog::Orchestrator, "Worker job threw: {}", e.what());
        }

        lock.lock();
        --running_jobs_;
    }
}

} // namespace planorch::engine
