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
 * @file worker_pool.hpp
 * @brief Growable pool of threads executing task dispatches
 */

#ifndef PLANORCH_ENGINE_WORKER_POOL_HPP
#define PLANORCH_ENGINE_WORKER_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace planorch::engine {

/**
 * Fixed-upper-bound thread pool
 *
 * Threads are created on demand by ensure_threads() and never shrink, so a
 * runtime batch size increase adds workers while a decrease simply leaves
 * some idle. Jobs run in submission order on the first free worker.
 * Destruction finishes queued jobs, then joins.
 */
class WorkerPool final {
public:
    static constexpr std::size_t MAX_THREADS = 64; //!< Hard bound on worker threads

    using Job = std::function<void()>;

    WorkerPool() = default;
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;
    WorkerPool(WorkerPool &&) = delete;
    WorkerPool &operator=(WorkerPool &&) = delete;

    /**
     * Grow the pool to at least count threads (capped at MAX_THREADS)
     *
     * @param[in] count Desired number of threads
     */
    void ensure_threads(std::size_t count);

    /**
     * Queue a job
     *
     * @param[in] job Work to run on a pool thread
     */
    void submit(Job job);

    [[nodiscard]] std::size_t thread_count() const;

    /**
     * Jobs queued or running
     */
    [[nodiscard]] std::size_t busy_count() const;

private:
    void worker_loop();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Job> jobs_;
    std::vector<std::thread> threads_;
    std::size_t running_jobs_{};
    bool stopping_{};
};

} // namespace planorch::engine

#endif // PLANORCH_ENGINE_WORKER_POOL_HPP
