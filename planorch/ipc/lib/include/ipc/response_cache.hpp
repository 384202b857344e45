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
 * @file response_cache.hpp
 * @brief Bounded least-recently-used cache of responses by request id
 */

#ifndef PLANORCH_IPC_RESPONSE_CACHE_HPP
#define PLANORCH_IPC_RESPONSE_CACHE_HPP

#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include <parallel_hashmap/phmap.h>

#include "ipc/protocol.hpp"

namespace planorch::ipc {

/**
 * @class ResponseCache
 * @brief Remembers the response of every recent request id
 *
 * A lookup refreshes the entry; inserting beyond the capacity evicts the
 * least recently used entry. Thread-safe.
 */
class ResponseCache final {
public:
    static constexpr std::size_t DEFAULT_CAPACITY = 1024;

    /**
     * @param[in] capacity Maximum number of entries (at least 1)
     * @throws std::invalid_argument if capacity is zero
     */
    explicit ResponseCache(std::size_t capacity = DEFAULT_CAPACITY);

    /**
     * Find the cached response of a request id and mark it most recent
     */
    [[nodiscard]] std::optional<Response> find(const std::string &id);

    /**
     * Cache a response, replacing any previous entry for the id
     */
    void insert(const std::string &id, Response response);

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    using Entry = std::pair<std::string, Response>;

    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::list<Entry> entries_; //!< Most recent first
    phmap::flat_hash_map<std::string, std::list<Entry>::iterator> index_;
};

} // namespace planorch::ipc

#endif // PLANORCH_IPC_RESPONSE_CACHE_HPP
