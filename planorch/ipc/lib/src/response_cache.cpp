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
 * @file response_cache.cpp
 * @brief Bounded least-recently-used cache of responses
 */

#include <cstddef>  // for size_t
#include <mutex>    // for lock_guard
#include <optional> // for optional, nullopt
#include <string>   // for string
#include <utility>  // for move

#include "ipc/ipc_log.hpp"
#include "ipc/protocol.hpp"
#include "ipc/response_cache.hpp"

namespace planorch::ipc {

ResponseCache::ResponseCache(const std::size_t capacity) : capacity_{capacity} {
    if (capacity_ == 0) {
        log_and_throw(IpcLog::Server, "Response cache capacity must be at least 1");
    }
}

std::optional<Response> ResponseCache::find(const std::string &id) {
    const std::lock_guard lock{mutex_};
    const auto it = index_.find(id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    entries_.splice(entries_.begin(), entries_, it->second);
    return it->second->second;
}

void ResponseCache::insert(const std::string &id, Response response) {
    const std::lock_guard lock{mutex_};
    if (const auto it = index_.find(id); it != index_.end()) {
        it->second->second = std::move(response);
        entries_.splice(entries_.begin(), entries_, it->second);
        return;
    }
    entries_.emplace_front(id, std::move(response));
    index_.emplace(id, entries_.begin());
    while (entries_.size() > capacity_) {
        index_.erase(entries_.back().first);
        entries_.pop_back();
    }
}

std::size_t ResponseCache::size() const {
    const std::lock_guard lock{mutex_};
    return entries_.size();
}

} // namespace planorch::ipc
