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

#ifndef PLANORCH_ENGINE_TIME_HPP
#define PLANORCH_ENGINE_TIME_HPP

#include <chrono>
#include <cstdint>
#include <string>

namespace planorch::engine {

/// Millisecond duration used for timeouts and thresholds
using Millis = std::chrono::milliseconds;

/**
 * Wall-clock and monotonic time helpers
 *
 * Wall-clock values are persisted as ISO-8601 UTC strings; durations such as
 * stuck detection use the monotonic clock so they survive clock adjustments.
 */
class Time final {
public:
    using TimePoint = std::chrono::system_clock::time_point;
    using SteadyPoint = std::chrono::steady_clock::time_point;

    [[nodiscard]] static TimePoint now() { return std::chrono::system_clock::now(); }

    [[nodiscard]] static SteadyPoint steady_now() { return std::chrono::steady_clock::now(); }

    /**
     * Milliseconds since the Unix epoch
     */
    [[nodiscard]] static std::int64_t now_ms();

    /**
     * Format a time point as "YYYY-MM-DDTHH:MM:SS.mmmZ"
     *
     * @param[in] tp Time point to format
     * @return ISO-8601 UTC string with millisecond precision
     */
    [[nodiscard]] static std::string to_iso8601(TimePoint tp);

    /**
     * Current wall-clock time as an ISO-8601 UTC string
     */
    [[nodiscard]] static std::string now_iso8601() { return to_iso8601(now()); }
};

} // namespace planorch::engine

#endif // PLANORCH_ENGINE_TIME_HPP
