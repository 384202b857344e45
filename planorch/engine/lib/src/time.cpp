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

#include <chrono>  // for duration_cast, floor, milliseconds
#include <cstdint> // for int64_t
#include <format>  // for format
#include <string>  // for string

#include "engine/time.hpp"

namespace planorch::engine {

std::int64_t Time::now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(now().time_since_epoch())
            .count();
}

std::string Time::to_iso8601(const TimePoint tp) {
    const auto ms_tp = std::chrono::floor<std::chrono::milliseconds>(tp);
    return std::format("{:%FT%T}Z", ms_tp);
}

} // namespace planorch::engine
