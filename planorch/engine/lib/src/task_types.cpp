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

#include <algorithm>   // for find
#include <charconv>    // for from_chars
#include <cstddef>     // for size_t
#include <cstdint>     // for uint64_t
#include <iterator>    // for distance
#include <optional>    // for optional, nullopt
#include <string>      // for string
#include <string_view> // for string_view
#include <system_error> // for errc

#include "engine/task_types.hpp"

namespace planorch::engine {

namespace {

std::optional<std::uint64_t> parse_numeric_segment(const std::string_view segment) {
    if (segment.empty()) {
        return std::nullopt;
    }
    std::uint64_t value{};
    const auto *const end = segment.data() + segment.size();
    const auto [ptr, ec] = std::from_chars(segment.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

std::string_view next_segment(std::string_view &rest) {
    const auto dot = rest.find('.');
    const auto segment = rest.substr(0, dot);
    rest = (dot == std::string_view::npos) ? std::string_view{} : rest.substr(dot + 1);
    return segment;
}

} // namespace

std::string_view to_wire(const TaskStatus status) noexcept {
    switch (status) {
    case TaskStatus::Pending:
        return "pending";
    case TaskStatus::InProgress:
        return "in_progress";
    case TaskStatus::Completed:
        return "completed";
    case TaskStatus::Failed:
        return "failed";
    case TaskStatus::Skipped:
        return "skipped";
    }
    return "pending";
}

std::optional<TaskStatus> task_status_from_wire(const std::string_view name) noexcept {
    for (const auto &value_and_name : ::wise_enum::range<TaskStatus>) {
        if (to_wire(value_and_name.value) == name) {
            return value_and_name.value;
        }
    }
    return std::nullopt;
}

const Task *StatusSnapshot::find(const std::string_view id) const {
    const auto it = tasks.find(id);
    return it == tasks.end() ? nullptr : &it->second;
}

Task *StatusSnapshot::find(const std::string_view id) {
    const auto it = tasks.find(id);
    return it == tasks.end() ? nullptr : &it->second;
}

std::size_t StatusSnapshot::phase_rank(const std::string_view phase) const {
    const auto it = std::find(phase_order.begin(), phase_order.end(), phase);
    return static_cast<std::size_t>(std::distance(phase_order.begin(), it));
}

void StatusSnapshot::recalculate_summary() { summary = compute_summary(*this); }

bool StatusSnapshot::equivalent_to(const StatusSnapshot &other) const {
    return schema_version == other.schema_version && plan_id == other.plan_id &&
           phase_order == other.phase_order && task_order == other.task_order &&
           tasks == other.tasks && runs == other.runs && summary == other.summary;
}

Summary compute_summary(const StatusSnapshot &snapshot) {
    Summary summary{};
    for (const auto &[id, task] : snapshot.tasks) {
        ++summary.total_tasks;
        switch (task.status) {
        case TaskStatus::Pending:
            ++summary.pending;
            break;
        case TaskStatus::InProgress:
            ++summary.in_progress;
            break;
        case TaskStatus::Completed:
            ++summary.completed;
            break;
        case TaskStatus::Failed:
            ++summary.failed;
            break;
        case TaskStatus::Skipped:
            ++summary.skipped;
            break;
        }
    }
    return summary;
}

int compare_task_ids(std::string_view lhs, std::string_view rhs) noexcept {
    while (!lhs.empty() && !rhs.empty()) {
        const auto lseg = next_segment(lhs);
        const auto rseg = next_segment(rhs);
        const auto lnum = parse_numeric_segment(lseg);
        const auto rnum = parse_numeric_segment(rseg);
        if (lnum && rnum) {
            if (*lnum != *rnum) {
                return *lnum < *rnum ? -1 : 1;
            }
        } else if (lnum) {
            return -1; // numeric segments order before named ones
        } else if (rnum) {
            return 1;
        } else if (const int cmp = lseg.compare(rseg); cmp != 0) {
            return cmp < 0 ? -1 : 1;
        }
    }
    if (lhs.empty() && rhs.empty()) {
        return 0;
    }
    return lhs.empty() ? -1 : 1;
}

std::string derive_phase(const std::string_view task_id) {
    return std::string{task_id.substr(0, task_id.find('.'))};
}

} // namespace planorch::engine
