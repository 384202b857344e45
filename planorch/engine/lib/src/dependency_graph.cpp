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
 * @file dependency_graph.cpp
 * @brief Validation, cycle detection and topology of the task dependency graph
 */

#include <algorithm>   // for find, max
#include <cstddef>     // for size_t
#include <cstdint>     // for uint8_t, uint32_t
#include <format>      // for format
#include <functional>  // for greater
#include <queue>       // for priority_queue
#include <string>      // for string
#include <string_view> // for string_view
#include <utility>     // for move, pair
#include <vector>      // for vector

#include <parallel_hashmap/phmap.h>
#include <quill/LogMacros.h>
#include <tl/expected.hpp>

#include "engine/dependency_graph.hpp"
#include "engine/engine_errors.hpp"
#include "engine/engine_log.hpp"
#include "engine/task_types.hpp"
#include "log/planorch_log_macros.hpp"

namespace planorch::engine {

namespace {

enum class VisitState : std::uint8_t { Unvisited, OnStack, Done };

tl::unexpected<GraphError>
graph_error(const OrchErrc errc, std::string message, std::vector<std::string> path = {}) {
    PLANORCH_LOGC_ERROR(EngineLog::Graph, "{}", message);
    return tl::unexpected(GraphError{make_error_code(errc), std::move(message), std::move(path)});
}

std::string join_path(const std::vector<std::string> &path) {
    std::string joined;
    for (const auto &id : path) {
        if (!joined.empty()) {
            joined += " -> ";
        }
        joined += id;
    }
    return joined;
}

} // namespace

tl::expected<DependencyGraph, GraphError> DependencyGraph::build(const std::vector<Task> &tasks) {
    DependencyGraph graph;
    graph.declared_order_.reserve(tasks.size());
    graph.nodes_.reserve(tasks.size());

    for (const auto &task : tasks) {
        if (task.id.empty()) {
            return graph_error(OrchErrc::ValidationError, "Task id cannot be empty");
        }
        if (!graph.nodes_.try_emplace(task.id).second) {
            return graph_error(
                    OrchErrc::ValidationError,
                    std::format("Task '{}' is declared more than once", task.id));
        }
        graph.declared_order_.push_back(task.id);
    }

    for (const auto &task : tasks) {
        auto &node = graph.nodes_.at(task.id);
        for (const auto &dep : task.dependencies) {
            if (dep == task.id) {
                return graph_error(
                        OrchErrc::ValidationError,
                        std::format("Task '{}' depends on itself", task.id),
                        {task.id, task.id});
            }
            if (!graph.nodes_.contains(dep)) {
                return graph_error(
                        OrchErrc::ValidationError,
                        std::format("Task '{}' depends on unknown task '{}'", task.id, dep));
            }
            if (std::find(node.dependencies.begin(), node.dependencies.end(), dep) ==
                node.dependencies.end()) {
                node.dependencies.push_back(dep);
            }
        }
        node.in_degree = node.dependencies.size();
    }

    for (const auto &id : graph.declared_order_) {
        for (const auto &dep : graph.nodes_.at(id).dependencies) {
            graph.nodes_.at(dep).dependents.push_back(id);
        }
    }

    // Iterative DFS along dependency edges; the explicit stack doubles as the
    // current path so a back edge yields the cycle as traversed
    phmap::flat_hash_map<std::string_view, VisitState> state;
    state.reserve(graph.nodes_.size());
    for (const auto &id : graph.declared_order_) {
        state.emplace(id, VisitState::Unvisited);
    }

    for (const auto &root : graph.declared_order_) {
        if (state[root] != VisitState::Unvisited) {
            continue;
        }
        std::vector<std::pair<std::string_view, std::size_t>> stack;
        stack.emplace_back(root, 0);
        state[root] = VisitState::OnStack;

        while (!stack.empty()) {
            auto &[current, next_dep] = stack.back();
            const auto &deps = graph.nodes_.at(current).dependencies;
            if (next_dep == deps.size()) {
                state[current] = VisitState::Done;
                stack.pop_back();
                continue;
            }
            const std::string_view dep = deps[next_dep++];
            const auto dep_state = state[dep];
            if (dep_state == VisitState::OnStack) {
                std::vector<std::string> path;
                bool in_cycle = false;
                for (const auto &[frame_id, unused] : stack) {
                    in_cycle = in_cycle || frame_id == dep;
                    if (in_cycle) {
                        path.emplace_back(frame_id);
                    }
                }
                path.emplace_back(dep);
                auto message = std::format("Dependency cycle detected: {}", join_path(path));
                return graph_error(OrchErrc::CycleError, std::move(message), std::move(path));
            }
            if (dep_state == VisitState::Unvisited) {
                state[dep] = VisitState::OnStack;
                stack.emplace_back(dep, 0);
            }
        }
    }

    graph.compute_topology();

    PLANORCH_LOGC_INFO(
            EngineLog::Graph,
            "Built dependency graph with {} tasks across {} generations",
            graph.size(),
            graph.generation_count_);
    return graph;
}

void DependencyGraph::compute_topology() {
    // Kahn's algorithm; the min-heap on declared index keeps ties in declared order
    phmap::flat_hash_map<std::string_view, std::size_t> index;
    std::vector<std::size_t> remaining(declared_order_.size());
    for (std::size_t i = 0; i < declared_order_.size(); ++i) {
        index.emplace(declared_order_[i], i);
        remaining[i] = nodes_.at(declared_order_[i]).in_degree;
    }

    std::priority_queue<std::size_t, std::vector<std::size_t>, std::greater<>> ready;
    for (std::size_t i = 0; i < declared_order_.size(); ++i) {
        if (remaining[i] == 0) {
            ready.push(i);
        }
    }

    topological_order_.clear();
    topological_order_.reserve(declared_order_.size());
    generation_count_ = declared_order_.empty() ? 0 : 1;
    while (!ready.empty()) {
        const std::size_t i = ready.top();
        ready.pop();
        const auto &id = declared_order_[i];
        topological_order_.push_back(id);
        auto &node = nodes_.at(id);
        generation_count_ = std::max(generation_count_, node.generation + 1);
        for (const auto &dependent : node.dependents) {
            auto &child = nodes_.at(dependent);
            child.generation = std::max(child.generation, node.generation + 1);
            const std::size_t child_index = index.at(dependent);
            if (--remaining[child_index] == 0) {
                ready.push(child_index);
            }
        }
    }
}

const GraphNode *DependencyGraph::node(const std::string_view id) const {
    const auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

void DependencyGraph::annotate(std::vector<Task> &tasks) const {
    for (auto &task : tasks) {
        if (const GraphNode *resolved = node(task.id); resolved != nullptr) {
            task.dependencies = resolved->dependencies;
            task.dependents = resolved->dependents;
        }
    }
}

} // namespace planorch::engine
