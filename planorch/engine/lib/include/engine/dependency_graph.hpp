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
 * @file dependency_graph.hpp
 * @brief Validated, acyclic task dependency graph
 */

#ifndef PLANORCH_ENGINE_DEPENDENCY_GRAPH_HPP
#define PLANORCH_ENGINE_DEPENDENCY_GRAPH_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <parallel_hashmap/phmap.h>
#include <tl/expected.hpp>

#include "engine/engine_errors.hpp"
#include "engine/task_types.hpp"

namespace planorch::engine {

/**
 * Failure reported by DependencyGraph::build()
 */
struct GraphError final {
    std::error_code code;                //!< ValidationError or CycleError
    std::string message;                 //!< Detail naming the offending ids
    std::vector<std::string> cycle_path; //!< Cycle as traversed, first id repeated at the end

    /**
     * Convert to the generic engine error
     */
    [[nodiscard]] Error to_error() const { return Error{code, message}; }
};

/**
 * Adjacency of one task
 */
struct GraphNode final {
    std::vector<std::string> dependencies; //!< Ids this task depends on (declared order)
    std::vector<std::string> dependents;   //!< Ids depending on this task (declared order)
    std::size_t in_degree{};               //!< Number of dependencies
    std::uint32_t generation{};            //!< Longest dependency chain leading to this task
};

/**
 * Immutable dependency graph over a plan's tasks
 *
 * Only constructible through build(), which guarantees that every referenced
 * id exists, no task references itself and the relation is acyclic.
 *
 * @code
 * auto graph = DependencyGraph::build(plan.tasks);
 * if (!graph) {
 *     // graph.error().cycle_path lists the cycle when code == CycleError
 * }
 * @endcode
 */
class DependencyGraph final {
public:
    /**
     * Validate tasks and build the graph
     *
     * Validation runs first (empty ids, duplicate ids, self references,
     * references to unknown ids). A depth-first search in declared task order
     * then looks for a cycle.
     *
     * @param[in] tasks Tasks in declared order
     * @return Graph, or GraphError with ValidationError / CycleError
     */
    [[nodiscard]] static tl::expected<DependencyGraph, GraphError>
    build(const std::vector<Task> &tasks);

    /**
     * Look up the node of a task
     *
     * @param[in] id Task id
     * @return Node, or nullptr for an unknown id
     */
    [[nodiscard]] const GraphNode *node(std::string_view id) const;

    [[nodiscard]] std::size_t size() const noexcept { return declared_order_.size(); }

    [[nodiscard]] const std::vector<std::string> &declared_order() const noexcept {
        return declared_order_;
    }

    /**
     * Task ids such that every task appears after all of its dependencies
     *
     * Ties are broken by declared order.
     */
    [[nodiscard]] const std::vector<std::string> &topological_order() const noexcept {
        return topological_order_;
    }

    /**
     * Number of dependency generations (length of the longest chain plus one)
     */
    [[nodiscard]] std::uint32_t generation_count() const noexcept { return generation_count_; }

    /**
     * Apply resolved adjacency to tasks
     *
     * Deduplicates each task's dependencies and fills its dependents list.
     *
     * @param[in,out] tasks Tasks that were passed to build()
     */
    void annotate(std::vector<Task> &tasks) const;

private:
    DependencyGraph() = default;

    void compute_topology();

    phmap::flat_hash_map<std::string, GraphNode> nodes_;
    std::vector<std::string> declared_order_;
    std::vector<std::string> topological_order_;
    std::uint32_t generation_count_{};
};

} // namespace planorch::engine

#endif // PLANORCH_ENGINE_DEPENDENCY_GRAPH_HPP
