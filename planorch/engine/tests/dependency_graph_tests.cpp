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
 * @file dependency_graph_tests.cpp
 * @brief Unit tests for dependency graph validation and topology
 */

#include <algorithm>
#include <cstddef>
#include <format>
#include <iterator>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "engine/dependency_graph.hpp"
#include "engine/engine_errors.hpp"
#include "engine/task_types.hpp"
#include "engine_test_support.hpp"

namespace {
namespace pe = planorch::engine;
namespace pt = planorch::testing;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

std::size_t position_of(const std::vector<std::string> &order, const std::string &id) {
    return static_cast<std::size_t>(
            std::distance(order.begin(), std::find(order.begin(), order.end(), id)));
}

TEST(DependencyGraph, EmptyPlan) {
    const auto graph = pe::DependencyGraph::build({});
    ASSERT_TRUE(graph.has_value());
    EXPECT_EQ(graph->size(), 0);
    EXPECT_TRUE(graph->topological_order().empty());
    EXPECT_EQ(graph->generation_count(), 0);
}

TEST(DependencyGraph, DiamondTopology) {
    const std::vector<pe::Task> tasks{
            pt::make_task("1.1"),
            pt::make_task("1.2", {"1.1"}),
            pt::make_task("1.3", {"1.1"}),
            pt::make_task("1.4", {"1.2", "1.3"})};

    const auto graph = pe::DependencyGraph::build(tasks);
    ASSERT_TRUE(graph.has_value()) << graph.error().message;

    EXPECT_EQ(graph->topological_order(), (std::vector<std::string>{"1.1", "1.2", "1.3", "1.4"}));
    EXPECT_EQ(graph->generation_count(), 3);
    EXPECT_EQ(graph->node("1.1")->generation, 0);
    EXPECT_EQ(graph->node("1.3")->generation, 1);
    EXPECT_EQ(graph->node("1.4")->generation, 2);
    EXPECT_EQ(graph->node("1.4")->in_degree, 2);
    EXPECT_EQ(graph->node("1.1")->dependents, (std::vector<std::string>{"1.2", "1.3"}));
    EXPECT_EQ(graph->node("missing"), nullptr);
}

TEST(DependencyGraph, TopologicalOrderRespectsEveryEdge) {
    // Declared out of dependency order on purpose
    const std::vector<pe::Task> tasks{
            pt::make_task("2.1", {"1.2"}),
            pt::make_task("1.2", {"1.1"}),
            pt::make_task("3.1", {"2.1", "1.1"}),
            pt::make_task("1.1"),
            pt::make_task("2.2")};

    const auto graph = pe::DependencyGraph::build(tasks);
    ASSERT_TRUE(graph.has_value());

    const auto &order = graph->topological_order();
    ASSERT_EQ(order.size(), tasks.size());
    for (const auto &task : tasks) {
        for (const auto &dep : task.dependencies) {
            EXPECT_LT(position_of(order, dep), position_of(order, task.id))
                    << dep << " must precede " << task.id;
        }
    }
    // Independent tasks keep declared order among themselves
    EXPECT_LT(position_of(order, "1.1"), position_of(order, "2.2"));
}

TEST(DependencyGraph, AnnotateFillsDependentsAndDeduplicates) {
    std::vector<pe::Task> tasks{
            pt::make_task("1.1"), pt::make_task("1.2", {"1.1", "1.1"}), pt::make_task("1.3", {"1.1"})};

    const auto graph = pe::DependencyGraph::build(tasks);
    ASSERT_TRUE(graph.has_value());
    graph->annotate(tasks);

    EXPECT_EQ(tasks[1].dependencies, (std::vector<std::string>{"1.1"}));
    EXPECT_EQ(tasks[0].dependents, (std::vector<std::string>{"1.2", "1.3"}));
    EXPECT_TRUE(tasks[2].dependents.empty());
}

TEST(DependencyGraph, ThreeTaskCycleReportsTraversedPath) {
    const std::vector<pe::Task> tasks{
            pt::make_task("1.1", {"1.2"}), pt::make_task("1.2", {"1.3"}), pt::make_task("1.3", {"1.1"})};

    const auto graph = pe::DependencyGraph::build(tasks);
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().code, pe::OrchErrc::CycleError);
    EXPECT_EQ(
            graph.error().cycle_path,
            (std::vector<std::string>{"1.1", "1.2", "1.3", "1.1"}));
    EXPECT_NE(graph.error().message.find("1.1 -> 1.2 -> 1.3 -> 1.1"), std::string::npos);
    EXPECT_TRUE(graph.error().to_error().is(pe::OrchErrc::CycleError));
}

TEST(DependencyGraph, CycleBehindAcyclicPrefix) {
    const std::vector<pe::Task> tasks{
            pt::make_task("1.1", {"2.1"}),
            pt::make_task("2.1", {"2.2"}),
            pt::make_task("2.2", {"2.3"}),
            pt::make_task("2.3", {"2.1"})};

    const auto graph = pe::DependencyGraph::build(tasks);
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().code, pe::OrchErrc::CycleError);
    EXPECT_EQ(
            graph.error().cycle_path,
            (std::vector<std::string>{"2.1", "2.2", "2.3", "2.1"}));
}

TEST(DependencyGraph, CyclePathIsAClosedWalkOverDeclaredEdges) {
    // Rings of growing length, each closed by the last task
    for (std::size_t length = 2; length <= 12; ++length) {
        std::vector<pe::Task> tasks;
        for (std::size_t i = 1; i <= length; ++i) {
            const auto next = i == length ? std::size_t{1} : i + 1;
            tasks.push_back(pt::make_task(std::format("1.{}", i), {std::format("1.{}", next)}));
        }
        const auto graph = pe::DependencyGraph::build(tasks);
        ASSERT_FALSE(graph.has_value()) << "ring of " << length;
        const auto &path = graph.error().cycle_path;
        ASSERT_EQ(path.size(), length + 1);
        EXPECT_EQ(path.front(), path.back());
        for (std::size_t i = 0; i + 1 < path.size(); ++i) {
            const auto it = std::find_if(tasks.begin(), tasks.end(), [&](const auto &task) {
                return task.id == path[i];
            });
            ASSERT_NE(it, tasks.end());
            EXPECT_EQ(it->dependencies.front(), path[i + 1]);
        }
    }
}

TEST(DependencyGraph, SelfReferenceIsValidationError) {
    const std::vector<pe::Task> tasks{pt::make_task("1.1"), pt::make_task("1.2", {"1.2"})};

    const auto graph = pe::DependencyGraph::build(tasks);
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().code, pe::OrchErrc::ValidationError);
    EXPECT_EQ(graph.error().cycle_path, (std::vector<std::string>{"1.2", "1.2"}));
}

TEST(DependencyGraph, UnknownDependencyIsValidationError) {
    const std::vector<pe::Task> tasks{pt::make_task("1.1", {"9.9"})};

    const auto graph = pe::DependencyGraph::build(tasks);
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().code, pe::OrchErrc::ValidationError);
    EXPECT_NE(graph.error().message.find("9.9"), std::string::npos);
    EXPECT_TRUE(graph.error().cycle_path.empty());
}

TEST(DependencyGraph, DuplicateAndEmptyIdsAreRejected) {
    const auto duplicate = pe::DependencyGraph::build({pt::make_task("1.1"), pt::make_task("1.1")});
    ASSERT_FALSE(duplicate.has_value());
    EXPECT_EQ(duplicate.error().code, pe::OrchErrc::ValidationError);

    const auto empty = pe::DependencyGraph::build({pt::make_task("")});
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code, pe::OrchErrc::ValidationError);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

} // namespace
