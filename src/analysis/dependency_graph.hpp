/**
 * @file dependency_graph.hpp
 * @brief Dependency graph report built from a flat task snapshot.
 *
 * Models a plan as a directed graph where an edge (from, to) means "to"
 * depends on "from". The builder detects cycles, layers the acyclic part
 * topologically, and derives the critical path and parallel groups.
 */

#pragma once

#include "core/types.hpp"

#include <span>
#include <string>
#include <vector>

namespace plan_scope {

/// Depth assigned to nodes that a topological sort never reaches.
inline constexpr int kUnreachableDepth = -1;

struct GraphNode {
    TaskId id;
    std::string title;
    TaskStatus status = TaskStatus::NotStarted;
    TaskPriority priority = TaskPriority::P2;
    int depth = 0;               ///< kUnreachableDepth when part of or behind a cycle
    size_t in_degree = 0;
    size_t out_degree = 0;

    bool operator==(const GraphNode&) const = default;
};

struct GraphEdge {
    TaskId from;
    TaskId to;

    bool operator==(const GraphEdge&) const = default;
};

/**
 * @brief Derived graph of a task snapshot. Rebuilt on every call.
 *
 * Nodes appear in input order; edges in the order of each task's
 * dependency list.
 */
struct DependencyGraph {
    std::vector<GraphNode> nodes;
    std::vector<GraphEdge> edges;
    std::vector<TaskId> critical_path;
    std::vector<std::vector<TaskId>> parallel_groups;
    int max_depth = 0;
    bool has_cycles = false;
    std::vector<TaskId> cycle_nodes;

    [[nodiscard]] const GraphNode* find_node(const TaskId& id) const noexcept;
    [[nodiscard]] bool is_cycle_node(const TaskId& id) const noexcept;

    bool operator==(const DependencyGraph&) const = default;
};

/**
 * @brief Build the dependency graph of @p tasks.
 *
 * Dependencies naming ids outside the snapshot are dropped. When an id
 * occurs more than once only its first task is considered. Never throws
 * on domain data.
 */
[[nodiscard]] DependencyGraph build_dependency_graph(std::span<const PlanTask> tasks);

}  // namespace plan_scope
