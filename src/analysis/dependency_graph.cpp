/**
 * @file dependency_graph.cpp
 * @brief Dependency graph construction and graph algorithms.
 *
 * Task ids are mapped once to dense indices; every pass then works on
 * indexed adjacency vectors. Cycle detection is an iterative three-color
 * DFS, layering is Kahn's algorithm, and the critical path is a longest-path
 * DP over the layered nodes. All passes are O(V+E).
 */

#include "analysis/dependency_graph.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <map>
#include <queue>
#include <unordered_map>

namespace plan_scope {

namespace {

constexpr size_t kNoPredecessor = std::numeric_limits<size_t>::max();

/**
 * @brief Snapshot re-expressed over dense indices.
 *
 * forward[u] lists the dependents of u, reverse[v] the dependencies of v.
 */
struct IndexedGraph {
    std::vector<const PlanTask*> tasks;
    std::unordered_map<TaskId, size_t> index;
    std::vector<std::vector<size_t>> forward;
    std::vector<std::vector<size_t>> reverse;

    [[nodiscard]] size_t size() const noexcept { return tasks.size(); }
};

IndexedGraph index_tasks(std::span<const PlanTask> input, std::vector<GraphEdge>& edges) {
    IndexedGraph graph;
    graph.tasks.reserve(input.size());

    for (const auto& task : input) {
        if (graph.index.emplace(task.id, graph.tasks.size()).second) {
            graph.tasks.push_back(&task);
        }
    }

    graph.forward.resize(graph.size());
    graph.reverse.resize(graph.size());

    for (size_t to = 0; to < graph.size(); ++to) {
        const auto* task = graph.tasks[to];
        for (const auto& dep_id : task->dependencies) {
            auto it = graph.index.find(dep_id);
            if (it == graph.index.end()) continue;  // dangling reference

            size_t from = it->second;
            graph.forward[from].push_back(to);
            graph.reverse[to].push_back(from);
            edges.push_back(GraphEdge{.from = dep_id, .to = task->id});
        }
    }

    return graph;
}

// ─────────────────────────────────────────────
// Cycle Detection (three-color DFS, explicit stack)
// ─────────────────────────────────────────────

struct CycleScan {
    bool found = false;
    std::vector<bool> member;
};

std::vector<bool> reachable_from(const std::vector<std::vector<size_t>>& adjacency,
                                 const std::vector<bool>& seeds) {
    std::vector<bool> seen(seeds);
    std::vector<size_t> stack;
    for (size_t i = 0; i < seeds.size(); ++i) {
        if (seeds[i]) stack.push_back(i);
    }
    while (!stack.empty()) {
        size_t node = stack.back();
        stack.pop_back();
        for (size_t next : adjacency[node]) {
            if (!seen[next]) {
                seen[next] = true;
                stack.push_back(next);
            }
        }
    }
    return seen;
}

/**
 * @brief Extend back-edge membership to every node on a cycle.
 *
 * A node whose only route into a cycle passes through an already finished
 * (black) node is never on the DFS path when the back edge is found. Every
 * cycle holds at least one marked node, so each of its members is both
 * reachable from and able to reach a marked node.
 */
void close_membership(const IndexedGraph& graph, std::vector<bool>& member) {
    auto downstream = reachable_from(graph.forward, member);
    auto upstream = reachable_from(graph.reverse, member);
    for (size_t i = 0; i < member.size(); ++i) {
        if (downstream[i] && upstream[i]) member[i] = true;
    }
}

CycleScan find_cycles(const IndexedGraph& graph) {
    enum class Color : uint8_t { White, Gray, Black };

    CycleScan scan;
    scan.member.assign(graph.size(), false);
    std::vector<Color> color(graph.size(), Color::White);

    struct Frame {
        size_t node;
        size_t neighbor_idx;
    };
    std::vector<Frame> path;

    for (size_t start = 0; start < graph.size(); ++start) {
        if (color[start] != Color::White) continue;

        color[start] = Color::Gray;
        path.push_back({start, 0});

        while (!path.empty()) {
            auto& frame = path.back();
            const auto& neighbors = graph.forward[frame.node];

            if (frame.neighbor_idx >= neighbors.size()) {
                color[frame.node] = Color::Black;
                path.pop_back();
                continue;
            }

            size_t next = neighbors[frame.neighbor_idx++];

            if (color[next] == Color::Gray) {
                // Back edge: the gray target and everything on the current
                // path (which ends at the current node) are cycle members.
                scan.found = true;
                scan.member[next] = true;
                for (const auto& on_path : path) {
                    scan.member[on_path.node] = true;
                }
            } else if (color[next] == Color::White) {
                color[next] = Color::Gray;
                path.push_back({next, 0});
            }
        }
    }

    if (scan.found) {
        close_membership(graph, scan.member);
    }
    return scan;
}

// ─────────────────────────────────────────────
// Topological Layering (Kahn's Algorithm)
// ─────────────────────────────────────────────

struct Layering {
    std::vector<int> depth;
    int max_depth = 0;
};

Layering layer_nodes(const IndexedGraph& graph) {
    Layering layering;
    layering.depth.assign(graph.size(), kUnreachableDepth);

    std::vector<size_t> remaining(graph.size());
    std::vector<int> tentative(graph.size(), 0);
    std::queue<size_t> ready;

    for (size_t i = 0; i < graph.size(); ++i) {
        remaining[i] = graph.reverse[i].size();
        if (remaining[i] == 0) {
            layering.depth[i] = 0;
            ready.push(i);
        }
    }

    while (!ready.empty()) {
        size_t current = ready.front();
        ready.pop();

        for (size_t next : graph.forward[current]) {
            tentative[next] = std::max(tentative[next], layering.depth[current] + 1);
            if (--remaining[next] == 0) {
                layering.depth[next] = tentative[next];
                layering.max_depth = std::max(layering.max_depth, tentative[next]);
                ready.push(next);
            }
        }
    }

    return layering;
}

// ─────────────────────────────────────────────
// Critical Path (longest duration over layered nodes)
// ─────────────────────────────────────────────

std::vector<TaskId> critical_path(const IndexedGraph& graph, const std::vector<int>& depth) {
    std::vector<size_t> order;
    order.reserve(graph.size());
    for (size_t i = 0; i < graph.size(); ++i) {
        if (depth[i] >= 0) order.push_back(i);
    }
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return depth[a] < depth[b]; });

    std::vector<int64_t> dist(graph.size(), 0);
    std::vector<size_t> predecessor(graph.size(), kNoPredecessor);

    for (size_t node : order) {
        int64_t own = graph.tasks[node]->minutes_or(0);
        const auto& deps = graph.reverse[node];

        if (deps.empty()) {
            dist[node] = own;
            continue;
        }

        // Every predecessor of a layered node is layered at a lower depth,
        // so its distance is already final.
        size_t best = deps.front();
        for (size_t dep : deps) {
            if (dist[dep] > dist[best]) best = dep;
        }
        dist[node] = dist[best] + own;
        predecessor[node] = best;
    }

    size_t end = kNoPredecessor;
    int64_t longest = -1;
    for (size_t node : order) {
        if (dist[node] > longest) {
            longest = dist[node];
            end = node;
        }
    }

    std::vector<TaskId> path;
    for (size_t cur = end; cur != kNoPredecessor; cur = predecessor[cur]) {
        path.push_back(graph.tasks[cur]->id);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

// ─────────────────────────────────────────────
// Parallel Groups (same-depth partitions)
// ─────────────────────────────────────────────

std::vector<std::vector<TaskId>> parallel_groups(const IndexedGraph& graph,
                                                 const std::vector<int>& depth) {
    std::map<int, std::vector<size_t>> by_depth;
    for (size_t i = 0; i < graph.size(); ++i) {
        if (depth[i] >= 0) by_depth[depth[i]].push_back(i);
    }

    std::vector<std::vector<TaskId>> groups;
    for (const auto& [level, members] : by_depth) {
        if (members.size() < 2) continue;

        std::vector<TaskId> group;
        for (size_t node : members) {
            const auto& deps = graph.reverse[node];
            bool same_level_dep = std::any_of(deps.begin(), deps.end(),
                [&, lvl = level](size_t dep) { return depth[dep] == lvl; });
            if (!same_level_dep) {
                group.push_back(graph.tasks[node]->id);
            }
        }

        if (group.size() > 1) {
            groups.push_back(std::move(group));
        }
    }
    return groups;
}

}  // namespace

// ─────────────────────────────────────────────
// DependencyGraph
// ─────────────────────────────────────────────

const GraphNode* DependencyGraph::find_node(const TaskId& id) const noexcept {
    auto it = std::find_if(nodes.begin(), nodes.end(),
                           [&](const GraphNode& node) { return node.id == id; });
    return it == nodes.end() ? nullptr : &*it;
}

bool DependencyGraph::is_cycle_node(const TaskId& id) const noexcept {
    return std::find(cycle_nodes.begin(), cycle_nodes.end(), id) != cycle_nodes.end();
}

DependencyGraph build_dependency_graph(std::span<const PlanTask> tasks) {
    DependencyGraph result;
    if (tasks.empty()) return result;

    auto graph = index_tasks(tasks, result.edges);
    auto cycles = find_cycles(graph);
    auto layering = layer_nodes(graph);

    result.nodes.reserve(graph.size());
    for (size_t i = 0; i < graph.size(); ++i) {
        const auto* task = graph.tasks[i];
        result.nodes.push_back(GraphNode{
            .id = task->id,
            .title = task->title,
            .status = task->status,
            .priority = task->priority,
            .depth = layering.depth[i],
            .in_degree = graph.reverse[i].size(),
            .out_degree = graph.forward[i].size()
        });
        if (cycles.member[i]) {
            result.cycle_nodes.push_back(task->id);
        }
    }

    result.critical_path = critical_path(graph, layering.depth);
    result.parallel_groups = parallel_groups(graph, layering.depth);
    result.max_depth = layering.max_depth;
    result.has_cycles = cycles.found;

    return result;
}

}  // namespace plan_scope
