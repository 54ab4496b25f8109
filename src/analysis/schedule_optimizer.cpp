/**
 * @file schedule_optimizer.cpp
 * @brief Layer-parallel schedule estimate.
 *
 * Phase 1: serial baseline = sum of all estimates.
 * Phase 2: layered estimate = Σ over depth layers of the longest task in
 *          the layer, plus every cycle participant charged in full.
 * Phase 3: parallel groups with positive savings.
 * Phase 4: bottlenecks pulled to the front, low-priority leaves pushed to
 *          the back.
 */

#include "analysis/schedule_optimizer.hpp"

#include "analysis/dependency_graph.hpp"
#include "analysis/numeric.hpp"

#include <algorithm>
#include <map>
#include <unordered_map>
#include <unordered_set>

namespace plan_scope {

namespace {

constexpr size_t kFrontLoadOutDegree = 2;
constexpr size_t kMaxFrontLoaded = 5;
constexpr size_t kMaxDeferred = 3;

}  // namespace

EffortEstimate to_estimate(int64_t minutes) {
    double hours = static_cast<double>(minutes) / 60.0;
    return EffortEstimate{
        .hours = numeric::round_tenths(hours),
        .days = numeric::round_tenths(hours / kWorkdayHours)
    };
}

ScheduleOptimization optimize_schedule(std::span<const PlanTask> tasks) {
    ScheduleOptimization result;
    if (tasks.empty()) return result;

    const auto graph = build_dependency_graph(tasks);

    std::unordered_map<TaskId, int64_t> minutes;
    for (const auto& t : tasks) {
        minutes.emplace(t.id, t.minutes_or(0));
    }
    auto minutes_of = [&](const TaskId& id) -> int64_t {
        auto it = minutes.find(id);
        return it == minutes.end() ? 0 : it->second;
    };

    // ── Phase 1: serial baseline ─────────────
    int64_t total = 0;
    for (const auto& t : tasks) total += t.minutes_or(0);

    // ── Phase 2: layered estimate ────────────
    std::map<int, int64_t> longest_per_layer;
    for (const auto& node : graph.nodes) {
        if (node.depth < 0) continue;
        auto& slot = longest_per_layer[node.depth];
        slot = std::max(slot, minutes_of(node.id));
    }

    int64_t optimized = 0;
    for (const auto& [depth, longest] : longest_per_layer) optimized += longest;

    // Cycle members cannot be layered. Marked nodes that were layered anyway
    // are already counted above.
    std::unordered_set<TaskId> cyclic;
    for (const auto& id : graph.cycle_nodes) {
        const auto* node = graph.find_node(id);
        if (node != nullptr && node->depth < 0) cyclic.insert(id);
    }
    for (const auto& t : tasks) {
        if (cyclic.contains(t.id)) optimized += t.minutes_or(0);
    }

    result.original_minutes = total;
    result.optimized_minutes = optimized;
    result.original_estimate = to_estimate(total);
    result.optimized_estimate = to_estimate(optimized);
    if (total > 0) {
        double pct = 100.0 * static_cast<double>(total - optimized) / static_cast<double>(total);
        result.savings = numeric::round_clamped(pct);
    }

    // ── Phase 3: parallelization ─────────────
    for (const auto& group : graph.parallel_groups) {
        if (group.size() < 2) continue;
        int64_t sum = 0;
        int64_t longest = 0;
        for (const auto& id : group) {
            auto m = minutes_of(id);
            sum += m;
            longest = std::max(longest, m);
        }
        if (sum - longest > 0) {
            result.parallelization_opportunities.push_back(ParallelizationOpportunity{
                .tasks = group,
                .savings_minutes = sum - longest
            });
        }
    }

    // ── Phase 4: reordering ──────────────────
    std::vector<const GraphNode*> bottlenecks;
    for (const auto& node : graph.nodes) {
        if (node.out_degree > kFrontLoadOutDegree) bottlenecks.push_back(&node);
    }
    std::stable_sort(bottlenecks.begin(), bottlenecks.end(),
                     [](const GraphNode* a, const GraphNode* b) {
                         return a->out_degree > b->out_degree;
                     });
    for (size_t i = 0; i < std::min(bottlenecks.size(), kMaxFrontLoaded); ++i) {
        result.reordering_suggestions.push_back(ReorderingSuggestion{
            .task_id = bottlenecks[i]->id,
            .suggested_position = i,
            .reason = "Bottleneck: " + std::to_string(bottlenecks[i]->out_degree)
                      + " tasks depend on this. Complete early."
        });
    }

    size_t deferred = 0;
    for (const auto& node : graph.nodes) {
        if (deferred == kMaxDeferred) break;
        if (node.out_degree != 0 || node.in_degree == 0 || node.priority != kLowestPriority) continue;
        result.reordering_suggestions.push_back(ReorderingSuggestion{
            .task_id = node.id,
            .suggested_position = tasks.size() - 1,
            .reason = "Low-priority leaf task can be deferred."
        });
        ++deferred;
    }

    return result;
}

}  // namespace plan_scope
