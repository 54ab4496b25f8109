/**
 * @file plan_health.cpp
 * @brief The six plan health factors and their weighted combination.
 */

#include "analysis/plan_health.hpp"

#include "analysis/dependency_graph.hpp"
#include "analysis/numeric.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>

namespace plan_scope {

namespace {

constexpr int kGranularityWeight = 25;
constexpr int kCriteriaWeight = 20;
constexpr int kPriorityWeight = 15;
constexpr int kDependencyWeight = 20;
constexpr int kDescriptionWeight = 10;
constexpr int kReadinessWeight = 10;

HealthFactor granularity(std::span<const PlanTask> tasks) {
    size_t in_range = 0;
    size_t over_45 = 0;
    size_t over_120 = 0;
    for (const auto& t : tasks) {
        auto m = t.minutes_or(0);
        if (m >= 15 && m <= 45) ++in_range;
        if (m > 45) ++over_45;
        if (m > 120) ++over_120;
    }
    double score = numeric::ratio(in_range, tasks.size()) * 100.0
                 - static_cast<double>(over_120) * 10.0;

    auto n = std::to_string(tasks.size());
    return HealthFactor{
        .name = "Task Granularity",
        .score = numeric::round_clamped(score),
        .weight = kGranularityWeight,
        .details = std::to_string(in_range) + "/" + n + " in 15-45 min. "
                   + std::to_string(over_45) + " oversized. "
                   + std::to_string(over_120) + " exceed 2h."
    };
}

HealthFactor criteria_coverage(std::span<const PlanTask> tasks) {
    auto covered = static_cast<size_t>(std::count_if(tasks.begin(), tasks.end(), [](const PlanTask& t) {
        return trimmed_length(t.acceptance_criteria) > 0;
    }));
    return HealthFactor{
        .name = "Acceptance Criteria Coverage",
        .score = numeric::round_clamped(numeric::ratio(covered, tasks.size()) * 100.0),
        .weight = kCriteriaWeight,
        .details = std::to_string(covered) + "/" + std::to_string(tasks.size()) + " have criteria."
    };
}

/// Deviation from an ideal 30/40/30 split across P1/P2/P3.
HealthFactor priority_balance(std::span<const PlanTask> tasks) {
    size_t counts[3] = {0, 0, 0};
    std::set<TaskPriority> distinct;
    for (const auto& t : tasks) {
        ++counts[static_cast<size_t>(t.priority)];
        distinct.insert(t.priority);
    }

    const size_t n = tasks.size();
    double deviation = (std::abs(numeric::ratio(counts[0], n) - 0.3)
                      + std::abs(numeric::ratio(counts[1], n) - 0.4)
                      + std::abs(numeric::ratio(counts[2], n) - 0.3)) / 3.0;
    double score = std::max(0.0, (1.0 - deviation * 3.0) * 100.0);
    if (distinct.size() == 1) score = std::max(0.0, score - 30.0);

    return HealthFactor{
        .name = "Priority Balance",
        .score = numeric::round_clamped(score),
        .weight = kPriorityWeight,
        .details = "P1:" + std::to_string(counts[0]) + " P2:" + std::to_string(counts[1])
                   + " P3:" + std::to_string(counts[2]) + ". "
                   + std::to_string(distinct.size()) + " distinct."
    };
}

HealthFactor dependency_health(std::span<const PlanTask> tasks) {
    const auto graph = build_dependency_graph(tasks);

    double score = 100.0;
    if (graph.has_cycles) score -= 50.0;
    if (graph.max_depth > 5) {
        score -= 30.0;
    } else if (graph.max_depth > 3) {
        score -= 15.0;
    }

    size_t total_in = 0;
    for (const auto& node : graph.nodes) total_in += node.in_degree;
    double avg_in = static_cast<double>(total_in)
                  / static_cast<double>(std::max<size_t>(graph.nodes.size(), 1));
    if (avg_in > 2.0) score -= std::min(20.0, (avg_in - 2.0) * 10.0);

    return HealthFactor{
        .name = "Dependency Health",
        .score = numeric::round_clamped(std::max(0.0, score)),
        .weight = kDependencyWeight,
        .details = "Depth:" + std::to_string(graph.max_depth) + ". Cycles:"
                   + (graph.has_cycles ? "YES" : "No") + ". AvgIn:"
                   + numeric::fixed(avg_in, 1) + "."
    };
}

HealthFactor description_quality(std::span<const PlanTask> tasks) {
    size_t total_len = 0;
    size_t detailed = 0;
    for (const auto& t : tasks) {
        auto len = trimmed_length(t.description);
        total_len += len;
        if (len >= 50) ++detailed;
    }
    double avg_len = numeric::ratio(total_len, tasks.size());
    double score = std::min(100.0, (avg_len / 50.0) * 100.0 * 0.5
                                 + numeric::ratio(detailed, tasks.size()) * 100.0 * 0.5);

    return HealthFactor{
        .name = "Description Quality",
        .score = numeric::round_clamped(score),
        .weight = kDescriptionWeight,
        .details = "Avg:" + std::to_string(numeric::round_clamped(avg_len, 0, std::numeric_limits<int>::max()))
                   + " chars. " + std::to_string(detailed) + "/"
                   + std::to_string(tasks.size()) + ">=50."
    };
}

HealthFactor decomposition_readiness(std::span<const PlanTask> tasks) {
    size_t over_2h = 0;
    size_t over_1h = 0;
    for (const auto& t : tasks) {
        auto m = t.minutes_or(0);
        if (m > 120) ++over_2h;
        if (m > 60) ++over_1h;
    }
    double score = 100.0 - static_cast<double>(over_2h) * 25.0 - static_cast<double>(over_1h) * 10.0;

    return HealthFactor{
        .name = "Decomposition Readiness",
        .score = numeric::round_clamped(score),
        .weight = kReadinessWeight,
        .details = std::to_string(over_2h) + " exceed 2h. " + std::to_string(over_1h) + " exceed 1h."
    };
}

}  // namespace

const HealthFactor* PlanHealth::find_factor(std::string_view name) const noexcept {
    auto it = std::find_if(factors.begin(), factors.end(),
                           [&](const HealthFactor& f) { return f.name == name; });
    return it == factors.end() ? nullptr : &*it;
}

PlanHealth calculate_plan_health(std::span<const PlanTask> tasks) {
    PlanHealth health;
    if (tasks.empty()) {
        health.factors.push_back(HealthFactor{
            .name = "No tasks", .score = 0, .weight = 1, .details = "Plan has no tasks."
        });
        return health;
    }

    health.factors = {
        granularity(tasks),
        criteria_coverage(tasks),
        priority_balance(tasks),
        dependency_health(tasks),
        description_quality(tasks),
        decomposition_readiness(tasks)
    };

    double weighted = 0.0;
    int total_weight = 0;
    for (const auto& f : health.factors) {
        weighted += static_cast<double>(f.score) * f.weight;
        total_weight += f.weight;
    }

    health.score = numeric::round_clamped(weighted / static_cast<double>(std::max(total_weight, 1)));
    health.grade = grade_for(health.score);
    return health;
}

}  // namespace plan_scope
