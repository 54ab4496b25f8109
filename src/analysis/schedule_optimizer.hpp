/**
 * @file schedule_optimizer.hpp
 * @brief Parallelized completion estimate and reordering proposals.
 *
 * Models unlimited parallelism inside each topological layer: a layer
 * costs as much as its longest task. Cyclic tasks cannot be layered and
 * are charged serially on top.
 */

#pragma once

#include "core/types.hpp"

#include <span>
#include <string>
#include <vector>

namespace plan_scope {

inline constexpr double kWorkdayHours = 8.0;

struct EffortEstimate {
    double hours = 0.0;   ///< rounded to one decimal
    double days = 0.0;    ///< 8-hour workdays, rounded to one decimal

    bool operator==(const EffortEstimate&) const = default;
};

struct ReorderingSuggestion {
    TaskId task_id;
    size_t suggested_position = 0;
    std::string reason;

    bool operator==(const ReorderingSuggestion&) const = default;
};

struct ParallelizationOpportunity {
    std::vector<TaskId> tasks;
    int64_t savings_minutes = 0;

    bool operator==(const ParallelizationOpportunity&) const = default;
};

struct ScheduleOptimization {
    EffortEstimate original_estimate;
    EffortEstimate optimized_estimate;
    int64_t original_minutes = 0;
    int64_t optimized_minutes = 0;
    int savings = 0;      ///< percent, [0, 100]
    std::vector<ReorderingSuggestion> reordering_suggestions;
    std::vector<ParallelizationOpportunity> parallelization_opportunities;

    bool operator==(const ScheduleOptimization&) const = default;
};

[[nodiscard]] EffortEstimate to_estimate(int64_t minutes);

/**
 * @brief Compare the serial effort of @p tasks with a layer-parallel
 *        schedule and propose reorderings.
 */
[[nodiscard]] ScheduleOptimization optimize_schedule(std::span<const PlanTask> tasks);

}  // namespace plan_scope
