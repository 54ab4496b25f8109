/**
 * @file plan_generator.hpp
 * @brief Synthetic plan generators for testing and benchmarking.
 */

#pragma once

#include "core/types.hpp"

#include <random>
#include <vector>

namespace plan_scope {

/**
 * @brief Factory for synthetic task snapshots with various dependency shapes.
 *
 * Every generated task carries a title, a description and acceptance
 * criteria so that only the dependency shape and estimates vary between
 * topologies.
 */
class PlanGenerator {
public:
    /// Linear chain: T0 → T1 → ... → Tn-1
    static std::vector<PlanTask> linear_chain(size_t num_tasks, uint32_t minutes);

    /// Fan-out / Fan-in: src → {branch_0 .. branch_w-1} → sink
    static std::vector<PlanTask> fan_out_fan_in(size_t width, uint32_t minutes);

    /// Diamond: repeated fan-out/fan-in, each level hanging off the previous merge
    static std::vector<PlanTask> diamond(size_t depth, size_t width, uint32_t minutes);

    /// Random acyclic plan; estimates uniform in [min_minutes, max_minutes]
    static std::vector<PlanTask> random_plan(size_t num_tasks,
                                             float edge_probability,
                                             uint32_t min_minutes,
                                             uint32_t max_minutes,
                                             std::mt19937& rng);

    /**
     * @brief Add an edge from → to, making `to` depend on `from`.
     *
     * Used to close a loop in an otherwise acyclic plan. Unknown ids leave
     * the plan unchanged.
     */
    static std::vector<PlanTask> with_cycle(std::vector<PlanTask> plan,
                                            const TaskId& from,
                                            const TaskId& to);
};

}  // namespace plan_scope
