/**
 * @file plan_generator.cpp
 * @brief Synthetic plan generator, all topology implementations.
 *
 * Shapes mirror common project plans:
 * - Linear chains (strictly sequential work)
 * - Fan-out/fan-in (parallel work behind one kickoff, merged by one review)
 * - Diamond (several fan-out/fan-in stages in sequence)
 * - Random DAGs (for property tests and benchmarking)
 */

#include "workload/plan_generator.hpp"

#include <algorithm>
#include <string>

namespace plan_scope {

namespace {

PlanTask make_task(TaskId id, std::string title, uint32_t minutes) {
    return PlanTask{
        .id = std::move(id),
        .title = title,
        .description = "Generated task: " + title + ". Produced by the synthetic plan generator.",
        .status = TaskStatus::NotStarted,
        .priority = TaskPriority::P2,
        .estimated_minutes = minutes,
        .acceptance_criteria = "Completed: " + title,
        .dependencies = {}
    };
}

PlanTask* find_task(std::vector<PlanTask>& plan, const TaskId& id) {
    auto it = std::find_if(plan.begin(), plan.end(), [&](const PlanTask& t) { return t.id == id; });
    return it == plan.end() ? nullptr : &*it;
}

}  // namespace

// ─────────────────────────────────────────────
// Linear Chain: chain_0 → chain_1 → ... → chain_{n-1}
// ─────────────────────────────────────────────

std::vector<PlanTask> PlanGenerator::linear_chain(size_t num_tasks, uint32_t minutes) {
    std::vector<PlanTask> plan;
    plan.reserve(num_tasks);

    for (size_t i = 0; i < num_tasks; ++i) {
        auto task = make_task("chain_" + std::to_string(i), "Chain Task " + std::to_string(i), minutes);
        if (i > 0) {
            task.dependencies.push_back(plan.back().id);
        }
        plan.push_back(std::move(task));
    }

    return plan;
}

// ─────────────────────────────────────────────
// Fan-out / Fan-in:
//          fan_src
//       /     |     \    (backslash)
//   branch_0 ... branch_{width-1}
//       \     |     /
//          fan_sink
// ─────────────────────────────────────────────

std::vector<PlanTask> PlanGenerator::fan_out_fan_in(size_t width, uint32_t minutes) {
    std::vector<PlanTask> plan;
    plan.reserve(width + 2);

    plan.push_back(make_task("fan_src", "Fan-Out Source", minutes));

    auto sink = make_task("fan_sink", "Fan-In Sink", minutes);
    for (size_t i = 0; i < width; ++i) {
        auto branch = make_task("fan_branch_" + std::to_string(i), "Branch " + std::to_string(i), minutes);
        branch.dependencies.push_back("fan_src");
        sink.dependencies.push_back(branch.id);
        plan.push_back(std::move(branch));
    }

    plan.push_back(std::move(sink));
    return plan;
}

// ─────────────────────────────────────────────
// Diamond: repeated fan-out/fan-in.
//
//   hub_0 → {diamond_0_*} → merge_0 → hub_1 → {diamond_1_*} → merge_1 ...
//
// Depth of merge_d is 3d + 2.
// ─────────────────────────────────────────────

std::vector<PlanTask> PlanGenerator::diamond(size_t depth, size_t width, uint32_t minutes) {
    std::vector<PlanTask> plan;
    plan.reserve(depth * (width + 2));

    TaskId prev_merge;

    for (size_t d = 0; d < depth; ++d) {
        const auto level = std::to_string(d);

        auto hub = make_task("hub_" + level, "Hub " + level, minutes);
        if (d > 0) {
            hub.dependencies.push_back(prev_merge);
        }
        plan.push_back(std::move(hub));

        auto merge = make_task("merge_" + level, "Merge " + level, minutes);
        for (size_t w = 0; w < width; ++w) {
            const auto branch_no = std::to_string(w);
            auto branch = make_task("diamond_" + level + "_" + branch_no,
                                    "Diamond D" + level + " B" + branch_no, minutes);
            branch.dependencies.push_back("hub_" + level);
            merge.dependencies.push_back(branch.id);
            plan.push_back(std::move(branch));
        }

        prev_merge = merge.id;
        plan.push_back(std::move(merge));
    }

    return plan;
}

// ─────────────────────────────────────────────
// Random plan:
// Random estimates, priorities and Erdős–Rényi-style edges. Edges only
// run from lower-indexed to higher-indexed tasks, so the result is acyclic.
// ─────────────────────────────────────────────

std::vector<PlanTask> PlanGenerator::random_plan(size_t num_tasks,
                                                 float edge_probability,
                                                 uint32_t min_minutes,
                                                 uint32_t max_minutes,
                                                 std::mt19937& rng) {
    std::vector<PlanTask> plan;
    plan.reserve(num_tasks);

    std::uniform_int_distribution<uint32_t> minutes_dist(std::min(min_minutes, max_minutes),
                                                         std::max(min_minutes, max_minutes));
    std::uniform_int_distribution<int> priority_dist(0, 2);

    for (size_t i = 0; i < num_tasks; ++i) {
        auto task = make_task("rand_" + std::to_string(i), "Random Task " + std::to_string(i),
                              minutes_dist(rng));
        task.priority = static_cast<TaskPriority>(priority_dist(rng));
        plan.push_back(std::move(task));
    }

    std::uniform_real_distribution<float> edge_dist(0.0f, 1.0f);
    for (size_t i = 0; i < num_tasks; ++i) {
        for (size_t j = i + 1; j < num_tasks; ++j) {
            if (edge_dist(rng) < edge_probability) {
                plan[j].dependencies.push_back(plan[i].id);
            }
        }
    }

    return plan;
}

std::vector<PlanTask> PlanGenerator::with_cycle(std::vector<PlanTask> plan,
                                                const TaskId& from,
                                                const TaskId& to) {
    if (find_task(plan, from) == nullptr) return plan;
    if (auto* target = find_task(plan, to); target != nullptr) {
        target->dependencies.push_back(from);
    }
    return plan;
}

}  // namespace plan_scope
