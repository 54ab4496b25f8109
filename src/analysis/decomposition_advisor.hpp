/**
 * @file decomposition_advisor.hpp
 * @brief Flags tasks that violate sizing/quality rules and proposes subtasks.
 */

#pragma once

#include "core/types.hpp"

#include <span>
#include <string>
#include <vector>

namespace plan_scope {

/// Upper bound for any suggested subtask, in minutes.
inline constexpr int64_t kMaxSubtaskMinutes = 45;

struct SuggestedSubtask {
    std::string title;
    int64_t estimated_minutes = 0;   ///< ≤ kMaxSubtaskMinutes
    TaskPriority priority = TaskPriority::P2;

    bool operator==(const SuggestedSubtask&) const = default;
};

struct DecompositionSuggestion {
    TaskId task_id;
    std::string reason;              ///< violated rules joined with "; "
    std::vector<SuggestedSubtask> suggested_subtasks;

    bool operator==(const DecompositionSuggestion&) const = default;
};

/**
 * @brief Evaluate every task independently and return a suggestion for each
 *        task that is oversized, vaguely described or lacks acceptance
 *        criteria. Output follows input order.
 */
[[nodiscard]] std::vector<DecompositionSuggestion> suggest_decompositions(std::span<const PlanTask> tasks);

/**
 * @brief Keyword-driven subtask synthesis for a single task.
 *
 * The title selects a template (create, fix, refactor, test); anything else
 * is split into equal "Step N" parts. A missing estimate counts as 30 min.
 */
[[nodiscard]] std::vector<SuggestedSubtask> generate_subtasks(const PlanTask& task);

}  // namespace plan_scope
