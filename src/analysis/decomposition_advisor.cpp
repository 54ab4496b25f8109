/**
 * @file decomposition_advisor.cpp
 * @brief Decomposition rules and subtask templates.
 */

#include "analysis/decomposition_advisor.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace plan_scope {

namespace {

constexpr int64_t kMaxTaskMinutes = 45;
constexpr size_t kMinDescriptionChars = 20;
constexpr int64_t kDefaultEstimateMinutes = 30;
constexpr int64_t kMinutesPerSubtask = 30;
constexpr int64_t kMinSubtaskCount = 2;

enum class TitleKind : uint8_t { Create, Fix, Refactor, Test, Generic };

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

template <size_t N>
bool contains_any(const std::string& haystack, const std::array<std::string_view, N>& needles) {
    return std::any_of(needles.begin(), needles.end(), [&](std::string_view needle) {
        return haystack.find(needle) != std::string::npos;
    });
}

/// First matching category wins, in this order.
TitleKind classify(std::string_view title) {
    static constexpr std::array<std::string_view, 4> kCreate{"create", "implement", "add", "build"};
    static constexpr std::array<std::string_view, 3> kFix{"fix", "debug", "resolve"};
    static constexpr std::array<std::string_view, 3> kRefactor{"refactor", "update", "migrate"};
    static constexpr std::array<std::string_view, 2> kTest{"test", "verify"};

    auto lower = lowercase(title);
    if (contains_any(lower, kCreate))   return TitleKind::Create;
    if (contains_any(lower, kFix))      return TitleKind::Fix;
    if (contains_any(lower, kRefactor)) return TitleKind::Refactor;
    if (contains_any(lower, kTest))     return TitleKind::Test;
    return TitleKind::Generic;
}

int64_t ceil_div(int64_t numerator, int64_t denominator) {
    return (numerator + denominator - 1) / denominator;
}

}  // namespace

std::vector<SuggestedSubtask> generate_subtasks(const PlanTask& task) {
    const int64_t estimate = task.minutes_or(kDefaultEstimateMinutes);
    const int64_t target = std::max(kMinSubtaskCount, ceil_div(estimate, kMinutesPerSubtask));
    const auto& title = task.title;
    const auto pr = task.priority;

    std::vector<SuggestedSubtask> subtasks;
    auto add = [&](std::string label, int64_t minutes, TaskPriority priority) {
        subtasks.push_back(SuggestedSubtask{
            .title = std::move(label),
            .estimated_minutes = minutes,
            .priority = priority
        });
    };

    switch (classify(title)) {
        case TitleKind::Create:
            add("Design interface/API for: " + title, 20, pr);
            add("Implement core logic for: " + title, 30, pr);
            add("Write unit tests for: " + title, 25, pr);
            if (target > 3) add("Add error handling for: " + title, 20, pr);
            if (target > 4) add("Document: " + title, 15, kLowestPriority);
            break;
        case TitleKind::Fix:
            add("Investigate root cause for: " + title, 20, pr);
            add("Implement fix for: " + title, 25, pr);
            add("Write regression test for: " + title, 20, pr);
            break;
        case TitleKind::Refactor:
            add("Analyze current code for: " + title, 20, pr);
            add("Apply changes for: " + title, 30, pr);
            add("Update tests for: " + title, 20, pr);
            if (target > 3) add("Verify backwards compatibility for: " + title, 15, pr);
            break;
        case TitleKind::Test:
            add("Write happy-path tests for: " + title, 25, pr);
            add("Write edge-case tests for: " + title, 25, pr);
            add("Write error-handling tests for: " + title, 20, pr);
            break;
        case TitleKind::Generic: {
            const int64_t per_step = ceil_div(estimate, target);
            for (int64_t step = 1; step <= target; ++step) {
                add("Step " + std::to_string(step) + " of: " + title, per_step, pr);
            }
            break;
        }
    }

    for (auto& subtask : subtasks) {
        subtask.estimated_minutes = std::min(subtask.estimated_minutes, kMaxSubtaskMinutes);
    }
    return subtasks;
}

std::vector<DecompositionSuggestion> suggest_decompositions(std::span<const PlanTask> tasks) {
    std::vector<DecompositionSuggestion> suggestions;

    for (const auto& task : tasks) {
        std::string reason;
        auto append = [&reason](std::string_view text) {
            if (!reason.empty()) reason += "; ";
            reason += text;
        };

        if (task.minutes_or(0) > kMaxTaskMinutes) {
            append("Estimated " + std::to_string(task.minutes_or(0))
                   + " minutes exceeds 45-minute limit");
        }
        if (trimmed_length(task.description) < kMinDescriptionChars) {
            append("Description is too vague (less than 20 characters)");
        }
        if (trimmed_length(task.acceptance_criteria) == 0) {
            append("Missing acceptance criteria");
        }

        if (!reason.empty()) {
            suggestions.push_back(DecompositionSuggestion{
                .task_id = task.id,
                .reason = std::move(reason),
                .suggested_subtasks = generate_subtasks(task)
            });
        }
    }

    return suggestions;
}

}  // namespace plan_scope
