/**
 * @file types.hpp
 * @brief Fundamental types used throughout PlanScope.
 *
 * Defines TaskId, the priority/status/severity vocabulary and the PlanTask
 * record consumed by every analysis component. All types are plain values.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace plan_scope {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using TaskId = std::string;

// ─────────────────────────────────────────────
// Task Priority
// ─────────────────────────────────────────────

/// Ordered priority tiers. P1 is the most urgent.
enum class TaskPriority : uint8_t {
    P1,
    P2,
    P3
};

inline constexpr TaskPriority kLowestPriority = TaskPriority::P3;

[[nodiscard]] constexpr std::string_view to_string(TaskPriority priority) noexcept {
    switch (priority) {
        case TaskPriority::P1: return "P1";
        case TaskPriority::P2: return "P2";
        case TaskPriority::P3: return "P3";
    }
    return "unknown";
}

[[nodiscard]] std::optional<TaskPriority> parse_priority(std::string_view text) noexcept;

// ─────────────────────────────────────────────
// Task Status
// ─────────────────────────────────────────────

enum class TaskStatus : uint8_t {
    NotStarted,
    InProgress,
    Blocked,
    PendingVerification,
    Verified,
    NeedsReCheck,
    Failed,
    Decomposed
};

[[nodiscard]] constexpr std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::NotStarted:          return "not_started";
        case TaskStatus::InProgress:          return "in_progress";
        case TaskStatus::Blocked:             return "blocked";
        case TaskStatus::PendingVerification: return "pending_verification";
        case TaskStatus::Verified:            return "verified";
        case TaskStatus::NeedsReCheck:        return "needs_recheck";
        case TaskStatus::Failed:              return "failed";
        case TaskStatus::Decomposed:          return "decomposed";
    }
    return "unknown";
}

[[nodiscard]] std::optional<TaskStatus> parse_status(std::string_view text) noexcept;

// ─────────────────────────────────────────────
// Risk Vocabulary
// ─────────────────────────────────────────────

enum class Severity : uint8_t {
    Low,
    Medium,
    High,
    Critical
};

/// Numeric multiplier for a severity tier: low/medium/high/critical → 1/2/3/4.
[[nodiscard]] constexpr int severity_weight(Severity severity) noexcept {
    return static_cast<int>(severity) + 1;
}

[[nodiscard]] constexpr std::string_view to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::Low:      return "low";
        case Severity::Medium:   return "medium";
        case Severity::High:     return "high";
        case Severity::Critical: return "critical";
    }
    return "unknown";
}

enum class RiskCategory : uint8_t {
    Technical,
    Resource,
    Schedule,
    Scope,
    External
};

[[nodiscard]] constexpr std::string_view to_string(RiskCategory category) noexcept {
    switch (category) {
        case RiskCategory::Technical: return "technical";
        case RiskCategory::Resource:  return "resource";
        case RiskCategory::Schedule:  return "schedule";
        case RiskCategory::Scope:     return "scope";
        case RiskCategory::External:  return "external";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Plan Task
// ─────────────────────────────────────────────

/**
 * @brief A single work item in a plan snapshot.
 *
 * Read-only to the analysis engine. Dependencies may name tasks that are
 * not part of the snapshot; such references are ignored by the analyzers.
 */
struct PlanTask {
    TaskId id;
    std::string title;
    std::string description;
    TaskStatus status = TaskStatus::NotStarted;
    TaskPriority priority = TaskPriority::P2;
    std::optional<uint32_t> estimated_minutes;
    std::string acceptance_criteria;
    std::vector<TaskId> dependencies;

    /// Estimate in minutes, or @p fallback when none was given.
    [[nodiscard]] int64_t minutes_or(int64_t fallback) const noexcept {
        return estimated_minutes ? static_cast<int64_t>(*estimated_minutes) : fallback;
    }

    bool operator==(const PlanTask&) const = default;
};

/// Length of @p text after stripping leading and trailing whitespace.
[[nodiscard]] size_t trimmed_length(std::string_view text) noexcept;

}  // namespace plan_scope
