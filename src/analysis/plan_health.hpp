/**
 * @file plan_health.hpp
 * @brief Weighted multi-factor quality grade for a plan.
 */

#pragma once

#include "core/types.hpp"

#include <span>
#include <string>
#include <vector>

namespace plan_scope {

enum class Grade : uint8_t { A, B, C, D, F };

[[nodiscard]] constexpr std::string_view to_string(Grade grade) noexcept {
    switch (grade) {
        case Grade::A: return "A";
        case Grade::B: return "B";
        case Grade::C: return "C";
        case Grade::D: return "D";
        case Grade::F: return "F";
    }
    return "?";
}

/// A ≥ 90, B ≥ 80, C ≥ 70, D ≥ 60, otherwise F.
[[nodiscard]] constexpr Grade grade_for(int score) noexcept {
    if (score >= 90) return Grade::A;
    if (score >= 80) return Grade::B;
    if (score >= 70) return Grade::C;
    if (score >= 60) return Grade::D;
    return Grade::F;
}

struct HealthFactor {
    std::string name;
    int score = 0;        ///< [0, 100]
    int weight = 0;
    std::string details;

    bool operator==(const HealthFactor&) const = default;
};

struct PlanHealth {
    int score = 0;        ///< [0, 100]
    Grade grade = Grade::F;
    std::vector<HealthFactor> factors;

    [[nodiscard]] const HealthFactor* find_factor(std::string_view name) const noexcept;

    bool operator==(const PlanHealth&) const = default;
};

/**
 * @brief Score granularity, acceptance-criteria coverage, priority balance,
 *        dependency health, description quality and decomposition
 *        readiness, then combine them into a weighted mean and grade.
 */
[[nodiscard]] PlanHealth calculate_plan_health(std::span<const PlanTask> tasks);

}  // namespace plan_scope
