/**
 * @file risk_analyzer.hpp
 * @brief Rule-based risk assessment of a task snapshot.
 */

#pragma once

#include "analysis/dependency_graph.hpp"
#include "analysis/factor_id_sequence.hpp"
#include "core/types.hpp"

#include <span>
#include <string>
#include <vector>

namespace plan_scope {

/**
 * @brief One triggered risk rule.
 *
 * risk_score = probability × impact × severity_weight(severity).
 */
struct RiskFactor {
    std::string id;
    RiskCategory category = RiskCategory::Scope;
    Severity severity = Severity::Low;
    double probability = 0.0;    ///< [0, 1]
    double impact = 0.0;         ///< [0, 1]
    double risk_score = 0.0;
    std::string title;
    std::string description;
    std::string mitigation;
    std::vector<TaskId> affected_tasks;
};

struct Bottleneck {
    TaskId task_id;
    size_t dependent_count = 0;
    double blocking_risk = 0.0;  ///< out-degree / task count
};

struct RiskAnalysis {
    Severity overall_risk = Severity::Low;
    int risk_score = 0;          ///< [0, 100]
    std::vector<RiskFactor> factors;
    std::vector<std::string> recommendations;
    std::vector<TaskId> critical_path;
    std::vector<Bottleneck> bottlenecks;
};

/// Overall category for an aggregate score: ≥75 critical, ≥50 high, ≥25 medium.
[[nodiscard]] constexpr Severity risk_level_for(int score) noexcept {
    if (score >= 75) return Severity::Critical;
    if (score >= 50) return Severity::High;
    if (score >= 25) return Severity::Medium;
    return Severity::Low;
}

/**
 * @brief Scan @p tasks for known risk patterns.
 *
 * Factor ids are drawn from @p ids. The graph is rebuilt internally.
 */
[[nodiscard]] RiskAnalysis analyze_risks(std::span<const PlanTask> tasks, FactorIdSequence& ids);

/// Same as above with a fresh sequence, so ids start at `risk-1`.
[[nodiscard]] RiskAnalysis analyze_risks(std::span<const PlanTask> tasks);

}  // namespace plan_scope
