/**
 * @file planning_engine.hpp
 * @brief Top-level PlanningEngine facade tying the analyzers together.
 *
 * Provides a single entry point for the five analysis operations and a
 * combined report. The facade owns the risk-factor id sequence and logs a
 * summary of every call; the analyzers themselves stay pure.
 */

#pragma once

#include "analysis/decomposition_advisor.hpp"
#include "analysis/dependency_graph.hpp"
#include "analysis/factor_id_sequence.hpp"
#include "analysis/plan_health.hpp"
#include "analysis/risk_analyzer.hpp"
#include "analysis/schedule_optimizer.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <span>
#include <string>
#include <vector>

namespace plan_scope {

/**
 * @brief All five reports for one snapshot.
 */
struct PlanReport {
    std::string plan_name;
    size_t task_count = 0;
    RiskAnalysis risks;
    DependencyGraph graph;
    std::vector<DecompositionSuggestion> decompositions;
    ScheduleOptimization schedule;
    PlanHealth health;
};

class PlanningEngine {
public:
    explicit PlanningEngine(Logger& logger);

    // Non-copyable: the id sequence is per-engine state.
    PlanningEngine(const PlanningEngine&) = delete;
    PlanningEngine& operator=(const PlanningEngine&) = delete;

    // ── Analysis Operations ──────────────────
    [[nodiscard]] RiskAnalysis analyze_risks(std::span<const PlanTask> tasks);
    [[nodiscard]] DependencyGraph build_dependency_graph(std::span<const PlanTask> tasks);
    [[nodiscard]] std::vector<DecompositionSuggestion> suggest_decompositions(std::span<const PlanTask> tasks);
    [[nodiscard]] ScheduleOptimization optimize_schedule(std::span<const PlanTask> tasks);
    [[nodiscard]] PlanHealth calculate_plan_health(std::span<const PlanTask> tasks);

    /// Run every operation over the same snapshot.
    [[nodiscard]] PlanReport analyze(std::span<const PlanTask> tasks, std::string plan_name = {});

    // ── Test Support ─────────────────────────
    void reset_factor_ids() noexcept { factor_ids_.reset(); }
    [[nodiscard]] uint64_t factor_ids_issued() const noexcept { return factor_ids_.issued(); }

private:
    void report_input_issues(std::span<const PlanTask> tasks);

    Logger& logger_;
    FactorIdSequence factor_ids_;
};

}  // namespace plan_scope
