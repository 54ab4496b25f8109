/**
 * @file planning_engine.cpp
 * @brief PlanningEngine implementation.
 */

#include "engine/planning_engine.hpp"

#include <unordered_set>

namespace plan_scope {

PlanningEngine::PlanningEngine(Logger& logger)
    : logger_(logger) {}

RiskAnalysis PlanningEngine::analyze_risks(std::span<const PlanTask> tasks) {
    auto analysis = plan_scope::analyze_risks(tasks, factor_ids_);
    logger_.debug("Risk analysis: " + std::to_string(analysis.factors.size()) + " factors, score "
                  + std::to_string(analysis.risk_score) + " ("
                  + std::string{to_string(analysis.overall_risk)} + ")");
    return analysis;
}

DependencyGraph PlanningEngine::build_dependency_graph(std::span<const PlanTask> tasks) {
    auto graph = plan_scope::build_dependency_graph(tasks);
    logger_.debug("Dependency graph: " + std::to_string(graph.nodes.size()) + " nodes, "
                  + std::to_string(graph.edges.size()) + " edges, max depth "
                  + std::to_string(graph.max_depth));
    if (graph.has_cycles) {
        logger_.warn("Dependency cycles detected across "
                     + std::to_string(graph.cycle_nodes.size()) + " tasks");
    }
    return graph;
}

std::vector<DecompositionSuggestion> PlanningEngine::suggest_decompositions(std::span<const PlanTask> tasks) {
    auto suggestions = plan_scope::suggest_decompositions(tasks);
    logger_.debug("Decomposition: " + std::to_string(suggestions.size()) + " of "
                  + std::to_string(tasks.size()) + " tasks flagged");
    return suggestions;
}

ScheduleOptimization PlanningEngine::optimize_schedule(std::span<const PlanTask> tasks) {
    auto schedule = plan_scope::optimize_schedule(tasks);
    logger_.debug("Schedule: " + std::to_string(schedule.original_minutes) + " min serial, "
                  + std::to_string(schedule.optimized_minutes) + " min layered, savings "
                  + std::to_string(schedule.savings) + "%");
    return schedule;
}

PlanHealth PlanningEngine::calculate_plan_health(std::span<const PlanTask> tasks) {
    auto health = plan_scope::calculate_plan_health(tasks);
    logger_.debug("Plan health: " + std::to_string(health.score) + " ("
                  + std::string{to_string(health.grade)} + ")");
    return health;
}

PlanReport PlanningEngine::analyze(std::span<const PlanTask> tasks, std::string plan_name) {
    logger_.info("Analyzing plan '" + plan_name + "' with " + std::to_string(tasks.size()) + " tasks");
    report_input_issues(tasks);

    PlanReport report;
    report.plan_name = std::move(plan_name);
    report.task_count = tasks.size();
    report.graph = build_dependency_graph(tasks);
    report.risks = analyze_risks(tasks);
    report.decompositions = suggest_decompositions(tasks);
    report.schedule = optimize_schedule(tasks);
    report.health = calculate_plan_health(tasks);

    logger_.info("Analysis complete: health " + std::to_string(report.health.score)
                 + " (" + std::string{to_string(report.health.grade)} + "), risk "
                 + std::string{to_string(report.risks.overall_risk)});
    return report;
}

void PlanningEngine::report_input_issues(std::span<const PlanTask> tasks) {
    if (!logger_.enabled(LogLevel::Warn)) return;

    std::unordered_set<TaskId> ids;
    for (const auto& t : tasks) {
        if (!ids.insert(t.id).second) {
            logger_.warn("Duplicate task id '" + t.id + "'; later occurrences are ignored by the graph");
        }
    }

    size_t dangling = 0;
    for (const auto& t : tasks) {
        for (const auto& dep : t.dependencies) {
            if (!ids.contains(dep)) ++dangling;
        }
    }
    if (dangling > 0) {
        logger_.warn(std::to_string(dangling) + " dependency reference(s) point to unknown tasks and were ignored");
    }
}

}  // namespace plan_scope
