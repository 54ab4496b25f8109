/**
 * @file risk_analyzer.cpp
 * @brief Risk rules, aggregate scoring, bottleneck ranking and
 *        recommendations.
 *
 * Every rule fires independently. The aggregate score normalizes the sum of
 * factor scores against the ceiling reached if every fired factor were
 * critical with probability = impact = 1.
 */

#include "analysis/risk_analyzer.hpp"

#include "analysis/numeric.hpp"

#include <algorithm>
#include <numeric>

namespace plan_scope {

namespace {

constexpr size_t kModerateScopeTasks = 30;
constexpr size_t kLargeScopeTasks = 50;
constexpr double kHighP1Ratio = 0.5;
constexpr double kExcessiveP1Ratio = 0.7;
constexpr size_t kMinDescriptionChars = 20;
constexpr int64_t kMaxTaskMinutes = 45;
constexpr int64_t kVeryLargeTaskMinutes = 120;
constexpr int kDeepChainDepth = 3;
constexpr int kCriticalChainDepth = 5;
constexpr size_t kBottleneckOutDegree = 3;
constexpr size_t kSevereBottleneckOutDegree = 5;
constexpr double kHighEffortHours = 80.0;
constexpr double kCriticalEffortHours = 160.0;
constexpr size_t kMaxReportedBottlenecks = 5;

/// low for ratio ≤ 0.2, medium up to 0.5, high above.
Severity ratio_severity(double ratio) noexcept {
    if (ratio > 0.5) return Severity::High;
    if (ratio > 0.2) return Severity::Medium;
    return Severity::Low;
}

std::vector<TaskId> all_ids(std::span<const PlanTask> tasks) {
    std::vector<TaskId> ids;
    ids.reserve(tasks.size());
    for (const auto& t : tasks) ids.push_back(t.id);
    return ids;
}

class FactorBuilder {
public:
    explicit FactorBuilder(FactorIdSequence& ids) : ids_(ids) {}

    void add(RiskCategory category, Severity severity,
             double probability, double impact,
             std::string title, std::string description, std::string mitigation,
             std::vector<TaskId> affected) {
        probability = std::clamp(probability, 0.0, 1.0);
        impact = std::clamp(impact, 0.0, 1.0);
        factors_.push_back(RiskFactor{
            .id = ids_.next("risk"),
            .category = category,
            .severity = severity,
            .probability = probability,
            .impact = impact,
            .risk_score = probability * impact * severity_weight(severity),
            .title = std::move(title),
            .description = std::move(description),
            .mitigation = std::move(mitigation),
            .affected_tasks = std::move(affected)
        });
    }

    [[nodiscard]] std::vector<RiskFactor> take() { return std::move(factors_); }

private:
    FactorIdSequence& ids_;
    std::vector<RiskFactor> factors_;
};

}  // namespace

RiskAnalysis analyze_risks(std::span<const PlanTask> tasks, FactorIdSequence& ids) {
    RiskAnalysis analysis;
    if (tasks.empty()) {
        analysis.recommendations.emplace_back("No tasks to analyze. Create tasks first.");
        return analysis;
    }

    const size_t n = tasks.size();
    const auto graph = build_dependency_graph(tasks);
    FactorBuilder factors(ids);

    // ── Plan scope ───────────────────────────
    if (n > kLargeScopeTasks) {
        factors.add(RiskCategory::Scope, Severity::High, 0.7, 0.6,
                    "Large plan scope",
                    "Plan has " + std::to_string(n) + " tasks, which increases coordination overhead.",
                    "Consider breaking the plan into phases of 20-30 tasks each.",
                    all_ids(tasks));
    } else if (n > kModerateScopeTasks) {
        factors.add(RiskCategory::Scope, Severity::Medium, 0.4, 0.4,
                    "Moderate plan scope",
                    "Plan has " + std::to_string(n) + " tasks. Monitor for scope growth.",
                    "Review and prune low-priority tasks regularly.",
                    all_ids(tasks));
    }

    // ── P1 concentration ─────────────────────
    std::vector<TaskId> p1_tasks;
    for (const auto& t : tasks) {
        if (t.priority == TaskPriority::P1) p1_tasks.push_back(t.id);
    }
    const double p1_ratio = numeric::ratio(p1_tasks.size(), n);
    const auto p1_percent = std::to_string(numeric::round_clamped(p1_ratio * 100.0));

    if (p1_ratio > kExcessiveP1Ratio) {
        factors.add(RiskCategory::Resource, Severity::High, 0.8, 0.7,
                    "Excessive P1 concentration",
                    p1_percent + "% of tasks are P1. When everything is critical, nothing is.",
                    "Re-prioritize: only truly blocking tasks should be P1.",
                    p1_tasks);
    } else if (p1_ratio > kHighP1Ratio) {
        factors.add(RiskCategory::Resource, Severity::Medium, 0.5, 0.5,
                    "High P1 concentration",
                    p1_percent + "% of tasks are P1.",
                    "Review P1 tasks and downgrade those that are not truly blocking.",
                    p1_tasks);
    }

    // ── Acceptance criteria ──────────────────
    std::vector<TaskId> missing_criteria;
    for (const auto& t : tasks) {
        if (trimmed_length(t.acceptance_criteria) == 0) missing_criteria.push_back(t.id);
    }
    if (!missing_criteria.empty()) {
        double r = numeric::ratio(missing_criteria.size(), n);
        factors.add(RiskCategory::Scope, ratio_severity(r), 0.6 + r * 0.3, 0.5 + r * 0.3,
                    "Missing acceptance criteria",
                    std::to_string(missing_criteria.size()) + " of " + std::to_string(n)
                        + " tasks have no acceptance criteria.",
                    "Add clear, binary acceptance criteria to every task.",
                    missing_criteria);
    }

    // ── Description quality ──────────────────
    std::vector<TaskId> vague;
    for (const auto& t : tasks) {
        if (trimmed_length(t.description) < kMinDescriptionChars) vague.push_back(t.id);
    }
    if (!vague.empty()) {
        double r = numeric::ratio(vague.size(), n);
        factors.add(RiskCategory::Scope, ratio_severity(r), 0.5 + r * 0.3, 0.4 + r * 0.3,
                    "Vague task descriptions",
                    std::to_string(vague.size()) + " of " + std::to_string(n)
                        + " tasks have descriptions shorter than "
                        + std::to_string(kMinDescriptionChars) + " characters.",
                    "Expand descriptions to include what, why, and context.",
                    vague);
    }

    // ── Oversized tasks ──────────────────────
    std::vector<TaskId> oversized;
    bool very_large = false;
    for (const auto& t : tasks) {
        if (t.minutes_or(0) > kMaxTaskMinutes) {
            oversized.push_back(t.id);
            very_large = very_large || t.minutes_or(0) > kVeryLargeTaskMinutes;
        }
    }
    if (!oversized.empty()) {
        factors.add(RiskCategory::Schedule, very_large ? Severity::High : Severity::Medium, 0.7, 0.6,
                    "Oversized tasks detected",
                    std::to_string(oversized.size()) + " tasks exceed "
                        + std::to_string(kMaxTaskMinutes) + " minutes.",
                    "Decompose tasks >45 min into 15-45 min subtasks.",
                    oversized);
    }

    // ── Deep dependency chains ───────────────
    if (graph.max_depth > kDeepChainDepth) {
        std::vector<TaskId> deep;
        for (const auto& node : graph.nodes) {
            if (node.depth > kDeepChainDepth) deep.push_back(node.id);
        }
        auto sev = graph.max_depth > kCriticalChainDepth ? Severity::Critical : Severity::High;
        factors.add(RiskCategory::Schedule, sev, 0.6, 0.8,
                    "Deep dependency chains",
                    "Maximum dependency depth is " + std::to_string(graph.max_depth) + ".",
                    "Flatten the dependency graph.",
                    deep);
    }

    // ── Cycles ───────────────────────────────
    if (graph.has_cycles) {
        factors.add(RiskCategory::Technical, Severity::Critical, 1.0, 1.0,
                    "Circular dependencies detected",
                    std::to_string(graph.cycle_nodes.size())
                        + " tasks are involved in dependency cycles.",
                    "Break the cycles by removing or reversing at least one dependency.",
                    graph.cycle_nodes);
    }

    // ── Bottlenecks ──────────────────────────
    size_t bottleneck_count = 0;
    for (const auto& node : graph.nodes) {
        if (node.out_degree <= kBottleneckOutDegree) continue;
        ++bottleneck_count;
        auto sev = node.out_degree > kSevereBottleneckOutDegree ? Severity::High : Severity::Medium;
        factors.add(RiskCategory::Schedule, sev, 0.5, 0.3 + numeric::ratio(node.out_degree, n),
                    "Bottleneck: \"" + node.title + "\"",
                    "Task \"" + node.title + "\" has " + std::to_string(node.out_degree)
                        + " tasks depending on it.",
                    "Prioritize \"" + node.title + "\" for early completion.",
                    {node.id});
    }

    // ── Total effort ─────────────────────────
    int64_t total_minutes = std::accumulate(tasks.begin(), tasks.end(), int64_t{0},
        [](int64_t sum, const PlanTask& t) { return sum + t.minutes_or(0); });
    double total_hours = static_cast<double>(total_minutes) / 60.0;
    if (total_hours > kHighEffortHours) {
        auto sev = total_hours > kCriticalEffortHours ? Severity::Critical : Severity::High;
        factors.add(RiskCategory::Schedule, sev, 0.6, 0.7,
                    "High total effort estimate",
                    "Plan totals " + numeric::fixed(total_hours, 1) + " hours of work.",
                    "Break the plan into incremental milestones.",
                    all_ids(tasks));
    }

    analysis.factors = factors.take();

    // ── Aggregate score ──────────────────────
    double raw = 0.0;
    for (const auto& f : analysis.factors) raw += f.risk_score;
    double ceiling = std::max(static_cast<double>(analysis.factors.size()) * 4.0, 1.0);
    analysis.risk_score = numeric::round_clamped(raw / ceiling * 100.0);
    analysis.overall_risk = risk_level_for(analysis.risk_score);
    analysis.critical_path = graph.critical_path;

    // ── Bottleneck ranking ───────────────────
    std::vector<const GraphNode*> ranked;
    for (const auto& node : graph.nodes) {
        if (node.out_degree > 0) ranked.push_back(&node);
    }
    std::stable_sort(ranked.begin(), ranked.end(), [](const GraphNode* a, const GraphNode* b) {
        return a->out_degree > b->out_degree;
    });
    if (ranked.size() > kMaxReportedBottlenecks) ranked.resize(kMaxReportedBottlenecks);
    for (const auto* node : ranked) {
        analysis.bottlenecks.push_back(Bottleneck{
            .task_id = node->id,
            .dependent_count = node->out_degree,
            .blocking_risk = numeric::ratio(node->out_degree, n)
        });
    }

    // ── Recommendations ──────────────────────
    auto& recs = analysis.recommendations;
    if (graph.has_cycles) {
        recs.emplace_back("CRITICAL: Resolve dependency cycles before starting any work.");
    }
    if (!missing_criteria.empty()) {
        recs.push_back("Add acceptance criteria to " + std::to_string(missing_criteria.size()) + " tasks.");
    }
    if (!oversized.empty()) {
        recs.push_back("Decompose " + std::to_string(oversized.size()) + " oversized tasks (>45 min).");
    }
    if (p1_ratio > kHighP1Ratio) {
        recs.emplace_back("Re-prioritize tasks: too many P1 tasks dilute focus.");
    }
    if (graph.max_depth > kDeepChainDepth) {
        recs.emplace_back("Flatten dependency chains to reduce cascading delay risk.");
    }
    if (bottleneck_count > 0) {
        recs.emplace_back("Prioritize bottleneck tasks for early completion.");
    }
    if (recs.empty()) {
        recs.emplace_back("Plan looks healthy. Proceed with execution.");
    }

    return analysis;
}

RiskAnalysis analyze_risks(std::span<const PlanTask> tasks) {
    FactorIdSequence ids;
    return analyze_risks(tasks, ids);
}

}  // namespace plan_scope
