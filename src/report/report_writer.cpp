/**
 * @file report_writer.cpp
 * @brief JSON and text rendering of plan reports.
 *
 * JSON is hand-encoded with ostringstream, one object per report section.
 */

#include "report/report_writer.hpp"

#include "analysis/numeric.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace plan_scope {

namespace {

constexpr size_t kTextRecommendationLimit = 3;

// ─────────────────────────────────────────────
// JSON helpers
// ─────────────────────────────────────────────

std::string quoted(std::string_view text) {
    return "\"" + json_escape(text) + "\"";
}

std::string number(double value) {
    if (!std::isfinite(value)) return "0";
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

std::string string_array(const std::vector<std::string>& items) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) oss << ",";
        oss << quoted(items[i]);
    }
    oss << "]";
    return oss.str();
}

template <typename T, typename Fn>
std::string object_array(const std::vector<T>& items, Fn&& encode) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) oss << ",";
        oss << encode(items[i]);
    }
    oss << "]";
    return oss.str();
}

std::string risks_json(const RiskAnalysis& risks) {
    std::ostringstream oss;
    oss << R"({"overall_risk":)" << quoted(to_string(risks.overall_risk))
        << R"(,"risk_score":)" << risks.risk_score
        << R"(,"factors":)" << object_array(risks.factors, [](const RiskFactor& f) {
               std::ostringstream o;
               o << R"({"id":)" << quoted(f.id)
                 << R"(,"category":)" << quoted(to_string(f.category))
                 << R"(,"severity":)" << quoted(to_string(f.severity))
                 << R"(,"probability":)" << number(f.probability)
                 << R"(,"impact":)" << number(f.impact)
                 << R"(,"risk_score":)" << number(f.risk_score)
                 << R"(,"title":)" << quoted(f.title)
                 << R"(,"description":)" << quoted(f.description)
                 << R"(,"mitigation":)" << quoted(f.mitigation)
                 << R"(,"affected_tasks":)" << string_array(f.affected_tasks)
                 << "}";
               return o.str();
           })
        << R"(,"recommendations":)" << string_array(risks.recommendations)
        << R"(,"critical_path":)" << string_array(risks.critical_path)
        << R"(,"bottlenecks":)" << object_array(risks.bottlenecks, [](const Bottleneck& b) {
               std::ostringstream o;
               o << R"({"task_id":)" << quoted(b.task_id)
                 << R"(,"dependent_count":)" << b.dependent_count
                 << R"(,"blocking_risk":)" << number(b.blocking_risk)
                 << "}";
               return o.str();
           })
        << "}";
    return oss.str();
}

std::string graph_json(const DependencyGraph& graph) {
    std::ostringstream oss;
    oss << R"({"nodes":)" << object_array(graph.nodes, [](const GraphNode& n) {
               std::ostringstream o;
               o << R"({"id":)" << quoted(n.id)
                 << R"(,"title":)" << quoted(n.title)
                 << R"(,"status":)" << quoted(to_string(n.status))
                 << R"(,"priority":)" << quoted(to_string(n.priority))
                 << R"(,"depth":)" << n.depth
                 << R"(,"in_degree":)" << n.in_degree
                 << R"(,"out_degree":)" << n.out_degree
                 << "}";
               return o.str();
           })
        << R"(,"edges":)" << object_array(graph.edges, [](const GraphEdge& e) {
               return R"({"from":)" + plan_scope::quoted(e.from) + R"(,"to":)" + plan_scope::quoted(e.to) + "}";
           })
        << R"(,"critical_path":)" << string_array(graph.critical_path)
        << R"(,"parallel_groups":)" << object_array(graph.parallel_groups, string_array)
        << R"(,"max_depth":)" << graph.max_depth
        << R"(,"has_cycles":)" << (graph.has_cycles ? "true" : "false")
        << R"(,"cycle_nodes":)" << string_array(graph.cycle_nodes)
        << "}";
    return oss.str();
}

std::string decompositions_json(const std::vector<DecompositionSuggestion>& suggestions) {
    return object_array(suggestions, [](const DecompositionSuggestion& s) {
        std::ostringstream o;
        o << R"({"task_id":)" << quoted(s.task_id)
          << R"(,"reason":)" << quoted(s.reason)
          << R"(,"suggested_subtasks":)" << object_array(s.suggested_subtasks, [](const SuggestedSubtask& st) {
                 std::ostringstream so;
                 so << R"({"title":)" << quoted(st.title)
                    << R"(,"estimated_minutes":)" << st.estimated_minutes
                    << R"(,"priority":)" << quoted(to_string(st.priority))
                    << "}";
                 return so.str();
             })
          << "}";
        return o.str();
    });
}

std::string estimate_json(const EffortEstimate& estimate) {
    return R"({"hours":)" + number(estimate.hours) + R"(,"days":)" + number(estimate.days) + "}";
}

std::string schedule_json(const ScheduleOptimization& schedule) {
    std::ostringstream oss;
    oss << R"({"original_estimate":)" << estimate_json(schedule.original_estimate)
        << R"(,"optimized_estimate":)" << estimate_json(schedule.optimized_estimate)
        << R"(,"original_minutes":)" << schedule.original_minutes
        << R"(,"optimized_minutes":)" << schedule.optimized_minutes
        << R"(,"savings":)" << schedule.savings
        << R"(,"reordering_suggestions":)"
        << object_array(schedule.reordering_suggestions, [](const ReorderingSuggestion& r) {
               std::ostringstream o;
               o << R"({"task_id":)" << quoted(r.task_id)
                 << R"(,"suggested_position":)" << r.suggested_position
                 << R"(,"reason":)" << quoted(r.reason)
                 << "}";
               return o.str();
           })
        << R"(,"parallelization_opportunities":)"
        << object_array(schedule.parallelization_opportunities, [](const ParallelizationOpportunity& p) {
               return R"({"tasks":)" + string_array(p.tasks)
                    + R"(,"savings_minutes":)" + std::to_string(p.savings_minutes) + "}";
           })
        << "}";
    return oss.str();
}

std::string health_json(const PlanHealth& health) {
    std::ostringstream oss;
    oss << R"({"score":)" << health.score
        << R"(,"grade":)" << quoted(to_string(health.grade))
        << R"(,"factors":)" << object_array(health.factors, [](const HealthFactor& f) {
               std::ostringstream o;
               o << R"({"name":)" << quoted(f.name)
                 << R"(,"score":)" << f.score
                 << R"(,"weight":)" << f.weight
                 << R"(,"details":)" << quoted(f.details)
                 << "}";
               return o.str();
           })
        << "}";
    return oss.str();
}

std::string join(const std::vector<std::string>& items, std::string_view separator) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += separator;
        out += items[i];
    }
    return out;
}

}  // namespace

bool ReportSections::enable(std::string_view name) noexcept {
    if (name == "risks")          { risks = true;          return true; }
    if (name == "graph")          { graph = true;          return true; }
    if (name == "decompositions") { decompositions = true; return true; }
    if (name == "schedule")       { schedule = true;       return true; }
    if (name == "health")         { health = true;         return true; }
    return false;
}

Result<ReportSections> parse_sections(const std::vector<std::string>& names) {
    auto sections = ReportSections::none();
    for (const auto& name : names) {
        if (!sections.enable(name)) {
            return make_error<ReportSections>(ErrorCode::InvalidInput, "Unknown report section: " + name);
        }
    }
    return sections;
}

// ─────────────────────────────────────────────
// JSON
// ─────────────────────────────────────────────

std::string render_json(const PlanReport& report, const ReportSections& sections) {
    std::ostringstream oss;
    oss << R"({"plan":)" << quoted(report.plan_name)
        << R"(,"task_count":)" << report.task_count;
    if (sections.risks)          oss << R"(,"risks":)" << risks_json(report.risks);
    if (sections.graph)          oss << R"(,"graph":)" << graph_json(report.graph);
    if (sections.decompositions) oss << R"(,"decompositions":)" << decompositions_json(report.decompositions);
    if (sections.schedule)       oss << R"(,"schedule":)" << schedule_json(report.schedule);
    if (sections.health)         oss << R"(,"health":)" << health_json(report.health);
    oss << "}";
    return oss.str();
}

// ─────────────────────────────────────────────
// Text
// ─────────────────────────────────────────────

std::string render_text(const PlanReport& report, const ReportSections& sections) {
    std::ostringstream oss;
    oss << "Plan: " << (report.plan_name.empty() ? "(unnamed)" : report.plan_name)
        << " (" << report.task_count << " tasks)\n";

    if (sections.health) {
        const auto& health = report.health;
        oss << "\nHealth: " << health.score << "/100, grade " << to_string(health.grade) << "\n";
        for (const auto& f : health.factors) {
            oss << "  - " << f.name << ": " << f.score << " (weight " << f.weight << ") "
                << f.details << "\n";
        }
    }

    if (sections.risks) {
        const auto& risks = report.risks;
        oss << "\nRisk: " << to_string(risks.overall_risk) << " (score " << risks.risk_score << ", "
            << risks.factors.size() << " factors)\n";
        for (const auto& f : risks.factors) {
            oss << "  [" << to_string(f.severity) << "] " << f.title << "\n";
        }
        const size_t shown = std::min(risks.recommendations.size(), kTextRecommendationLimit);
        if (shown > 0) oss << "  Recommendations:\n";
        for (size_t i = 0; i < shown; ++i) {
            oss << "    " << (i + 1) << ". " << risks.recommendations[i] << "\n";
        }
    }

    if (sections.graph) {
        const auto& graph = report.graph;
        oss << "\nDependencies: " << graph.nodes.size() << " tasks, " << graph.edges.size()
            << " edges, max depth " << graph.max_depth << "\n";
        oss << "  Critical path: "
            << (graph.critical_path.empty() ? std::string{"(none)"} : join(graph.critical_path, " -> "))
            << "\n";
        if (graph.has_cycles) {
            oss << "  Cycles through: " << join(graph.cycle_nodes, ", ") << "\n";
        }
        oss << "  Parallel groups: " << graph.parallel_groups.size() << "\n";
    }

    if (sections.schedule) {
        const auto& schedule = report.schedule;
        oss << "\nSchedule: " << numeric::fixed(schedule.original_estimate.hours, 1) << "h serial, "
            << numeric::fixed(schedule.optimized_estimate.hours, 1) << "h layered ("
            << numeric::fixed(schedule.optimized_estimate.days, 1) << " days), savings "
            << schedule.savings << "%\n";
        if (!schedule.reordering_suggestions.empty()) {
            oss << "  Reordering suggestions: " << schedule.reordering_suggestions.size() << "\n";
        }
    }

    if (sections.decompositions) {
        oss << "\nDecomposition: " << report.decompositions.size() << " tasks should be split\n";
        for (const auto& s : report.decompositions) {
            oss << "  - " << s.task_id << ": " << s.reason << " (" << s.suggested_subtasks.size()
                << " subtasks)\n";
        }
    }

    return oss.str();
}

}  // namespace plan_scope
