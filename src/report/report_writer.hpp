/**
 * @file report_writer.hpp
 * @brief Rendering of a PlanReport as JSON or human-readable text.
 */

#pragma once

#include "core/result.hpp"
#include "engine/planning_engine.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace plan_scope {

/**
 * @brief Which report sections to render.
 *
 * Names match the `[report] sections` config entries: risks, graph,
 * decompositions, schedule, health.
 */
struct ReportSections {
    bool risks = true;
    bool graph = true;
    bool decompositions = true;
    bool schedule = true;
    bool health = true;

    [[nodiscard]] static ReportSections all() noexcept { return {}; }
    [[nodiscard]] static ReportSections none() noexcept {
        return {.risks = false, .graph = false, .decompositions = false,
                .schedule = false, .health = false};
    }

    /// Enable the named section; false for an unknown name.
    bool enable(std::string_view name) noexcept;

    [[nodiscard]] bool empty() const noexcept {
        return !risks && !graph && !decompositions && !schedule && !health;
    }

    bool operator==(const ReportSections&) const = default;
};

/// Build a selection from section names. Unknown names are InvalidInput.
Result<ReportSections> parse_sections(const std::vector<std::string>& names);

/// One JSON document; sections that are switched off are omitted.
[[nodiscard]] std::string render_json(const PlanReport& report, const ReportSections& sections);

/// Human-readable summary for the terminal.
[[nodiscard]] std::string render_text(const PlanReport& report, const ReportSections& sections);

}  // namespace plan_scope
