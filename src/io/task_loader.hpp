/**
 * @file task_loader.hpp
 * @brief Plan snapshot loading from TOML documents.
 *
 * The analysis core performs no I/O; this is the host-side loader used by
 * the CLI. It also enforces the pre-validation the core assumes (unique,
 * non-empty ids).
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace plan_scope {

struct PlanDocument {
    std::string name;
    std::vector<PlanTask> tasks;
};

/**
 * @brief Parse a plan from TOML text.
 *
 * Expected layout: an optional `[plan]` table with `name`, and an array of
 * `[[tasks]]` tables.
 */
Result<PlanDocument> parse_plan(std::string_view toml_text);

/**
 * @brief Load a plan from a TOML file on disk.
 */
Result<PlanDocument> load_plan_file(const std::filesystem::path& path);

}  // namespace plan_scope
