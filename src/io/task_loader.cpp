/**
 * @file task_loader.cpp
 * @brief Plan loading from TOML using toml++.
 */

#include "io/task_loader.hpp"

#include <toml++/toml.hpp>

#include <limits>
#include <unordered_set>

namespace plan_scope {

namespace {

Result<PlanTask> task_from_table(const toml::table& tbl, size_t position) {
    const auto where = "tasks[" + std::to_string(position) + "]";
    PlanTask task;

    auto id = tbl["id"].value<std::string>();
    if (!id || id->empty()) {
        return make_error<PlanTask>(ErrorCode::InvalidInput, where + ": missing or empty 'id'");
    }
    task.id = *id;
    task.title = tbl["title"].value_or(std::string{});
    task.description = tbl["description"].value_or(std::string{});
    task.acceptance_criteria = tbl["acceptance_criteria"].value_or(std::string{});

    if (auto node = tbl["priority"]; node) {
        auto text = node.value<std::string>();
        auto priority = text ? parse_priority(*text) : std::nullopt;
        if (!priority) {
            return make_error<PlanTask>(ErrorCode::InvalidInput,
                                        where + " ('" + task.id + "'): priority must be P1, P2 or P3");
        }
        task.priority = *priority;
    }

    if (auto node = tbl["status"]; node) {
        auto text = node.value<std::string>();
        auto status = text ? parse_status(*text) : std::nullopt;
        if (!status) {
            return make_error<PlanTask>(ErrorCode::InvalidInput,
                                        where + " ('" + task.id + "'): unknown status");
        }
        task.status = *status;
    }

    if (auto node = tbl["estimated_minutes"]; node) {
        auto minutes = node.value<int64_t>();
        if (!minutes || *minutes < 0
            || *minutes > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
            return make_error<PlanTask>(ErrorCode::InvalidInput,
                                        where + " ('" + task.id + "'): estimated_minutes must be a non-negative integer");
        }
        task.estimated_minutes = static_cast<uint32_t>(*minutes);
    }

    if (auto node = tbl["dependencies"]; node) {
        const auto* deps = node.as_array();
        if (deps == nullptr) {
            return make_error<PlanTask>(ErrorCode::InvalidInput,
                                        where + " ('" + task.id + "'): dependencies must be an array");
        }
        for (const auto& entry : *deps) {
            auto dep = entry.value<std::string>();
            if (!dep) {
                return make_error<PlanTask>(ErrorCode::InvalidInput,
                                            where + " ('" + task.id + "'): dependency ids must be strings");
            }
            task.dependencies.push_back(*dep);
        }
    }

    return task;
}

Result<PlanDocument> from_table(const toml::table& tbl) {
    PlanDocument doc;
    doc.name = tbl["plan"]["name"].value_or(std::string{});

    auto tasks_node = tbl["tasks"];
    if (!tasks_node) return doc;

    const auto* tasks = tasks_node.as_array();
    if (tasks == nullptr) {
        return make_error<PlanDocument>(ErrorCode::InvalidInput, "'tasks' must be an array of tables");
    }

    std::unordered_set<TaskId> seen;
    doc.tasks.reserve(tasks->size());

    for (size_t i = 0; i < tasks->size(); ++i) {
        const auto* entry = tasks->get(i)->as_table();
        if (entry == nullptr) {
            return make_error<PlanDocument>(ErrorCode::InvalidInput,
                                            "tasks[" + std::to_string(i) + "] is not a table");
        }

        auto task = task_from_table(*entry, i);
        if (!task) return task.error();

        if (!seen.insert(task->id).second) {
            return make_error<PlanDocument>(ErrorCode::DuplicateId,
                                            "Duplicate task id '" + task->id + "'");
        }
        doc.tasks.push_back(std::move(task).value());
    }

    return doc;
}

}  // namespace

Result<PlanDocument> parse_plan(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return make_error<PlanDocument>(ErrorCode::Parse,
            std::string{"TOML parse error: "} + std::string{err.description()});
    }
}

Result<PlanDocument> load_plan_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return make_error<PlanDocument>(ErrorCode::NotFound, "Plan file not found: " + path.string());
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return make_error<PlanDocument>(ErrorCode::Parse,
            std::string{"TOML parse error in "} + path.string() + ": " + std::string{err.description()});
    }
}

}  // namespace plan_scope
