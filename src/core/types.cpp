/**
 * @file types.cpp
 * @brief Parsing helpers for the core vocabulary types.
 */

#include "core/types.hpp"

#include <array>
#include <cctype>

namespace plan_scope {

std::optional<TaskPriority> parse_priority(std::string_view text) noexcept {
    if (text == "P1" || text == "p1") return TaskPriority::P1;
    if (text == "P2" || text == "p2") return TaskPriority::P2;
    if (text == "P3" || text == "p3") return TaskPriority::P3;
    return std::nullopt;
}

std::optional<TaskStatus> parse_status(std::string_view text) noexcept {
    static constexpr std::array kStatuses{
        TaskStatus::NotStarted, TaskStatus::InProgress, TaskStatus::Blocked,
        TaskStatus::PendingVerification, TaskStatus::Verified,
        TaskStatus::NeedsReCheck, TaskStatus::Failed, TaskStatus::Decomposed
    };
    for (auto status : kStatuses) {
        if (to_string(status) == text) return status;
    }
    return std::nullopt;
}

size_t trimmed_length(std::string_view text) noexcept {
    auto is_space = [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    };
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && is_space(text[begin])) ++begin;
    while (end > begin && is_space(text[end - 1])) --end;
    return end - begin;
}

}  // namespace plan_scope
