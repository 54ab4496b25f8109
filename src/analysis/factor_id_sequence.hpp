/**
 * @file factor_id_sequence.hpp
 * @brief Monotonic identifier source for risk factors.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace plan_scope {

/**
 * @brief Hands out `<prefix>-<n>` identifiers with n = 1, 2, ...
 *
 * Identifiers only serve traceability inside a report; no algorithm
 * depends on them. One sequence is owned per PlanningEngine, and reset()
 * exists for test harnesses.
 */
class FactorIdSequence {
public:
    [[nodiscard]] std::string next(std::string_view prefix) {
        ++counter_;
        std::string id{prefix};
        id += '-';
        id += std::to_string(counter_);
        return id;
    }

    void reset() noexcept { counter_ = 0; }
    [[nodiscard]] uint64_t issued() const noexcept { return counter_; }

private:
    uint64_t counter_{0};
};

}  // namespace plan_scope
