/**
 * @file numeric.hpp
 * @brief Small rounding and formatting helpers shared by the analyzers.
 */

#pragma once

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>

namespace plan_scope::numeric {

/// Round half up, then clamp into [lo, hi].
[[nodiscard]] inline int round_clamped(double value, int lo = 0, int hi = 100) {
    if (!std::isfinite(value)) return lo;
    auto rounded = static_cast<int>(std::floor(value + 0.5));
    return std::clamp(rounded, lo, hi);
}

/// Round to one decimal place (half up).
[[nodiscard]] inline double round_tenths(double value) {
    return std::floor(value * 10.0 + 0.5) / 10.0;
}

[[nodiscard]] inline std::string fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

[[nodiscard]] inline double ratio(size_t part, size_t whole) {
    return whole == 0 ? 0.0 : static_cast<double>(part) / static_cast<double>(whole);
}

}  // namespace plan_scope::numeric
