/**
 * @file config.hpp
 * @brief PlanScope configuration with TOML deserialization.
 *
 * Only the host concerns are configurable (logging and report output).
 * The heuristic thresholds of the analysis engine are fixed.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/logger.hpp"
#include "core/result.hpp"

namespace plan_scope {

enum class LogSinkKind : uint8_t {
    Stdout,
    Stderr,
    File,
    None
};

[[nodiscard]] constexpr std::string_view to_string(LogSinkKind kind) noexcept {
    switch (kind) {
        case LogSinkKind::Stdout: return "stdout";
        case LogSinkKind::Stderr: return "stderr";
        case LogSinkKind::File:   return "file";
        case LogSinkKind::None:   return "none";
    }
    return "unknown";
}

enum class ReportFormat : uint8_t {
    Text,
    Json
};

struct LogConfig {
    LogLevel level = LogLevel::Info;
    LogSinkKind sink = LogSinkKind::Stderr;
    std::filesystem::path dir = "./logs";
    uint32_t max_file_size_mb = 10;
    uint32_t rotate_count = 3;
};

struct ReportConfig {
    ReportFormat format = ReportFormat::Text;
    std::vector<std::string> sections = {
        "risks", "graph", "decompositions", "schedule", "health"
    };
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    LogConfig log;
    ReportConfig report;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults. Unknown enumerated values are rejected
 * with ErrorCode::InvalidInput.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Parse configuration from TOML text.
 */
Result<Config> parse_config(std::string_view toml_text);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace plan_scope
