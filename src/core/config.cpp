/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <array>

namespace plan_scope {

namespace {

constexpr std::array kKnownSections{
    std::string_view{"risks"}, std::string_view{"graph"},
    std::string_view{"decompositions"}, std::string_view{"schedule"},
    std::string_view{"health"}
};

Result<Config> from_table(const toml::table& tbl) {
    Config config;

    // [log]
    if (auto log = tbl["log"]; log.is_table()) {
        auto level_name = log["level"].value_or(std::string{"info"});
        auto level = parse_log_level(level_name);
        if (!level) {
            return make_error<Config>(ErrorCode::InvalidInput,
                                      "Unknown log level: " + level_name);
        }
        config.log.level = *level;

        auto sink_name = log["sink"].value_or(std::string{"stderr"});
        if (sink_name == "stdout") {
            config.log.sink = LogSinkKind::Stdout;
        } else if (sink_name == "stderr") {
            config.log.sink = LogSinkKind::Stderr;
        } else if (sink_name == "file") {
            config.log.sink = LogSinkKind::File;
        } else if (sink_name == "none") {
            config.log.sink = LogSinkKind::None;
        } else {
            return make_error<Config>(ErrorCode::InvalidInput,
                                      "Unknown log sink: " + sink_name);
        }

        config.log.dir = log["dir"].value_or(std::string{"./logs"});
        config.log.max_file_size_mb = static_cast<uint32_t>(
            log["max_file_size_mb"].value_or(int64_t{10}));
        config.log.rotate_count = static_cast<uint32_t>(
            log["rotate_count"].value_or(int64_t{3}));
    }

    // [report]
    if (auto report = tbl["report"]; report.is_table()) {
        auto format_name = report["format"].value_or(std::string{"text"});
        if (format_name == "text") {
            config.report.format = ReportFormat::Text;
        } else if (format_name == "json") {
            config.report.format = ReportFormat::Json;
        } else {
            return make_error<Config>(ErrorCode::InvalidInput,
                                      "Unknown report format: " + format_name);
        }

        if (auto* sections = report["sections"].as_array()) {
            config.report.sections.clear();
            for (const auto& entry : *sections) {
                auto name = entry.value<std::string>();
                if (!name) {
                    return make_error<Config>(ErrorCode::InvalidInput,
                                              "report.sections must contain strings");
                }
                if (std::find(kKnownSections.begin(), kKnownSections.end(), *name)
                        == kKnownSections.end()) {
                    return make_error<Config>(ErrorCode::InvalidInput,
                                              "Unknown report section: " + *name);
                }
                config.report.sections.push_back(*name);
            }
        }
    }

    return config;
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return make_error<Config>(ErrorCode::NotFound,
                                  "Configuration file not found: " + path.string());
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return make_error<Config>(ErrorCode::Parse,
            std::string{"TOML parse error: "} + std::string{err.description()});
    }
}

Result<Config> parse_config(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return make_error<Config>(ErrorCode::Parse,
            std::string{"TOML parse error: "} + std::string{err.description()});
    }
}

Config default_config() {
    return Config{};
}

}  // namespace plan_scope
