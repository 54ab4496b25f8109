/**
 * @file log_sinks.hpp
 * @brief Log sink implementations: NDJSON files with rotation, standard
 *        streams, in-memory capture and a discarding sink.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace plan_scope {

/**
 * @brief Appends NDJSON lines to `<dir>/<prefix>.ndjson`.
 *
 * Once the active file grows past the size limit it is renamed to
 * `<prefix>.1.ndjson` (older generations shift up to `max_files`) and a
 * fresh file is opened.
 */
class NdjsonFileSink : public ILogSink {
public:
    NdjsonFileSink(const std::filesystem::path& log_dir,
                   const std::string& prefix,
                   uint32_t max_file_size_mb = 10,
                   uint32_t max_files = 3);
    ~NdjsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] std::filesystem::path active_path() const;

    /// Byte limit override, used by tests to force rotation quickly.
    void set_max_bytes(uint64_t bytes) noexcept { max_file_size_bytes_ = bytes; }

private:
    void rotate_if_needed();
    [[nodiscard]] std::filesystem::path generation_path(uint32_t generation) const;

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

class StderrSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output. Used by benchmarks and quiet runs.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

/**
 * @brief Keeps every line in memory. The line buffer is shared so a test can
 *        hold on to it after handing the sink to a Logger.
 */
class MemorySink : public ILogSink {
public:
    MemorySink() : lines_(std::make_shared<std::vector<std::string>>()) {}

    void write(std::string_view json_line) override { lines_->emplace_back(json_line); }
    void flush() override {}

    [[nodiscard]] std::shared_ptr<const std::vector<std::string>> lines() const { return lines_; }

private:
    std::shared_ptr<std::vector<std::string>> lines_;
};

/**
 * @brief Build the sink selected by the `[log]` configuration section.
 */
std::unique_ptr<ILogSink> make_log_sink(const LogConfig& config, const std::string& prefix);

}  // namespace plan_scope
