/**
 * @file log_sinks.cpp
 * @brief Log sink implementations.
 */

#include "telemetry/log_sinks.hpp"

#include <iostream>
#include <system_error>

namespace plan_scope {

// ── NdjsonFileSink ───────────────────────────

NdjsonFileSink::NdjsonFileSink(const std::filesystem::path& log_dir,
                               const std::string& prefix,
                               uint32_t max_file_size_mb,
                               uint32_t max_files)
    : log_dir_(log_dir)
    , prefix_(prefix)
    , max_file_size_bytes_(static_cast<uint64_t>(max_file_size_mb) * 1024 * 1024)
    , max_files_(max_files) {
    std::error_code ec;
    std::filesystem::create_directories(log_dir_, ec);

    auto path = active_path();
    if (std::filesystem::exists(path, ec)) {
        current_size_ = std::filesystem::file_size(path, ec);
        if (ec) current_size_ = 0;
    }
    current_file_.open(path, std::ios::app);
}

NdjsonFileSink::~NdjsonFileSink() {
    if (current_file_.is_open()) {
        current_file_.flush();
        current_file_.close();
    }
}

std::filesystem::path NdjsonFileSink::active_path() const {
    return log_dir_ / (prefix_ + ".ndjson");
}

std::filesystem::path NdjsonFileSink::generation_path(uint32_t generation) const {
    return log_dir_ / (prefix_ + "." + std::to_string(generation) + ".ndjson");
}

void NdjsonFileSink::write(std::string_view json_line) {
    rotate_if_needed();
    if (current_file_.is_open()) {
        current_file_ << json_line << '\n';
        current_size_ += json_line.size() + 1;
    }
}

void NdjsonFileSink::flush() {
    if (current_file_.is_open()) {
        current_file_.flush();
    }
}

void NdjsonFileSink::rotate_if_needed() {
    if (current_size_ < max_file_size_bytes_) return;

    current_file_.close();

    std::error_code ec;
    if (max_files_ == 0) {
        std::filesystem::remove(active_path(), ec);
    } else {
        std::filesystem::remove(generation_path(max_files_), ec);
        for (uint32_t gen = max_files_; gen > 1; --gen) {
            auto older = generation_path(gen - 1);
            if (std::filesystem::exists(older, ec)) {
                std::filesystem::rename(older, generation_path(gen), ec);
            }
        }
        std::filesystem::rename(active_path(), generation_path(1), ec);
    }

    current_file_.open(active_path(), std::ios::trunc);
    current_size_ = 0;
}

// ── StdoutSink ───────────────────────────────

void StdoutSink::write(std::string_view json_line) {
    std::cout << json_line << '\n';
}

void StdoutSink::flush() {
    std::cout.flush();
}

// ── StderrSink ───────────────────────────────

void StderrSink::write(std::string_view json_line) {
    std::cerr << json_line << '\n';
}

void StderrSink::flush() {
    std::cerr.flush();
}

// ── Factory ──────────────────────────────────

std::unique_ptr<ILogSink> make_log_sink(const LogConfig& config, const std::string& prefix) {
    switch (config.sink) {
        case LogSinkKind::Stdout:
            return std::make_unique<StdoutSink>();
        case LogSinkKind::Stderr:
            return std::make_unique<StderrSink>();
        case LogSinkKind::File:
            return std::make_unique<NdjsonFileSink>(config.dir, prefix,
                                                    config.max_file_size_mb,
                                                    config.rotate_count);
        case LogSinkKind::None:
            break;
    }
    return std::make_unique<NullSink>();
}

}  // namespace plan_scope
