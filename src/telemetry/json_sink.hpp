/**
 * @file json_sink.hpp
 * @brief Log sinks: rotating NDJSON files and stdout.
 */

#pragma once

#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <string>

namespace hvac_exporter {

/**
 * @brief Writes NDJSON to `<log_dir>/<prefix>.ndjson`.
 *
 * When the file passes max_file_size_mb it is shifted to `<prefix>.1.ndjson`
 * (older files move up one index) and a fresh file is opened. At most
 * `max_files` rotated files are kept.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] std::filesystem::path current_path() const;

    /// False when the directory or file could not be created; writes are dropped.
    [[nodiscard]] bool is_open() const;

private:
    [[nodiscard]] std::filesystem::path rotated_path(uint32_t index) const;
    void open_current();
    void rotate_if_needed();

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stdout; the default when no log directory is configured.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output. Used by tests.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

}  // namespace hvac_exporter
