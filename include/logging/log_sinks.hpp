#pragma once

#include "logging/logger.hpp"

#include <fstream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace apipipe::logging {

enum class LogFormat { TEXT, JSON };

[[nodiscard]] std::optional<LogFormat> parse_format(std::string_view name);

/**
 * @brief Render a record as a single line (no trailing newline)
 *
 * TEXT: "12:00:01.234 [INFO ] [trace_id=... span_id=...] logger: message k=v"
 * JSON: {"timestamp":...,"level":...,"logger":...,"message":...,
 *        "trace_id":...,"span_id":..., <fields>}
 */
[[nodiscard]] std::string format_record(const LogRecord& record, LogFormat format);

/**
 * @brief Writes to an existing stream (stderr by default)
 */
class StreamSink final : public ILogSink {
public:
    explicit StreamSink(std::ostream& out, LogFormat format = LogFormat::TEXT)
        : out_(out), format_(format) {}

    void write(const LogRecord& record) override;

private:
    std::ostream& out_;
    const LogFormat format_;
    std::mutex mutex_;
};

/**
 * @brief Appends to a file, flushing each line
 */
class FileSink final : public ILogSink {
public:
    /// @throws std::runtime_error if the file cannot be opened
    FileSink(const std::string& path, LogFormat format = LogFormat::TEXT);

    void write(const LogRecord& record) override;

private:
    std::ofstream out_;
    const LogFormat format_;
    std::mutex mutex_;
};

} // namespace apipipe::logging
