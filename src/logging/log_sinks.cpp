#include "logging/log_sinks.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <stdexcept>

namespace apipipe::logging {

namespace {

std::string format_text(const LogRecord& record) {
    std::string line = std::format("{} [{}] [trace_id={} span_id={}] {}: {}",
        utils::format_clock_time(record.timestamp),
        level_tag(record.level),
        record.trace_id,
        record.span_id,
        record.logger.empty() ? "root" : record.logger,
        record.message);
    for (const auto& [key, value] : record.fields) {
        line += ' ';
        line += key;
        line += '=';
        line += value;
    }
    return line;
}

std::string format_json(const LogRecord& record) {
    nlohmann::json j;
    j["timestamp"] = utils::format_timestamp(record.timestamp);
    j["level"] = level_name(record.level);
    j["logger"] = record.logger.empty() ? "root" : record.logger;
    j["message"] = record.message;
    j["trace_id"] = record.trace_id;
    j["span_id"] = record.span_id;
    for (const auto& [key, value] : record.fields) {
        // Reserved keys win over extra fields
        if (!j.contains(key)) j[key] = value;
    }
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // anonymous namespace

std::optional<LogFormat> parse_format(std::string_view name) {
    const std::string lower = utils::to_lower(name);
    if (lower == "text") return LogFormat::TEXT;
    if (lower == "json") return LogFormat::JSON;
    return std::nullopt;
}

std::string format_record(const LogRecord& record, LogFormat format) {
    return format == LogFormat::JSON ? format_json(record) : format_text(record);
}

void StreamSink::write(const LogRecord& record) {
    const auto line = format_record(record, format_);
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << '\n';
}

FileSink::FileSink(const std::string& path, LogFormat format)
    : out_(path, std::ios::app), format_(format) {
    if (!out_.is_open()) {
        throw std::runtime_error(std::format("Cannot open log file: {}", path));
    }
}

void FileSink::write(const LogRecord& record) {
    const auto line = format_record(record, format_);
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << '\n';
    out_.flush();
}

} // namespace apipipe::logging
