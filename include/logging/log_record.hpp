#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace apipipe::logging {

enum class Level { DEBUG, INFO, WARN, ERROR };

/// Fixed-width tag used in text output ("INFO ", "ERROR", ...)
[[nodiscard]] std::string_view level_tag(Level level) noexcept;

/// Upper-case name ("INFO", "WARN", ...)
[[nodiscard]] std::string_view level_name(Level level) noexcept;

/// Case-insensitive; accepts "warning" as an alias of "warn"
[[nodiscard]] std::optional<Level> parse_level(std::string_view name);

/// Identifiers carried by records emitted outside any recording trace
inline constexpr std::string_view kUnsetTraceId = "00000000000000000000000000000000";
inline constexpr std::string_view kUnsetSpanId = "0000000000000000";

using Fields = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief One structured log entry
 *
 * trace_id / span_id are filled by the trace correlation filter; records
 * that bypass it keep the all-zero values.
 */
struct LogRecord {
    Level level = Level::INFO;
    std::string logger;        // Name of the logger the record was emitted on
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::string trace_id{kUnsetTraceId};  // 32 hex chars
    std::string span_id{kUnsetSpanId};    // 16 hex chars
    Fields fields;             // Extra key/value context
};

} // namespace apipipe::logging
