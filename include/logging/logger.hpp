#pragma once

#include "logging/log_record.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace apipipe::logging {

/**
 * @brief Mutates or drops records before they reach any sink
 *
 * Return false to drop the record.
 */
class ILogFilter {
public:
    virtual ~ILogFilter() = default;
    virtual bool filter(LogRecord& record) = 0;
};

/**
 * @brief Output destination for records (stderr, file, test capture)
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(const LogRecord& record) = 0;
};

/**
 * @brief Named logger in a dot-separated hierarchy
 *
 * A record emitted on "api_pipeline.server" passes through the filters of
 * "api_pipeline.server", "api_pipeline" and the root logger (in that
 * order), then is written to the sinks of each of them. Filters and sinks
 * installed on an ancestor therefore apply to every descendant.
 *
 * Thread-safe: emission takes shared locks only.
 */
class Logger {
public:
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] Logger* parent() const noexcept { return parent_; }

    /// Threshold for this logger; descendants without their own inherit it
    void set_level(Level level);
    void clear_level();
    [[nodiscard]] Level effective_level() const;
    [[nodiscard]] bool is_enabled(Level level) const;

    void add_filter(std::shared_ptr<ILogFilter> filter);
    void add_sink(std::shared_ptr<ILogSink> sink);

    /// Drop level, filters and sinks
    void reset();

    void log(Level level, std::string message, Fields fields = {});

    void debug(std::string message, Fields fields = {}) { log(Level::DEBUG, std::move(message), std::move(fields)); }
    void info(std::string message, Fields fields = {})  { log(Level::INFO, std::move(message), std::move(fields)); }
    void warn(std::string message, Fields fields = {})  { log(Level::WARN, std::move(message), std::move(fields)); }
    void error(std::string message, Fields fields = {}) { log(Level::ERROR, std::move(message), std::move(fields)); }

private:
    friend class LoggerRegistry;
    Logger(std::string name, Logger* parent);

    [[nodiscard]] bool apply_filters(LogRecord& record) const;
    void write_to_sinks(const LogRecord& record) const;

    static constexpr int kInheritLevel = -1;

    const std::string name_;
    Logger* const parent_;
    std::atomic<int> level_{kInheritLevel};

    mutable std::shared_mutex mutex_;
    std::vector<std::shared_ptr<ILogFilter>> filters_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;
};

/**
 * @brief Process-wide owner of all loggers
 *
 * Loggers live as long as the registry, so references returned by get()
 * stay valid. The root logger starts at INFO with a text sink on stderr.
 */
class LoggerRegistry {
public:
    static LoggerRegistry& instance();

    [[nodiscard]] Logger& root() noexcept { return *root_; }

    /// Get or create; "" is the root. Missing ancestors are created too.
    [[nodiscard]] Logger& get(std::string_view name);

    /// Reset every logger (root back to INFO, no filters, no sinks)
    void reset();

private:
    LoggerRegistry();

    std::mutex mutex_;
    std::unique_ptr<Logger> root_;
    std::unordered_map<std::string, std::unique_ptr<Logger>> loggers_;
};

[[nodiscard]] inline Logger& get_logger(std::string_view name = {}) {
    return LoggerRegistry::instance().get(name);
}

} // namespace apipipe::logging
