#include "logging/logger.hpp"
#include "logging/log_sinks.hpp"
#include "core/utils.hpp"

#include <iostream>

namespace apipipe::logging {

// ============================================================================
// Level helpers
// ============================================================================

std::string_view level_tag(Level level) noexcept {
    switch (level) {
        case Level::DEBUG: return "DEBUG";
        case Level::INFO:  return "INFO ";
        case Level::WARN:  return "WARN ";
        case Level::ERROR: return "ERROR";
    }
    return "?????";
}

std::string_view level_name(Level level) noexcept {
    switch (level) {
        case Level::DEBUG: return "DEBUG";
        case Level::INFO:  return "INFO";
        case Level::WARN:  return "WARN";
        case Level::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

std::optional<Level> parse_level(std::string_view name) {
    const std::string lower = utils::to_lower(name);
    if (lower == "debug") return Level::DEBUG;
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return std::nullopt;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger(std::string name, Logger* parent)
    : name_(std::move(name)), parent_(parent) {}

void Logger::set_level(Level level) {
    level_.store(static_cast<int>(level), std::memory_order_relaxed);
}

void Logger::clear_level() {
    level_.store(kInheritLevel, std::memory_order_relaxed);
}

Level Logger::effective_level() const {
    for (const Logger* l = this; l != nullptr; l = l->parent_) {
        const int v = l->level_.load(std::memory_order_relaxed);
        if (v != kInheritLevel) return static_cast<Level>(v);
    }
    return Level::INFO;
}

bool Logger::is_enabled(Level level) const {
    return static_cast<int>(level) >= static_cast<int>(effective_level());
}

void Logger::add_filter(std::shared_ptr<ILogFilter> filter) {
    std::unique_lock lock(mutex_);
    filters_.push_back(std::move(filter));
}

void Logger::add_sink(std::shared_ptr<ILogSink> sink) {
    std::unique_lock lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::reset() {
    clear_level();
    std::unique_lock lock(mutex_);
    filters_.clear();
    sinks_.clear();
}

bool Logger::apply_filters(LogRecord& record) const {
    std::shared_lock lock(mutex_);
    for (const auto& f : filters_) {
        if (!f->filter(record)) return false;
    }
    return true;
}

void Logger::write_to_sinks(const LogRecord& record) const {
    std::shared_lock lock(mutex_);
    for (const auto& sink : sinks_) {
        try {
            sink->write(record);
        } catch (const std::exception& e) {
            // A failing sink must not take the caller down with it
            std::cerr << "log sink failure (" << name_ << "): " << e.what() << '\n';
        }
    }
}

void Logger::log(Level level, std::string message, Fields fields) {
    if (!is_enabled(level)) return;

    LogRecord record;
    record.level = level;
    record.logger = name_;
    record.message = std::move(message);
    record.timestamp = std::chrono::system_clock::now();
    record.fields = std::move(fields);

    for (const Logger* l = this; l != nullptr; l = l->parent_) {
        if (!l->apply_filters(record)) return;
    }
    for (const Logger* l = this; l != nullptr; l = l->parent_) {
        l->write_to_sinks(record);
    }
}

// ============================================================================
// LoggerRegistry
// ============================================================================

LoggerRegistry& LoggerRegistry::instance() {
    static LoggerRegistry registry;
    return registry;
}

LoggerRegistry::LoggerRegistry()
    : root_(new Logger("", nullptr)) {
    root_->set_level(Level::INFO);
    root_->add_sink(std::make_shared<StreamSink>(std::cerr, LogFormat::TEXT));
}

Logger& LoggerRegistry::get(std::string_view name) {
    if (name.empty()) return *root_;

    std::lock_guard<std::mutex> lock(mutex_);
    Logger* parent = root_.get();
    size_t pos = 0;
    while (true) {
        const size_t dot = name.find('.', pos);
        const std::string prefix(name.substr(0, dot));
        auto it = loggers_.find(prefix);
        if (it == loggers_.end()) {
            it = loggers_.emplace(prefix,
                std::unique_ptr<Logger>(new Logger(prefix, parent))).first;
        }
        parent = it->second.get();
        if (dot == std::string_view::npos) break;
        pos = dot + 1;
    }
    return *parent;
}

void LoggerRegistry::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    root_->reset();
    root_->set_level(Level::INFO);
    for (auto& [name, logger] : loggers_) {
        logger->reset();
    }
}

} // namespace apipipe::logging
