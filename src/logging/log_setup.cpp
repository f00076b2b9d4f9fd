#include "logging/log_setup.hpp"
#include "core/error.hpp"
#include "logging/log_sinks.hpp"
#include "tracing/trace_correlator.hpp"

#include <format>
#include <iostream>

namespace apipipe::logging {

void configure_logging(const LoggingConfig& config) {
    const auto level = parse_level(config.level);
    if (!level) throw ConfigurationError(std::format("Unknown log level '{}'", config.level));
    const auto format = parse_format(config.format);
    if (!format) throw ConfigurationError(std::format("Unknown log format '{}'", config.format));

    auto& registry = LoggerRegistry::instance();
    registry.reset();

    auto& root = registry.root();
    root.set_level(*level);
    root.add_sink(std::make_shared<StreamSink>(std::cerr, *format));
    if (!config.file.empty()) {
        root.add_sink(std::make_shared<FileSink>(config.file, *format));
    }

    install_trace_correlation(config.app_logger);
}

} // namespace apipipe::logging
