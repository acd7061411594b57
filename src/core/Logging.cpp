#include "core/Logging.hpp"
#include <memory>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace efb::core {

void setupLogging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (!config.quiet) {
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_level(config.verbose ? spdlog::level::debug : spdlog::level::info);
        sinks.push_back(consoleSink);
    }

    if (!config.logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.logFile, true);
        fileSink->set_level(spdlog::level::trace);
        sinks.push_back(fileSink);
    }

    auto logger = std::make_shared<spdlog::logger>(config.loggerName, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace);
    spdlog::set_default_logger(logger);

    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
}

} // namespace efb::core
