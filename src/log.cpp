#include "downqueue/log.hpp"
#include "downqueue/errors.hpp"

#include <memory>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace downqueue {

namespace {

spdlog::level::level_enum parseLevel(const std::string& text) {
    if (text == "trace") return spdlog::level::trace;
    if (text == "debug") return spdlog::level::debug;
    if (text == "info") return spdlog::level::info;
    if (text == "warn" || text == "warning") return spdlog::level::warn;
    if (text == "error") return spdlog::level::err;
    if (text == "off") return spdlog::level::off;
    throw ConfigError("Unknown log level: " + text);
}

} // namespace

void initLogging(const LogOptions& options) {
    const auto level = parseLevel(options.level);
    spdlog::drop("downqueue");

    std::shared_ptr<spdlog::logger> logger;
    if (options.file.empty()) {
        // stdout 留给进度面板
        logger = spdlog::stderr_color_mt("downqueue");
    } else {
        try {
            logger = spdlog::basic_logger_mt("downqueue", options.file);
        } catch (const spdlog::spdlog_ex& ex) {
            throw ConfigError("Cannot open log file " + options.file + ": " + ex.what());
        }
    }

    logger->set_level(level);
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(std::move(logger));
}

} // namespace downqueue
