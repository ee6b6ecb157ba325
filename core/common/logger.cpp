#include "common/logger.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace ctxgraph {

LoggerPtr makeLogger(const std::string& name, spdlog::level::level_enum level) {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
    logger->set_level(level);
    return logger;
}

LoggerPtr makeNullLogger(const std::string& name) {
    auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
    logger->set_level(spdlog::level::off);
    return logger;
}

LoggerPtr loggerOrNull(LoggerPtr logger, const std::string& name) {
    if (logger) return logger;
    return makeNullLogger(name);
}

} // namespace ctxgraph
