#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace ctxgraph {

using LoggerPtr = std::shared_ptr<spdlog::logger>;

/// Colored stdout logger. Not registered with spdlog's global registry,
/// so any number of loggers may share a name.
LoggerPtr makeLogger(const std::string& name,
                     spdlog::level::level_enum level = spdlog::level::info);

/// Logger that discards everything. Default for components constructed
/// without an explicit logger.
LoggerPtr makeNullLogger(const std::string& name);

/// Returns `logger` if set, otherwise a null logger named `name`.
LoggerPtr loggerOrNull(LoggerPtr logger, const std::string& name);

} // namespace ctxgraph
