#pragma once

#include <ostream>
#include <string>

namespace netclear {

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error,
    Off
};

/// Process-wide threshold; messages below it are dropped. Default: Warn.
void setLogLevel(LogLevel level);
LogLevel logLevel();

/// Redirect log output. Pass nullptr to restore the default (std::clog).
/// The stream must outlive all logging calls made while it is installed.
void setLogStream(std::ostream* os);

bool logEnabled(LogLevel level);

void logDebug(const std::string& msg);
void logInfo(const std::string& msg);
void logWarn(const std::string& msg);
void logError(const std::string& msg);

/// Parse "debug", "info", "warn", "error" or "off". Throws std::invalid_argument.
LogLevel parseLogLevel(const std::string& name);

} // namespace netclear
