#include "util/logging.hpp"

#include <ctime>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace netclear {

namespace {

std::mutex log_mutex;
LogLevel current_level = LogLevel::Warn;
std::ostream* current_stream = nullptr;

std::string timestampNow() {
    char buf[64];
    std::time_t t = std::time(nullptr);
    std::tm tmv;
#ifdef _WIN32
    localtime_s(&tmv, &t);
#else
    localtime_r(&t, &tmv);
#endif
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmv);
    return std::string(buf);
}

const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "?";
}

void logCommon(LogLevel level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < current_level) return;
    std::ostream& os = current_stream ? *current_stream : std::clog;
    os << "[" << timestampNow() << "][" << levelName(level) << "] " << msg << std::endl;
}

} // namespace

void setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    current_level = level;
}

LogLevel logLevel() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return current_level;
}

void setLogStream(std::ostream* os) {
    std::lock_guard<std::mutex> lock(log_mutex);
    current_stream = os;
}

bool logEnabled(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    return level != LogLevel::Off && level >= current_level;
}

void logDebug(const std::string& msg) { logCommon(LogLevel::Debug, msg); }
void logInfo(const std::string& msg)  { logCommon(LogLevel::Info, msg); }
void logWarn(const std::string& msg)  { logCommon(LogLevel::Warn, msg); }
void logError(const std::string& msg) { logCommon(LogLevel::Error, msg); }

LogLevel parseLogLevel(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info")  return LogLevel::Info;
    if (name == "warn")  return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "off")   return LogLevel::Off;
    throw std::invalid_argument("Unknown log level: " + name);
}

} // namespace netclear
