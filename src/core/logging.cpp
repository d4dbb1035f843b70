// File: src/core/logging.cpp
#include "core/logging.hpp"
#include "core/errors.hpp"

namespace modelstore {

const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

LogLevel ParseLogLevel(const std::string& str) {
    if (str == "DEBUG") return LogLevel::DEBUG;
    if (str == "INFO") return LogLevel::INFO;
    if (str == "WARNING") return LogLevel::WARNING;
    if (str == "ERROR") return LogLevel::ERROR;
    if (str == "CRITICAL") return LogLevel::CRITICAL;
    throw ValidationError("Unknown log level: " + str +
                          " (expected DEBUG, INFO, WARNING, ERROR or CRITICAL)");
}

Logger::Logger(std::string component, LogLevel level, std::ostream* stream)
    : component_(std::move(component)), level_(level), stream_(stream) {}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::SetStream(std::ostream* stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_ = stream;
}

bool Logger::IsEnabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stream_ != nullptr && level >= level_;
}

void Logger::Log(LogLevel level, const std::string& message) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stream_ == nullptr || level < level_) {
        return;
    }
    (*stream_) << "[" << component_ << "] " << ToString(level) << ": " << message << std::endl;
}

} // namespace modelstore
