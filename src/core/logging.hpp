// File: src/core/logging.hpp
#pragma once

#include <cstdint>
#include <iostream>
#include <mutex>
#include <string>

namespace modelstore {

// LogLevel: verbosity threshold, ordered from most to least verbose
enum class LogLevel : uint8_t {
    DEBUG = 10,
    INFO = 20,
    WARNING = 30,
    ERROR = 40,
    CRITICAL = 50,
};

// Convert LogLevel to its name (DEBUG, INFO, ...)
const char* ToString(LogLevel level);

// Parse LogLevel from its name
// @throws ValidationError for unknown names
LogLevel ParseLogLevel(const std::string& str);

/// Component logger writing "[Component] LEVEL: message" lines to a stream
///
/// Messages below the configured level are dropped. The stream is not
/// owned; it defaults to std::cerr and may be redirected (e.g. by tests).
class Logger {
public:
    explicit Logger(std::string component,
                    LogLevel level = LogLevel::WARNING,
                    std::ostream* stream = &std::cerr);

    void SetLevel(LogLevel level);
    LogLevel level() const;

    void SetStream(std::ostream* stream);

    const std::string& component() const { return component_; }

    bool IsEnabled(LogLevel level) const;

    void Log(LogLevel level, const std::string& message) const;

    void Debug(const std::string& message) const { Log(LogLevel::DEBUG, message); }
    void Info(const std::string& message) const { Log(LogLevel::INFO, message); }
    void Warning(const std::string& message) const { Log(LogLevel::WARNING, message); }
    void Error(const std::string& message) const { Log(LogLevel::ERROR, message); }

private:
    std::string component_;
    LogLevel level_;
    std::ostream* stream_;
    mutable std::mutex mutex_;
};

} // namespace modelstore
