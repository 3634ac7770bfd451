// File: Logger.hpp
// Description: Provides a thread-safe, levelled logging facility that writes
//              messages to a log file and mirrors them to the console.

#pragma once

#include <mutex>
#include <string>

namespace compliance {

enum class LogLevel { Info, Warn, Error };

class Logger {
public:
    static Logger& instance();

    // Until initialize() succeeds every call below is a no-op.
    void initialize(const std::string& logFilePath, bool mirrorToConsole = true);
    bool initialized() const;

    void log(const std::string& message) { write(LogLevel::Info, message); }
    void warn(const std::string& message) { write(LogLevel::Warn, message); }
    void error(const std::string& message) { write(LogLevel::Error, message); }
    void write(LogLevel level, const std::string& message);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex m_mutex;
    std::string m_logFilePath;
    bool m_initialized{false};
    bool m_mirrorToConsole{true};
    struct Impl;
    Impl* m_impl{nullptr};
};

}  // namespace compliance
