#pragma once

#include <fstream>
#include <mutex>
#include <string>

namespace ocl {
namespace gaiasync {

/**
 * Log severity, lowest first
 */
enum class LogLevel { DEBUG = 0, INFO, WARNING, ERROR, SILENT };

/**
 * Parse "debug", "info", "warning"/"warn", "error" or "silent"
 * @throws SyncException (INVALID_PARAMS) for unknown names
 */
LogLevel stringToLogLevel(const std::string& str);

/**
 * Timestamped line logger shared by all synchronization components.
 *
 * Lines look like "[2024-01-31 12:00:00] [INFO] message". Messages below the
 * configured level are dropped. Console output goes to stderr; an optional
 * log file receives the same lines in append mode. Safe to use from several
 * worker threads.
 */
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::WARNING);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void setLevel(LogLevel level);
    LogLevel level() const;

    /**
     * Also write log lines to a file (appended)
     * @throws SyncException (INVALID_PARAMS) if the file cannot be opened
     */
    void setLogFile(const std::string& path);

    /**
     * Enable or disable console output (enabled by default)
     */
    void setConsole(bool enabled);

    void log(LogLevel level, const std::string& message);

    void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    void info(const std::string& message) { log(LogLevel::INFO, message); }
    void warn(const std::string& message) { log(LogLevel::WARNING, message); }
    void error(const std::string& message) { log(LogLevel::ERROR, message); }

private:
    mutable std::mutex mutex_;
    LogLevel level_;
    bool console_;
    std::ofstream log_stream_;
};

} // namespace gaiasync
} // namespace ocl
