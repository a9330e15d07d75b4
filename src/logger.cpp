#include "ocl_gaiasync/logger.h"
#include "ocl_gaiasync/types.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace ocl {
namespace gaiasync {

namespace {

const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::SILENT:  return "SILENT";
    }
    return "INFO";
}

} // anonymous namespace

LogLevel stringToLogLevel(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "silent") return LogLevel::SILENT;

    throw SyncException(ErrorCode::INVALID_PARAMS, "Unknown log level: " + str);
}

Logger::Logger(LogLevel level) : level_(level), console_(true) {}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_stream_.is_open()) {
        log_stream_.close();
    }
    if (path.empty()) {
        return;
    }
    log_stream_.open(path, std::ios::app);
    if (!log_stream_.is_open()) {
        throw SyncException(ErrorCode::INVALID_PARAMS, "Cannot open log file: " + path);
    }
}

void Logger::setConsole(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_ = enabled;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level == LogLevel::SILENT || level < level_) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm local_time{};
    localtime_r(&time, &local_time);

    std::ostringstream oss;
    oss << "[" << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S") << "] ";
    oss << "[" << levelName(level) << "] " << message;

    std::string log_line = oss.str();

    if (console_) {
        std::cerr << log_line << std::endl;
    }

    if (log_stream_.is_open()) {
        log_stream_ << log_line << std::endl;
        log_stream_.flush();
    }
}

} // namespace gaiasync
} // namespace ocl
