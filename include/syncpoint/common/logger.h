#pragma once

#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace syncpoint {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    NONE
};

// Accepts "debug", "info", "warning", "error" and "none" in any case.
std::optional<LogLevel> ParseLogLevel(std::string_view name);

class Logger {
public:
    static Logger& Instance() {
        static Logger instance;
        return instance;
    }

    void SetLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
    }

    LogLevel GetLevel() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

    // Mirror every message into a file besides stderr. An empty path closes it.
    bool SetOutputFile(const std::filesystem::path& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        file_.close();
        if (path.empty()) {
            return true;
        }
        file_.open(path, std::ios::app);
        return file_.is_open();
    }

    void Debug(const std::string& message) {
        Log(LogLevel::DEBUG, "[DEBUG] ", message);
    }

    void Info(const std::string& message) {
        Log(LogLevel::INFO, "[INFO] ", message);
    }

    void Warning(const std::string& message) {
        Log(LogLevel::WARNING, "[WARNING] ", message);
    }

    void Error(const std::string& message) {
        Log(LogLevel::ERROR, "[ERROR] ", message);
    }

private:
    Logger() : level_(LogLevel::INFO) {}

    void Log(LogLevel msg_level, const char* prefix, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (msg_level < level_) {
            return;
        }

        std::cerr << prefix << message << std::endl;
        if (file_.is_open()) {
            file_ << prefix << message << std::endl;
        }
    }

    LogLevel level_;
    std::ofstream file_;
    mutable std::mutex mutex_;
};

// Convenience macros
#define LOG_DEBUG(msg) syncpoint::Logger::Instance().Debug(msg)
#define LOG_INFO(msg) syncpoint::Logger::Instance().Info(msg)
#define LOG_WARNING(msg) syncpoint::Logger::Instance().Warning(msg)
#define LOG_ERROR(msg) syncpoint::Logger::Instance().Error(msg)

}  // namespace syncpoint
