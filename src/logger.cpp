#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <format>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

Logger::Logger(std::string component, const fs::path& logDir, LogLevel level)
    : component_(std::move(component)), logDir_(logDir), level_(level) {
    if (!logDir_.empty()) {
        std::error_code ec;
        fs::create_directories(logDir_, ec);
        if (ec) {
            std::cerr << "Error: Cannot create log directory " << logDir_.string() << ": " << ec.message() << std::endl;
        } else {
            fs::permissions(logDir_, fs::perms::owner_all, fs::perm_options::replace, ec);
        }
        logFile_ = logDir_ / "backup.log";
        errorLogFile_ = logDir_ / "errors.log";
    }
}

Logger Logger::child(const std::string& component) const {
    return Logger(component, logDir_, level_);
}

void Logger::debug(const std::string& message) const { write(LogLevel::Debug, message); }
void Logger::info(const std::string& message) const { write(LogLevel::Info, message); }
void Logger::warning(const std::string& message) const { write(LogLevel::Warning, message); }
void Logger::error(const std::string& message) const { write(LogLevel::Error, message); }

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
    }
    return "UNKNOWN";
}

void Logger::write(LogLevel level, const std::string& message) const {
    if (level < level_) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    std::tm tmNow {};
    localtime_r(&timeT, &tmNow);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tmNow);
    std::string logEntry = std::format("[{}] [{}] {}: {}", timeBuf, component_, levelName(level), message);

    std::lock_guard<std::mutex> lock(mutex_);
    if (level >= LogLevel::Warning) {
        std::cerr << logEntry << std::endl;
    } else {
        std::cout << logEntry << std::endl;
    }

    if (logFile_.empty()) {
        return;
    }
    std::ofstream log(logFile_, std::ios::app);
    if (log.is_open()) {
        log << logEntry << '\n';
    } else {
        std::cerr << "Error: Cannot write to log file: " << logFile_.string() << std::endl;
    }
    if (level == LogLevel::Error) {
        std::ofstream errors(errorLogFile_, std::ios::app);
        if (errors.is_open()) {
            errors << logEntry << '\n';
        } else {
            std::cerr << "Error: Cannot write to error log file: " << errorLogFile_.string() << std::endl;
        }
    }
}
