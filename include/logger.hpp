/**
 * @file logger.hpp
 * @brief Timestamped console and file logging for VaultKeeper tools.
 *
 * Every line is printed to the console (errors to stderr) and appended to
 * backup.log in the configured log directory; errors are duplicated into errors.log.
 * Callers must never pass secrets to the logger.
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <filesystem>
#include <mutex>
#include <string>

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/**
 * @brief Component-prefixed logger writing to the console and to log files.
 */
class Logger {
public:
    /**
     * @brief Constructs a logger.
     *
     * @param component Prefix shown on every line (e.g. "db-backup").
     * @param logDir Directory for backup.log and errors.log. Empty means console only.
     * @param level Minimum level emitted.
     */
    Logger(std::string component, const std::filesystem::path& logDir, LogLevel level = LogLevel::Info);

    void debug(const std::string& message) const;
    void info(const std::string& message) const;
    void warning(const std::string& message) const;
    void error(const std::string& message) const;

    /**
     * @brief Same log files and level under a different component prefix.
     */
    Logger child(const std::string& component) const;

    const std::string& component() const { return component_; }
    const std::filesystem::path& logFile() const { return logFile_; }

private:
    void write(LogLevel level, const std::string& message) const;
    static const char* levelName(LogLevel level);

    std::string component_;             ///< Line prefix.
    std::filesystem::path logDir_;      ///< Log directory (may be empty).
    std::filesystem::path logFile_;     ///< Path to backup.log.
    std::filesystem::path errorLogFile_; ///< Path to errors.log.
    LogLevel level_;                    ///< Minimum level.
    mutable std::mutex mutex_;          ///< Serializes writes.
};

#endif // LOGGER_HPP
