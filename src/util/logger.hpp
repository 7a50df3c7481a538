#ifndef SHARDAVAIL_UTIL_LOGGER_HPP
#define SHARDAVAIL_UTIL_LOGGER_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>

/**
 * @file logger.hpp
 * @brief Thread-safe logging for the shardavail node.
 *
 * Usage:
 *   - Logger::getInstance().info("[PartStore] opened parts.sqlite");
 *   - logger::warn("[RequestTracker] request timed out");
 *   - logger::setLogLevel(logger::parseLogLevel(config.logLevel));
 *
 * Components prefix their messages with a bracketed tag so a single node log
 * can be filtered per subsystem.
 */

namespace shardavail {
namespace util {
namespace logger {

/**
 * @brief Enumeration of log levels, lowest first.
 */
enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Human-readable name of a level, as printed in each line.
 */
inline const char* levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::DEBUG:    return "DEBUG";
    case LogLevel::INFO:     return "INFO";
    case LogLevel::WARN:     return "WARN";
    case LogLevel::ERROR:    return "ERROR";
    case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

/**
 * @brief Parse a configuration value such as "info" or "WARN".
 * @throw std::runtime_error on an unknown level name.
 */
inline LogLevel parseLogLevel(const std::string &name)
{
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG")    return LogLevel::DEBUG;
    if (upper == "INFO")     return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR")    return LogLevel::ERROR;
    if (upper == "CRITICAL") return LogLevel::CRITICAL;
    throw std::runtime_error("logger::parseLogLevel: unknown log level '" + name + "'");
}

/**
 * @brief Singleton logger:
 *  - serialized writes from any thread
 *  - level filtering
 *  - console output, optionally mirrored to a file
 */
class Logger {
public:
    static Logger& getInstance()
    {
        static Logger instance;
        return instance;
    }

    void setLogLevel(LogLevel level)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        logLevel_ = level;
    }

    LogLevel getLogLevel() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return logLevel_;
    }

    /**
     * @brief Mirror every line into a file.
     * @param filename The file path to write logs into.
     * @param append If true, appends to an existing file; otherwise truncates it.
     * @return false if the file could not be opened (console output continues).
     */
    bool enableFileOutput(const std::string &filename, bool append = true)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
        }
        fileStream_ = std::make_unique<std::ofstream>(filename,
            append ? (std::ios::out | std::ios::app) : (std::ios::out | std::ios::trunc));
        if (!fileStream_->is_open()) {
            fileStream_.reset();
            std::cerr << "[Logger] Failed to open log file: " << filename << std::endl;
            return false;
        }
        return true;
    }

    void disableFileOutput()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
            fileStream_.reset();
        }
    }

    void debug(const std::string &msg)    { log(LogLevel::DEBUG, msg); }
    void info(const std::string &msg)     { log(LogLevel::INFO, msg); }
    void warn(const std::string &msg)     { log(LogLevel::WARN, msg); }
    void error(const std::string &msg)    { log(LogLevel::ERROR, msg); }
    void critical(const std::string &msg) { log(LogLevel::CRITICAL, msg); }

private:
    Logger()
        : logLevel_(LogLevel::INFO)
    {
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string &msg)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < logLevel_) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          now.time_since_epoch()).count() % 1000;
        std::tm tm_buf{};
        localtime_r(&time_t_now, &tm_buf);

        std::ostringstream line;
        line << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
             << "." << std::setw(3) << std::setfill('0') << millis
             << "][" << levelName(level) << "] " << msg << '\n';

        // Warnings and worse go to stderr so they survive stdout redirection
        std::ostream &console = (level >= LogLevel::WARN) ? std::cerr : std::cout;
        console << line.str();
        console.flush();

        if (fileStream_) {
            (*fileStream_) << line.str();
            fileStream_->flush();
        }
    }

    mutable std::mutex mutex_;
    LogLevel logLevel_;
    std::unique_ptr<std::ofstream> fileStream_;
};

// ----------------------------------------------------------------------------
//  Convenience free functions
// ----------------------------------------------------------------------------
inline void setLogLevel(LogLevel level)
{
    Logger::getInstance().setLogLevel(level);
}

inline bool enableFileOutput(const std::string &filename, bool append = true)
{
    return Logger::getInstance().enableFileOutput(filename, append);
}

inline void disableFileOutput()
{
    Logger::getInstance().disableFileOutput();
}

inline void debug(const std::string &msg)    { Logger::getInstance().debug(msg); }
inline void info(const std::string &msg)     { Logger::getInstance().info(msg); }
inline void warn(const std::string &msg)     { Logger::getInstance().warn(msg); }
inline void error(const std::string &msg)    { Logger::getInstance().error(msg); }
inline void critical(const std::string &msg) { Logger::getInstance().critical(msg); }

} // namespace logger
} // namespace util
} // namespace shardavail

#endif // SHARDAVAIL_UTIL_LOGGER_HPP
