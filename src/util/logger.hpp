#ifndef DOCSANITIZER_UTIL_LOGGER_HPP
#define DOCSANITIZER_UTIL_LOGGER_HPP

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
 * @brief Thread-safe, levelled logging for DocSanitizer.
 *
 * Lines look like:
 *   [2026-01-31 12:00:00][INFO] [ObjectStore] stored object 3f2a... (1024 bytes)
 *
 * Components prefix their messages with their own name in brackets. Document
 * contents are never logged, only identifiers, sizes, fingerprints and counts.
 *
 * Usage:
 *   - logger::info("[Engine] starting");
 *   - logger::setLogLevel(logger::parseLogLevel("debug"));
 *   - logger::enableFileOutput("docsanitizer.log", true);
 */

namespace docsanitizer {
namespace util {
namespace logger {

/**
 * @brief Severity levels, lowest first.
 */
enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Canonical upper-case name of a level.
 */
inline const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARN:
        return "WARN";
    case LogLevel::ERROR:
        return "ERROR";
    case LogLevel::CRITICAL:
        return "CRITICAL";
    }
    return "INFO";
}

/**
 * @brief Parse a level name (case-insensitive). "WARNING" is accepted as WARN.
 * @throw std::invalid_argument for unknown names.
 */
inline LogLevel parseLogLevel(const std::string &name)
{
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG")
        return LogLevel::DEBUG;
    if (upper == "INFO")
        return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING")
        return LogLevel::WARN;
    if (upper == "ERROR")
        return LogLevel::ERROR;
    if (upper == "CRITICAL")
        return LogLevel::CRITICAL;
    throw std::invalid_argument("logger: unknown log level '" + name + "'");
}

/**
 * @class Logger
 * @brief Process-wide logger writing to a console stream (stdout unless
 *        redirected) and, optionally, to a file.
 */
class Logger {
public:
    static Logger &getInstance()
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
     * @brief Send console lines to @p stream instead of stdout. The stream
     *        must outlive the logger or be replaced before it is destroyed.
     */
    void setConsoleStream(std::ostream &stream)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        console_ = &stream;
    }

    /**
     * @brief Mirror every line into a file as well as the console.
     * @param filename Target path.
     * @param append Append to an existing file instead of truncating it.
     * @return false if the file could not be opened (console output continues).
     */
    bool enableFileOutput(const std::string &filename, bool append = false)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
        }
        fileStream_ = std::make_unique<std::ofstream>(
            filename, append ? (std::ios::out | std::ios::app) : (std::ios::out | std::ios::trunc));
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

    void debug(const std::string &msg) { log(LogLevel::DEBUG, msg); }
    void info(const std::string &msg) { log(LogLevel::INFO, msg); }
    void warn(const std::string &msg) { log(LogLevel::WARN, msg); }
    void error(const std::string &msg) { log(LogLevel::ERROR, msg); }
    void critical(const std::string &msg) { log(LogLevel::CRITICAL, msg); }

private:
    Logger()
        : logLevel_(LogLevel::INFO)
        , console_(&std::cout)
    {
    }

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;

    void log(LogLevel level, const std::string &msg)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < logLevel_) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto timeNow = std::chrono::system_clock::to_time_t(now);
        std::tm tmBuf{};
#ifdef _WIN32
        localtime_s(&tmBuf, &timeNow);
#else
        localtime_r(&timeNow, &tmBuf);
#endif

        std::ostringstream line;
        line << "[" << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S") << "][" << levelName(level)
             << "] " << msg << '\n';

        (*console_) << line.str();
        console_->flush();

        if (fileStream_) {
            (*fileStream_) << line.str();
            fileStream_->flush();
        }
    }

    mutable std::mutex mutex_;
    LogLevel logLevel_;
    std::ostream *console_;
    std::unique_ptr<std::ofstream> fileStream_;
};

// ----------------------------------------------------------------------------
//  Convenience free functions
// ----------------------------------------------------------------------------
inline void setLogLevel(LogLevel level)
{
    Logger::getInstance().setLogLevel(level);
}

inline void setConsoleStream(std::ostream &stream)
{
    Logger::getInstance().setConsoleStream(stream);
}

inline bool enableFileOutput(const std::string &filename, bool append = false)
{
    return Logger::getInstance().enableFileOutput(filename, append);
}

inline void disableFileOutput()
{
    Logger::getInstance().disableFileOutput();
}

inline void debug(const std::string &msg)
{
    Logger::getInstance().debug(msg);
}

inline void info(const std::string &msg)
{
    Logger::getInstance().info(msg);
}

inline void warn(const std::string &msg)
{
    Logger::getInstance().warn(msg);
}

inline void error(const std::string &msg)
{
    Logger::getInstance().error(msg);
}

inline void critical(const std::string &msg)
{
    Logger::getInstance().critical(msg);
}

} // namespace logger
} // namespace util
} // namespace docsanitizer

#endif // DOCSANITIZER_UTIL_LOGGER_HPP
