#pragma once

#include <chrono>
#include <fstream>
#include <mutex>
#include <string>

#include "core/Types.hpp"

namespace IsoLinkage {
namespace Utils {

/**
 * @brief Singleton logger shared by all worker threads.
 *
 * Format: [time][T<omp thread>][LEVEL] message (file:line)
 * Console output is coloured when stdout is a terminal; the optional log
 * file never is.
 */
class Logger {
public:
    static Logger& instance();

    void set_log_level(LogLevel level);
    LogLevel log_level() const { return current_level_; }
    void set_log_file(const std::string& filename);
    void set_color(bool enabled);

    bool enabled(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(current_level_);
    }

    void log(LogLevel level, const std::string& message, const char* file = nullptr, int line = -1);

    static void debug(const std::string& msg, const char* file = nullptr, int line = -1);
    static void info(const std::string& msg, const char* file = nullptr, int line = -1);
    static void warning(const std::string& msg, const char* file = nullptr, int line = -1);
    static void error(const std::string& msg, const char* file = nullptr, int line = -1);

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel current_level_ = LogLevel::LOG_WARN;
    bool color_ = true;
    std::ofstream log_file_;
    std::mutex mutex_;

    static const char* level_to_string(LogLevel level);
    static const char* color_code(LogLevel level);
};

/**
 * @brief RAII helper to log start and end of a phase with its duration.
 */
class ScopedLogger {
public:
    explicit ScopedLogger(const std::string& action_name, LogLevel level = LogLevel::LOG_INFO);
    ~ScopedLogger();

private:
    std::string action_name_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_time_;
};

}  // namespace Utils
}  // namespace IsoLinkage

// Macros to automatically capture file and line number
#define LOG_DEBUG(msg) IsoLinkage::Utils::Logger::debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) IsoLinkage::Utils::Logger::info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) IsoLinkage::Utils::Logger::warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) IsoLinkage::Utils::Logger::error(msg, __FILE__, __LINE__)
