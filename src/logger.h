#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <mutex>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <cstdint>

#ifdef _WIN32
    #include <windows.h>
    #include <io.h>
    #define isatty _isatty
    #define fileno _fileno
    // Undefine Windows ERROR macro to avoid conflicts with our enum
    #ifdef ERROR
        #undef ERROR
    #endif
#else
    #include <unistd.h>
#endif

namespace skyshare {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Parse a level name ("debug", "INFO", "warning", ...).
 * @return false if the name is not a known level
 */
bool parse_log_level(const std::string& name, LogLevel& level_out);

class Logger {
public:
    static Logger& getInstance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_log_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel get_log_level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

    void set_colors_enabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        colors_enabled_ = enabled;
    }

    void set_timestamps_enabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        timestamps_enabled_ = enabled;
    }

    void set_console_logging_enabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        console_enabled_ = enabled;
    }

    bool is_console_logging_enabled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return console_enabled_;
    }

    /**
     * Route log lines to a file in addition to the console.
     * The file is truncated when it is opened.
     * @param file_path Path of the log file
     * @return true if the file could be opened
     */
    bool set_log_file(const std::string& file_path);

    /**
     * Stop writing to the log file and close it.
     */
    void close_log_file();

    std::string get_log_file_path() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return log_file_path_;
    }

    void log(LogLevel level, const std::string& module, const std::string& message);

private:
    Logger();

    std::string format_line(LogLevel level, const std::string& module,
                            const std::string& message, bool colored);
    std::string get_level_string(LogLevel level);
    std::string get_color_code(LogLevel level);
    std::string get_module_color(const std::string& module);
    uint32_t hash_string(const std::string& str);

    mutable std::mutex mutex_;
    LogLevel min_level_;
    bool colors_enabled_;
    bool timestamps_enabled_;
    bool console_enabled_;
    bool is_terminal_;
    std::ofstream log_file_;
    std::string log_file_path_;
};

} // namespace skyshare

// Convenience macros for easy logging
#define LOG_DEBUG(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        skyshare::Logger::getInstance().log(skyshare::LogLevel::DEBUG, module, oss.str()); \
    } while(0)

#define LOG_INFO(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        skyshare::Logger::getInstance().log(skyshare::LogLevel::INFO, module, oss.str()); \
    } while(0)

#define LOG_WARN(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        skyshare::Logger::getInstance().log(skyshare::LogLevel::WARN, module, oss.str()); \
    } while(0)

#define LOG_ERROR(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        skyshare::Logger::getInstance().log(skyshare::LogLevel::ERROR, module, oss.str()); \
    } while(0)
