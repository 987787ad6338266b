#pragma once

#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

namespace regmetrics {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

    void setOutput(std::ostream& stream) {
        std::lock_guard<std::mutex> lock(mutex_);
        output_ = &stream;
    }

    template<typename... Args>
    void log(LogLevel level, const char* file, int line, const char* func, Args&&... args) {
        // Workers log concurrently; build the whole line before taking the lock
        // so lines from different threads never interleave.
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < level_) return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time_t, &tm_buf);

        const char* level_str = "UNKN";
        switch (level) {
            case LogLevel::DEBUG: level_str = "DEBG"; break;
            case LogLevel::INFO:  level_str = "INFO"; break;
            case LogLevel::WARN:  level_str = "WARN"; break;
            case LogLevel::ERROR: level_str = "EROR"; break;
        }

        const char* filename = strrchr(file, '/');
        filename = filename ? filename + 1 : file;

        std::stringstream msg;
        msg << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count() << "] "
            << level_str << " [" << std::this_thread::get_id() << "] "
            << filename << ":" << line << " " << func << "() - ";
        format_message(msg, std::forward<Args>(args)...);

        std::lock_guard<std::mutex> lock(mutex_);
        *output_ << msg.str() << std::endl;
    }

private:
    Logger() : level_(LogLevel::INFO), output_(&std::clog) {}
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void format_message(std::stringstream&) {}

    template<typename T, typename... Args>
    void format_message(std::stringstream& ss, T&& value, Args&&... args) {
        ss << value;
        format_message(ss, std::forward<Args>(args)...);
    }

    LogLevel level_;
    std::ostream* output_;
    mutable std::mutex mutex_;
};

#define LOG_DEBUG(...) regmetrics::Logger::getInstance().log(regmetrics::LogLevel::DEBUG, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_INFO(...)  regmetrics::Logger::getInstance().log(regmetrics::LogLevel::INFO,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_WARN(...)  regmetrics::Logger::getInstance().log(regmetrics::LogLevel::WARN,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_ERROR(...) regmetrics::Logger::getInstance().log(regmetrics::LogLevel::ERROR, __FILE__, __LINE__, __func__, __VA_ARGS__)

inline void set_log_level(LogLevel level) {
    Logger::getInstance().setLevel(level);
}

inline void set_log_output(std::ostream& stream) {
    Logger::getInstance().setOutput(stream);
}

// Accepts the names used by log.level / REGM_LOG_LEVEL. Returns false for
// anything else and leaves `out` untouched.
inline bool parse_log_level(const std::string& name, LogLevel& out) {
    if (name == "debug") { out = LogLevel::DEBUG; return true; }
    if (name == "info")  { out = LogLevel::INFO;  return true; }
    if (name == "warn")  { out = LogLevel::WARN;  return true; }
    if (name == "error") { out = LogLevel::ERROR; return true; }
    return false;
}

} // namespace regmetrics
