#pragma once

#include <chrono>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace promptspan {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    FATAL = 4,
    OFF = 5
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

    // Stdout stays free for CLI output and the worker wire, so the default sink is stderr.
    void setOutput(std::ostream& stream) {
        std::lock_guard<std::mutex> lock(mutex_);
        output_ = &stream;
    }

    template<typename... Args>
    void log(LogLevel level, const char* file, int line, const char* func, Args&&... args) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < level_) return;

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time_t, &tm_buf);

        std::stringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
           << '.' << std::setfill('0') << std::setw(3) << ms.count();

        const char* level_str = "UNKN";
        switch (level) {
            case LogLevel::DEBUG: level_str = "DEBG"; break;
            case LogLevel::INFO:  level_str = "INFO"; break;
            case LogLevel::WARN:  level_str = "WARN"; break;
            case LogLevel::ERROR: level_str = "EROR"; break;
            case LogLevel::FATAL: level_str = "FATL"; break;
            case LogLevel::OFF:   break;
        }

        const char* filename = std::strrchr(file, '/');
        if (!filename) filename = std::strrchr(file, '\\');
        filename = filename ? filename + 1 : file;

        std::stringstream msg;
        msg << "[" << ss.str() << "] " << level_str << " "
            << filename << ":" << line << " " << func << "() - ";
        format_message(msg, std::forward<Args>(args)...);

        *output_ << msg.str() << std::endl;
    }

private:
    Logger() : level_(LogLevel::INFO), output_(&std::cerr) {}
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

#define PROMPTSPAN_LOG_DEBUG(...) promptspan::Logger::getInstance().log(promptspan::LogLevel::DEBUG, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define PROMPTSPAN_LOG_INFO(...)  promptspan::Logger::getInstance().log(promptspan::LogLevel::INFO,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define PROMPTSPAN_LOG_WARN(...)  promptspan::Logger::getInstance().log(promptspan::LogLevel::WARN,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define PROMPTSPAN_LOG_ERROR(...) promptspan::Logger::getInstance().log(promptspan::LogLevel::ERROR, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define PROMPTSPAN_LOG_FATAL(...) promptspan::Logger::getInstance().log(promptspan::LogLevel::FATAL, __FILE__, __LINE__, __func__, __VA_ARGS__)

#define LOG_DEBUG(...) PROMPTSPAN_LOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...)  PROMPTSPAN_LOG_INFO(__VA_ARGS__)
#define LOG_WARN(...)  PROMPTSPAN_LOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) PROMPTSPAN_LOG_ERROR(__VA_ARGS__)
#define LOG_FATAL(...) PROMPTSPAN_LOG_FATAL(__VA_ARGS__)

inline void set_log_level(LogLevel level) {
    Logger::getInstance().setLevel(level);
}

inline void set_log_output(std::ostream& stream) {
    Logger::getInstance().setOutput(stream);
}

// Accepts debug/info/warn/error/fatal/off; anything else maps to INFO and returns false.
inline bool parse_log_level(const std::string& name, LogLevel& out) {
    if (name == "debug") { out = LogLevel::DEBUG; return true; }
    if (name == "info")  { out = LogLevel::INFO;  return true; }
    if (name == "warn")  { out = LogLevel::WARN;  return true; }
    if (name == "error") { out = LogLevel::ERROR; return true; }
    if (name == "fatal") { out = LogLevel::FATAL; return true; }
    if (name == "off")   { out = LogLevel::OFF;   return true; }
    out = LogLevel::INFO;
    return false;
}

} // namespace promptspan
