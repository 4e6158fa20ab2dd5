#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace logging {

enum class Level {
    DEBUG = 0,
    INFO  = 1,
    WARN  = 2,
    ERR   = 3,
};

// Line-oriented console logger shared by every session thread.
// WARN and above go to stderr, the rest to stdout.
class Logger {
public:
    static Logger& get() {
        static Logger instance;
        return instance;
    }

    void set_level(Level lvl) {
        std::lock_guard<std::mutex> lk(mutex_);
        level_ = lvl;
    }

    bool enabled(Level lvl) {
        std::lock_guard<std::mutex> lk(mutex_);
        return lvl >= level_;
    }

    void log(Level lvl, const std::string& msg) {
        std::string line = format_line(lvl, msg);
        std::lock_guard<std::mutex> lk(mutex_);
        if (lvl < level_) return;
        if (lvl >= Level::WARN) {
            std::cerr << line << "\n";
        } else {
            std::cout << line << std::endl;
        }
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() : level_(Level::INFO) {}

    static std::string format_line(Level lvl, const std::string& msg) {
        auto now = std::chrono::system_clock::now();
        auto t   = std::chrono::system_clock::to_time_t(now);
        auto ms  = std::chrono::duration_cast<std::chrono::milliseconds>(
                       now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&t, &tm_buf);

        std::ostringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        ss << " [" << level_str(lvl) << "] " << msg;
        return ss.str();
    }

    static const char* level_str(Level lvl) {
        switch (lvl) {
            case Level::DEBUG: return "DEBUG";
            case Level::INFO:  return "INFO ";
            case Level::WARN:  return "WARN ";
            case Level::ERR:   return "ERROR";
        }
        return "?????";
    }

    std::mutex mutex_;
    Level      level_;
};

inline void debug(const std::string& msg) { Logger::get().log(Level::DEBUG, msg); }
inline void info(const std::string& msg)  { Logger::get().log(Level::INFO, msg); }
inline void warn(const std::string& msg)  { Logger::get().log(Level::WARN, msg); }
inline void error(const std::string& msg) { Logger::get().log(Level::ERR, msg); }

} // namespace logging
