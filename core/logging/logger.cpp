#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace hearth {
namespace logging {

Level Logger::threshold_ = Level::LVL_INFO;
std::ostream *Logger::sink_ = nullptr;
std::mutex Logger::mutex_;

void Logger::init(Level threshold) { set_level(threshold); }

void Logger::set_level(Level level) {
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = level;
}

Level Logger::level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return threshold_;
}

void Logger::set_sink(std::ostream *sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink;
}

void Logger::log(Level level, const char *file, int line, const std::string &message) {
    (void)file;
    (void)line;

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < threshold_ || level == Level::LVL_NONE) {
        return;
    }

    std::ostream &out = sink_ != nullptr ? *sink_ : std::cerr;

    out << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    out << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";

    switch (level) {
        case Level::LVL_DEBUG: out << " [DEBUG] "; break;
        case Level::LVL_INFO:  out << " [INFO]  "; break;
        case Level::LVL_WARN:  out << " [WARN]  "; break;
        case Level::LVL_ERROR: out << " [ERROR] "; break;
        default: break;
    }

    out << message << "\n";

    if (level >= Level::LVL_ERROR) {
        out << std::flush;
    }
}

Level string_to_level(const std::string &level_str) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (s == "DEBUG") return Level::LVL_DEBUG;
    if (s == "INFO") return Level::LVL_INFO;
    if (s == "WARN") return Level::LVL_WARN;
    if (s == "ERROR") return Level::LVL_ERROR;
    if (s == "NONE") return Level::LVL_NONE;

    return Level::LVL_INFO;
}

std::string level_to_string(Level level) {
    switch (level) {
        case Level::LVL_DEBUG: return "debug";
        case Level::LVL_INFO: return "info";
        case Level::LVL_WARN: return "warn";
        case Level::LVL_ERROR: return "error";
        case Level::LVL_NONE: return "none";
    }
    return "info";
}

}  // namespace logging
}  // namespace hearth
