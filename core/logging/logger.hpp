#pragma once

#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace hearth {
namespace logging {

enum class Level {
    LVL_DEBUG,
    LVL_INFO,
    LVL_WARN,
    LVL_ERROR,
    LVL_NONE
};

class Logger {
public:
    static void init(Level threshold);
    static void log(Level level, const char *file, int line, const std::string &message);
    static void set_level(Level level);
    static Level level();

    // Redirect output (nullptr restores std::cerr). Caller keeps the stream alive.
    static void set_sink(std::ostream *sink);

private:
    static Level threshold_;
    static std::ostream *sink_;
    static std::mutex mutex_;
};

// Config parsing helpers. Unknown strings map to LVL_INFO.
Level string_to_level(const std::string &level_str);
std::string level_to_string(Level level);

}  // namespace logging
}  // namespace hearth

#define LOG_INTERNAL(lvl, msg)                                                  \
    do {                                                                        \
        if ((lvl) >= hearth::logging::Logger::level()) {                        \
            std::stringstream log_ss_;                                          \
            log_ss_ << msg;                                                     \
            hearth::logging::Logger::log(lvl, __FILE__, __LINE__, log_ss_.str()); \
        }                                                                       \
    } while (0)

#define LOG_DEBUG(msg) LOG_INTERNAL(hearth::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LOG_INTERNAL(hearth::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LOG_INTERNAL(hearth::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(hearth::logging::Level::LVL_ERROR, msg)
