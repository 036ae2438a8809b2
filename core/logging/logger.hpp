#pragma once

#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace firetv {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

class Logger {
public:
    static void set_level(Level level);
    static Level level();
    static bool enabled(Level level);
    static void log(Level level, const char *file, int line, const std::string &message);

private:
    static Level threshold_;
    static std::mutex mutex_;
};

// Config strings are "debug", "info", "warn", "error" (case-insensitive)
std::optional<Level> parse_level(const std::string &level_str);
Level string_to_level(const std::string &level_str);

}  // namespace logging
}  // namespace firetv

#define LOG_INTERNAL(level, msg)                                                  \
    do {                                                                          \
        if (firetv::logging::Logger::enabled(level)) {                            \
            std::stringstream ss;                                                 \
            ss << msg;                                                            \
            firetv::logging::Logger::log(level, __FILE__, __LINE__, ss.str());    \
        }                                                                         \
    } while (0)

#define LOG_DEBUG(msg) LOG_INTERNAL(firetv::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LOG_INTERNAL(firetv::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LOG_INTERNAL(firetv::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(firetv::logging::Level::LVL_ERROR, msg)
