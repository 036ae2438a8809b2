#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace firetv {
namespace logging {

Level Logger::threshold_ = Level::LVL_INFO;
std::mutex Logger::mutex_;

void Logger::set_level(Level level) {
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = level;
}

Level Logger::level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return threshold_;
}

bool Logger::enabled(Level level) { return level != Level::LVL_NONE && level >= Logger::level(); }

void Logger::log(Level level, const char *file, int line, const std::string &message) {
    (void)file;
    (void)line;

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < threshold_) {
        return;
    }

    std::cerr << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    std::cerr << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";

    switch (level) {
        case Level::LVL_DEBUG: std::cerr << " [DEBUG] "; break;
        case Level::LVL_INFO:  std::cerr << " [INFO]  "; break;
        case Level::LVL_WARN:  std::cerr << " [WARN]  "; break;
        case Level::LVL_ERROR: std::cerr << " [ERROR] "; break;
        default: break;
    }

    std::cerr << message << "\n";

    if (level >= Level::LVL_ERROR) {
        std::cerr << std::flush;
    }
}

std::optional<Level> parse_level(const std::string &level_str) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);

    if (s == "debug") return Level::LVL_DEBUG;
    if (s == "info") return Level::LVL_INFO;
    if (s == "warn") return Level::LVL_WARN;
    if (s == "error") return Level::LVL_ERROR;

    return std::nullopt;
}

Level string_to_level(const std::string &level_str) { return parse_level(level_str).value_or(Level::LVL_INFO); }

}  // namespace logging
}  // namespace firetv
