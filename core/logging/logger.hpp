#pragma once

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

namespace mup1gw {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

class Logger {
public:
    static void set_level(Level level);
    static Level level();
    static bool enabled(Level level);
    static void log(Level level, const std::string &message);

private:
    static std::atomic<Level> threshold_;
    static std::mutex mutex_;
};

// Case-insensitive; unknown names map to LVL_NONE
Level string_to_level(const std::string &level_str);
const char *level_to_string(Level level);

}  // namespace logging
}  // namespace mup1gw

#define LOG_INTERNAL(level, msg)                                 \
    do {                                                         \
        if (mup1gw::logging::Logger::enabled(level)) {           \
            std::stringstream ss;                                \
            ss << msg;                                           \
            mup1gw::logging::Logger::log(level, ss.str());       \
        }                                                        \
    } while (0)

#define LOG_DEBUG(msg) LOG_INTERNAL(mup1gw::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LOG_INTERNAL(mup1gw::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LOG_INTERNAL(mup1gw::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(mup1gw::logging::Level::LVL_ERROR, msg)
