#pragma once

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

namespace itemstore {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

/**
 * @brief Process-wide stderr logger
 *
 * Lines are written as:
 *   [2025-01-01T12:00:00.123Z] [INFO]  [HTTP] message
 *
 * Timestamps are UTC so they line up with the created_at values the
 * service hands out. Writes are serialized by a mutex; the threshold
 * is atomic and may be changed while request threads are logging.
 */
class Logger {
public:
    static void set_level(Level level);
    static Level level();
    static bool enabled(Level level);
    static void log(Level level, const char *file, int line, const std::string &message);

private:
    static std::atomic<Level> threshold_;
    static std::mutex mutex_;
};

// Case-insensitive; unknown strings map to INFO
Level string_to_level(const std::string &level_str);
std::string level_to_string(Level level);

// True for debug, info, warn, error (case-sensitive, as written in config)
bool is_valid_level(const std::string &level_str);

}  // namespace logging
}  // namespace itemstore

#define LOG_INTERNAL(level, msg)                                                  \
    do {                                                                          \
        if (itemstore::logging::Logger::enabled(level)) {                         \
            std::stringstream ss;                                                 \
            ss << msg;                                                            \
            itemstore::logging::Logger::log(level, __FILE__, __LINE__, ss.str()); \
        }                                                                         \
    } while (0)

#define LOG_DEBUG(msg) LOG_INTERNAL(itemstore::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LOG_INTERNAL(itemstore::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LOG_INTERNAL(itemstore::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(itemstore::logging::Level::LVL_ERROR, msg)
