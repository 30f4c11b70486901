#pragma once

#include <functional>
#include <mutex>
#include <sstream>
#include <string>

namespace agentgate {
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
    // Receives every record that passes the threshold (tests capture warnings this way)
    using Sink = std::function<void(Level level, const std::string &message)>;

    static void init(Level threshold);
    static void log(Level level, const char *file, int line, const std::string &message);
    static void set_level(Level level);
    static Level level();

    static void set_sink(Sink sink);
    static void reset_sink();

private:
    static Level threshold_;
    static Sink sink_;
    static std::mutex mutex_;
};

// Helper to convert Level to string for config parsing
Level string_to_level(const std::string &level_str);

// True for debug/info/warn/error (case-insensitive)
bool is_valid_level(const std::string &level_str);

const char *level_to_string(Level level);

}  // namespace logging
}  // namespace agentgate

// Stream-style message building: LOG_INFO("pid=" << pid)
#define LOG_INTERNAL(lvl, msg)                                                      \
    do {                                                                            \
        if ((lvl) >= agentgate::logging::Logger::level()) {                         \
            std::stringstream ss;                                                   \
            ss << msg;                                                              \
            agentgate::logging::Logger::log(lvl, __FILE__, __LINE__, ss.str());     \
        }                                                                           \
    } while (0)

#define LOG_DEBUG(msg) LOG_INTERNAL(agentgate::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LOG_INTERNAL(agentgate::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LOG_INTERNAL(agentgate::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(agentgate::logging::Level::LVL_ERROR, msg)
