#pragma once
#include <mutex>
#include <string>
#include <sstream>

/**
* @file
* @brief Process-wide, thread-safe, level-filtered line logger.
*
* Every concurrent task in the tool (broadcaster, dispatcher, responders,
* workers) logs through @ref speedtest::Logger so that lines from different
* threads never interleave mid-line.
*
* @code
* speedtest::Logger::set_level(speedtest::LogLevel::Debug);
* speedtest::Logger::info("tcp", "accepted 10.0.0.7:51234");
* // 12:00:01.042 INFO  [tcp] accepted 10.0.0.7:51234
* @endcode
*/

namespace speedtest {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

class Logger {
public:
    static void set_level(LogLevel level);
    static LogLevel level();

    /// @brief True if a message at @p level would be written.
    static bool enabled(LogLevel lvl) { return lvl >= level(); }

    /**
     * @brief Write one line (timestamp, level, tag, message).
     *
     * @details Warn/Error lines go to stderr, Debug/Info to stdout. The
     * internal mutex is taken only after the level check.
     */
    static void write(LogLevel level, const std::string& tag, const std::string& msg);

    static void debug(const std::string& tag, const std::string& msg) { write(LogLevel::Debug, tag, msg); }
    static void info (const std::string& tag, const std::string& msg) { write(LogLevel::Info,  tag, msg); }
    static void warn (const std::string& tag, const std::string& msg) { write(LogLevel::Warn,  tag, msg); }
    static void error(const std::string& tag, const std::string& msg) { write(LogLevel::Error, tag, msg); }

private:
    static LogLevel   current_level_;
    static std::mutex mutex_;
};

/**
* @brief Concatenate streamable values into a string.
*
* Lets call sites build messages inline:
* @code
* Logger::info("udp", cat(peer, " requested ", n, " bytes"));
* @endcode
*/
template <typename... Args>
std::string cat(const Args&... args) {
    std::ostringstream oss;
    (oss << ... << args);
    return oss.str();
}

} // namespace speedtest
