/**
* @file
* @brief Logger statics and the line writer.
*/

#include "speedtest/logger.hpp"
#include <chrono>
#include <ctime>
#include <cstdio>
#include <iostream>

namespace speedtest {

LogLevel   Logger::current_level_ = LogLevel::Info;
std::mutex Logger::mutex_;

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lg(mutex_);
    current_level_ = level;
}

LogLevel Logger::level() {
    std::lock_guard<std::mutex> lg(mutex_);
    return current_level_;
}

static const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
    }
    return "?    ";
}

void Logger::write(LogLevel level, const std::string& tag, const std::string& msg) {
    if (!enabled(level)) return;

    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);
    char ts[32];
    snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
             tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));

    std::ostream& out = (level >= LogLevel::Warn) ? std::cerr : std::cout;
    std::lock_guard<std::mutex> lg(mutex_);
    out << ts << ' ' << level_name(level) << " [" << tag << "] " << msg << '\n';
    out.flush();
}

} // namespace speedtest
