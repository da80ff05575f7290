#pragma once
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>

namespace tsched::log {

enum class Level : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

inline Level parseLevel(std::string s) {
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    if (s == "debug") return Level::DEBUG;
    if (s == "info")  return Level::INFO;
    if (s == "warn" || s == "warning") return Level::WARN;
    if (s == "error") return Level::ERROR;
    throw std::runtime_error("Invalid log level (debug/info/warn/error): " + s);
}

inline const char* toString(Level l) {
    switch (l) {
        case Level::DEBUG: return "DEBUG";
        case Level::INFO:  return "INFO";
        case Level::WARN:  return "WARN";
        case Level::ERROR: return "ERROR";
    }
    return "?";
}

namespace detail {
inline std::atomic<int>& minLevel() {
    static std::atomic<int> lvl{(int)Level::INFO};
    return lvl;
}
inline std::mutex& ioMutex() {
    static std::mutex m;
    return m;
}
} // namespace detail

inline void setLevel(Level l) { detail::minLevel().store((int)l); }
inline Level level() { return (Level)detail::minLevel().load(); }
inline bool enabled(Level l) { return (int)l >= detail::minLevel().load(); }

// Одна строка: "2026-01-01 12:00:00 INFO  [Scheduler] text"
inline void write(Level l, const std::string& tag, const std::string& msg) {
    if (!enabled(l)) return;

    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream line;
    line << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << ' '
         << std::left << std::setw(5) << toString(l) << " [" << tag << "] " << msg << '\n';

    std::lock_guard<std::mutex> lk(detail::ioMutex());
    auto& os = (l >= Level::WARN) ? std::cerr : std::cout;
    os << line.str();
    os.flush();
}

inline void debug(const std::string& tag, const std::string& msg) { write(Level::DEBUG, tag, msg); }
inline void info (const std::string& tag, const std::string& msg) { write(Level::INFO,  tag, msg); }
inline void warn (const std::string& tag, const std::string& msg) { write(Level::WARN,  tag, msg); }
inline void error(const std::string& tag, const std::string& msg) { write(Level::ERROR, tag, msg); }

} // namespace tsched::log
