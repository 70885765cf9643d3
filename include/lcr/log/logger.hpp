#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace lcr::log {

enum class Level : std::uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// "trace" | "debug" | "info" | "warn" | "error" | "fatal". Anything else is Info.
[[nodiscard]]
inline Level parse_level(std::string_view name) noexcept {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "warn")  return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "fatal") return Level::Fatal;
    return Level::Info;
}

[[nodiscard]]
inline constexpr std::string_view to_string(Level lvl) noexcept {
    switch (lvl) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO ";
        case Level::Warn:  return "WARN ";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
    }
    return "?????";
}

// -----------------------------------------------------------------------------
// Process-wide logger
//
// Lines are written whole under a mutex, so the Beast I/O thread and the poll
// thread can log concurrently. Format:
//
//     2026-10-18 09:14:03.512 [INFO ] [CLOUD] Connected
// -----------------------------------------------------------------------------
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept { level_ = lvl; }
    void set_level(std::string_view name) noexcept { level_ = parse_level(name); }
    [[nodiscard]] Level level() const noexcept { return level_; }

    [[nodiscard]] bool enabled(Level lvl) const noexcept { return lvl >= level_; }

    void enable_color(bool on) noexcept { color_ = on; }

    void write(Level lvl, const std::string& line) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (color_) {
            std::cout << ansi_(lvl);
        }
        std::cout << now_() << " [" << to_string(lvl) << "] " << line;
        if (color_) {
            std::cout << "\033[0m";
        }
        std::cout << '\n' << std::flush;
    }

private:
    Logger() = default;

    static constexpr const char* ansi_(Level lvl) noexcept {
        switch (lvl) {
            case Level::Trace: return "\033[90m";
            case Level::Debug: return "\033[36m";
            case Level::Info:  return "\033[32m";
            case Level::Warn:  return "\033[33m";
            case Level::Error: return "\033[31m";
            case Level::Fatal: return "\033[1;31m";
        }
        return "";
    }

    static std::string now_() {
        using namespace std::chrono;
        const auto now = system_clock::now();
        const auto ms  = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
        const std::time_t t = system_clock::to_time_t(now);
        std::tm tm{};
#ifdef _WIN32
        localtime_s(&tm, &t);
#else
        localtime_r(&t, &tm);
#endif
        char buf[32];
        const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        std::string out(buf, n);
        out += '.';
        if (ms < 100) out += '0';
        if (ms < 10)  out += '0';
        out += std::to_string(ms);
        return out;
    }

    std::mutex mutex_;
    Level level_{Level::Info};
    bool color_{false};
};

// Collects one line through operator<< and hands it to the logger on scope exit.
class Line {
public:
    explicit Line(Level lvl) noexcept : lvl_(lvl) {}
    ~Line() { Logger::instance().write(lvl_, buf_.str()); }

    Line(const Line&) = delete;
    Line& operator=(const Line&) = delete;

    template <typename T>
    Line& operator<<(const T& v) {
        buf_ << v;
        return *this;
    }

private:
    Level lvl_;
    std::ostringstream buf_;
};

} // namespace lcr::log


// Disabled levels skip formatting entirely.
#define TS_LOG_AT(lvl, msg) \
    if (!::lcr::log::Logger::instance().enabled(lvl)) {} else ::lcr::log::Line(lvl) << msg

#define TS_TRACE(msg)  TS_LOG_AT(::lcr::log::Level::Trace, msg)
#define TS_DEBUG(msg)  TS_LOG_AT(::lcr::log::Level::Debug, msg)
#define TS_INFO(msg)   TS_LOG_AT(::lcr::log::Level::Info,  msg)
#define TS_WARN(msg)   TS_LOG_AT(::lcr::log::Level::Warn,  msg)
#define TS_ERROR(msg)  TS_LOG_AT(::lcr::log::Level::Error, msg)
#define TS_FATAL(msg)  TS_LOG_AT(::lcr::log::Level::Fatal, msg)
