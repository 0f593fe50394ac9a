#pragma once

#include <mutex>
#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>

#include "richenum/config.hpp"

namespace lcr {
namespace log {

// ---------------------------------------------------------
// Log level
// ---------------------------------------------------------
enum class Level : uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Parses "trace" | "debug" | "info" | "warn" | "error" | "fatal".
// Returns false (and leaves out untouched) for anything else.
[[nodiscard]] inline bool parse_level(std::string_view s, Level& out) noexcept {
    if (s == "trace")      out = Level::Trace;
    else if (s == "debug") out = Level::Debug;
    else if (s == "info")  out = Level::Info;
    else if (s == "warn")  out = Level::Warn;
    else if (s == "error") out = Level::Error;
    else if (s == "fatal") out = Level::Fatal;
    else return false;
    return true;
}

// ---------------------------------------------------------
// Thread-safe global logger
// ---------------------------------------------------------
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept { level_.store(lvl, std::memory_order_relaxed); }

    // Unknown names leave the current level unchanged
    bool set_level(std::string_view name) noexcept {
        Level lvl;
        if (!parse_level(name, lvl)) return false;
        set_level(lvl);
        return true;
    }

    Level level() const noexcept { return level_.load(std::memory_order_relaxed); }

    [[nodiscard]] bool enabled(Level lvl) const noexcept { return lvl >= level(); }

    // Enable or disable colored output
    void enable_color(bool on) noexcept { color_enabled_.store(on, std::memory_order_relaxed); }

    // Thread-safe sink setter (stderr by default)
    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os;
    }

    // ---------------------------------------------------------
    // Core logging function (thread-safe)
    // ---------------------------------------------------------
    void log(Level lvl, const std::string& msg) {
        if (!enabled(lvl)) return;
        const bool color = color_enabled_.load(std::memory_order_relaxed);
        std::lock_guard<std::mutex> lock(mutex_);
        auto& os = *out_;
        if (color) os << color_code(lvl);
        os << timestamp() << " [" << level_name(lvl) << "] " << msg;
        if (color) os << "\033[0m"; // reset
        os << std::endl;
    }

private:
    Logger()
        : out_(&std::cerr),
          level_(Level::Warn),
          color_enabled_(false)
    {
        (void)set_level(richenum::config::DEFAULT_LOG_LEVEL);
        // Environment override, read once at first use
        if (const char* env = std::getenv(richenum::config::LOG_LEVEL_ENV)) {
            (void)set_level(env);
        }
    }

    // Human-readable severity names
    static const char* level_name(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "TRACE";
            case Level::Debug: return "DEBUG";
            case Level::Info:  return "INFO";
            case Level::Warn:  return "WARN";
            case Level::Error: return "ERROR";
            case Level::Fatal: return "FATAL";
        }
        return "?????";
    }

    // ANSI color mappings
    static constexpr const char* color_code(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "\033[37m";     // light gray
            case Level::Debug: return "\033[36m";     // cyan
            case Level::Info:  return "\033[32m";     // green
            case Level::Warn:  return "\033[33m";     // yellow
            case Level::Error: return "\033[31m";     // red
            case Level::Fatal: return "\033[1;31m";   // bold bright red
        }
        return "\033[0m";
    }

    static std::string timestamp() {
        using namespace std::chrono;
        auto now = system_clock::now();
        auto t = system_clock::to_time_t(now);
        std::tm tm{};
    #ifdef _WIN32
        localtime_s(&tm, &t);
    #else
        localtime_r(&t, &tm);
    #endif
        char buf[64];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);

        return buf;
    }

private:
    std::ostream* out_;
    std::atomic<Level> level_;
    std::atomic<bool> color_enabled_;
    std::mutex mutex_;
};

// ---------------------------------------------------------
// Streaming log wrapper (collects << into a string)
// ---------------------------------------------------------
class LogStream {
public:
    LogStream(Level lvl) : lvl_(lvl) {}

    template<typename T>
    LogStream& operator<<(const T& v) {
        ss_ << v;
        return *this;
    }

    ~LogStream() {
        Logger::instance().log(lvl_, ss_.str());
    }

private:
    Level lvl_;
    std::ostringstream ss_;
};

} // namespace log
} // namespace lcr


// ---------------------------------------------------------
// Macros for easy logging
// The level check happens before the message is formatted.
// ---------------------------------------------------------
#define RE_LOG_LEVEL(lvl) \
    if (!::lcr::log::Logger::instance().enabled((lvl))) {} else ::lcr::log::LogStream((lvl))

#define RE_TRACE(msg)  RE_LOG_LEVEL(::lcr::log::Level::Trace) << msg
#define RE_DEBUG(msg)  RE_LOG_LEVEL(::lcr::log::Level::Debug) << msg
#define RE_INFO(msg)   RE_LOG_LEVEL(::lcr::log::Level::Info)  << msg
#define RE_WARN(msg)   RE_LOG_LEVEL(::lcr::log::Level::Warn)  << msg
#define RE_ERROR(msg)  RE_LOG_LEVEL(::lcr::log::Level::Error) << msg
#define RE_FATAL(msg)  RE_LOG_LEVEL(::lcr::log::Level::Fatal) << msg
