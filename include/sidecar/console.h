#pragma once
// ═══════════════════════════════════════════════════════════════════
//  sidecar/console.h — Leveled, timestamped console logging
// ═══════════════════════════════════════════════════════════════════
//
//  console::info("Engine listening on", url);
//  console::error("Engine crashed unexpectedly with code:", 3);
//
//  The threshold comes from SIDECAR_LOG_LEVEL (debug, info, warn,
//  error, silent) unless console::setLevel() was called.
//
// ═══════════════════════════════════════════════════════════════════

#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <type_traits>
#include <atomic>
#include <mutex>
#include <unistd.h>

namespace sidecar::console {

enum class Level : int {
    Debug  = 0,
    Info   = 1,
    Warn   = 2,
    Error  = 3,
    Silent = 4,
};

namespace detail {

struct Colors {
    static constexpr const char* Reset   = "\033[0m";
    static constexpr const char* Red     = "\033[31m";
    static constexpr const char* Yellow  = "\033[33m";
    static constexpr const char* Blue    = "\033[34m";
    static constexpr const char* Cyan    = "\033[36m";
    static constexpr const char* Green   = "\033[32m";
    static constexpr const char* Gray    = "\033[90m";
};

inline Level parseLevel(const char* value, Level fallback) {
    if (value == nullptr) return fallback;
    std::string_view v(value);
    if (v == "debug")  return Level::Debug;
    if (v == "info")   return Level::Info;
    if (v == "warn")   return Level::Warn;
    if (v == "error")  return Level::Error;
    if (v == "silent") return Level::Silent;
    return fallback;
}

inline std::atomic<int>& threshold() {
    static std::atomic<int> level{
        static_cast<int>(parseLevel(std::getenv("SIDECAR_LOG_LEVEL"), Level::Info))
    };
    return level;
}

// Lines from the supervisor and its signal hooks must not interleave.
inline std::mutex& outputMutex() {
    static std::mutex m;
    return m;
}

template <typename T>
std::string stringify(const T& arg) {
    if constexpr (std::is_convertible_v<T, std::string_view>) {
        return std::string(std::string_view(arg));
    } else if constexpr (std::is_same_v<std::decay_t<T>, bool>) {
        return arg ? "true" : "false";
    } else if constexpr (std::is_integral_v<T>) {
        return std::to_string(arg);
    } else {
        std::ostringstream oss;
        oss << arg;
        return oss.str();
    }
}

inline std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    std::tm local{};
    localtime_r(&time, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

template <typename... Args>
void print(Level level, std::ostream& os, const char* color, const char* prefix,
           const Args&... args) {
    if (static_cast<int>(level) < threshold().load()) return;

    const bool tty = ::isatty(&os == &std::cerr ? STDERR_FILENO : STDOUT_FILENO) == 1;

    std::ostringstream line;
    if (tty) line << Colors::Gray;
    line << "[" << timestamp() << "] ";
    if (tty) line << color;
    line << prefix;
    if (tty) line << Colors::Reset;

    bool first = true;
    auto printOne = [&](const auto& arg) {
        if (!first) line << " ";
        first = false;
        line << stringify(arg);
    };
    (printOne(args), ...);
    line << '\n';

    std::lock_guard<std::mutex> lock(outputMutex());
    os << line.str() << std::flush;
}

} // namespace detail

inline void setLevel(Level level) {
    detail::threshold().store(static_cast<int>(level));
}

inline Level level() {
    return static_cast<Level>(detail::threshold().load());
}

template <typename... Args>
void debug(const Args&... args) {
    detail::print(Level::Debug, std::cerr, detail::Colors::Cyan, "debug ", args...);
}

template <typename... Args>
void info(const Args&... args) {
    detail::print(Level::Info, std::cerr, detail::Colors::Blue, "info  ", args...);
}

template <typename... Args>
void success(const Args&... args) {
    detail::print(Level::Info, std::cerr, detail::Colors::Green, "ok    ", args...);
}

template <typename... Args>
void warn(const Args&... args) {
    detail::print(Level::Warn, std::cerr, detail::Colors::Yellow, "warn  ", args...);
}

template <typename... Args>
void error(const Args&... args) {
    detail::print(Level::Error, std::cerr, detail::Colors::Red, "error ", args...);
}

} // namespace sidecar::console
