#pragma once
// ═══════════════════════════════════════════════════════════════════
//  dlproxy/console.h — Leveled console logging with colors
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    console::setLevel(console::Level::Warn);
//    console::info("listening on", host, port);
//    console::warn("upstream failed:", status);
//
//  Loop threads log concurrently; every line is written under one mutex.
// ═══════════════════════════════════════════════════════════════════

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <nlohmann/json.hpp>

namespace dlproxy::console {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Silent = 4 };

// ── Parse "debug" | "info" | "warn" | "error" | "silent" ──
inline std::optional<Level> parseLevel(std::string_view name) {
    if (name == "debug")  return Level::Debug;
    if (name == "info")   return Level::Info;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error")  return Level::Error;
    if (name == "silent") return Level::Silent;
    return std::nullopt;
}

namespace detail {

// ANSI color codes
struct Colors {
    static constexpr const char* Reset   = "\033[0m";
    static constexpr const char* Red     = "\033[31m";
    static constexpr const char* Yellow  = "\033[33m";
    static constexpr const char* Blue    = "\033[34m";
    static constexpr const char* Cyan    = "\033[36m";
    static constexpr const char* Green   = "\033[32m";
    static constexpr const char* Gray    = "\033[90m";
};

inline std::atomic<int>& threshold() {
    static std::atomic<int> level{static_cast<int>(Level::Info)};
    return level;
}

inline std::atomic<bool>& colorsEnabled() {
    static std::atomic<bool> enabled{true};
    return enabled;
}

inline std::mutex& outputMutex() {
    static std::mutex m;
    return m;
}

// Stringify a single argument
template <typename T>
std::string stringify(const T& arg) {
    if constexpr (std::is_convertible_v<T, std::string_view>) {
        return std::string(std::string_view(arg));
    } else if constexpr (std::is_same_v<std::decay_t<T>, bool>) {
        return arg ? "true" : "false";
    } else if constexpr (std::is_arithmetic_v<T>) {
        if constexpr (std::is_floating_point_v<T>) {
            std::ostringstream oss;
            oss << arg;
            return oss.str();
        }
        return std::to_string(arg);
    } else if constexpr (std::is_same_v<std::decay_t<T>, nlohmann::json>) {
        return arg.dump();
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
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

inline bool enabled(Level level) {
    return static_cast<int>(level) >= threshold().load(std::memory_order_relaxed);
}

template <typename... Args>
void print(Level level, std::ostream& os, const char* color, const char* prefix,
           const Args&... args) {
    if (!enabled(level)) return;

    // Format outside the lock, write under it
    std::ostringstream line;
    bool colors = colorsEnabled().load(std::memory_order_relaxed);
    if (colors) line << Colors::Gray;
    line << "[" << timestamp() << "] ";
    if (colors) line << color;
    line << prefix;
    if (colors) line << Colors::Reset;

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

// ── Configuration ──
inline void setLevel(Level level) {
    detail::threshold().store(static_cast<int>(level));
}

inline Level level() {
    return static_cast<Level>(detail::threshold().load());
}

inline void setColors(bool enabled) {
    detail::colorsEnabled().store(enabled);
}

// ── console::log (info level, no prefix) ──
template <typename... Args>
void log(const Args&... args) {
    detail::print(Level::Info, std::cout, detail::Colors::Reset, "", args...);
}

// ── console::info ──
template <typename... Args>
void info(const Args&... args) {
    detail::print(Level::Info, std::cout, detail::Colors::Blue, "ℹ ", args...);
}

// ── console::warn ──
template <typename... Args>
void warn(const Args&... args) {
    detail::print(Level::Warn, std::cerr, detail::Colors::Yellow, "⚠ ", args...);
}

// ── console::error ──
template <typename... Args>
void error(const Args&... args) {
    detail::print(Level::Error, std::cerr, detail::Colors::Red, "✖ ", args...);
}

// ── console::success (info level) ──
template <typename... Args>
void success(const Args&... args) {
    detail::print(Level::Info, std::cout, detail::Colors::Green, "✔ ", args...);
}

// ── console::debug ──
template <typename... Args>
void debug(const Args&... args) {
    detail::print(Level::Debug, std::cout, detail::Colors::Cyan, "● ", args...);
}

} // namespace dlproxy::console
