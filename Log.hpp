// Log.hpp
//
// Leveled status lines for the pipeline and CLI. Formatting goes through
// {fmt}; everything is written to stderr so generated text on stdout stays
// clean. Debug lines carry the "[DEBUG]" prefix.
#pragma once
#include <atomic>
#include <cstdio>
#include <fmt/core.h>
#include <utility>

namespace FlowGen {
namespace Log {

enum class Level { Error = 0, Warn = 1, Info = 2, Debug = 3 };

inline std::atomic<int>& threshold() {
    static std::atomic<int> level{static_cast<int>(Level::Warn)};
    return level;
}

inline void setLevel(Level level) { threshold().store(static_cast<int>(level)); }
inline bool enabled(Level level) { return static_cast<int>(level) <= threshold().load(); }

template <typename... Args>
void write(Level level, const char* prefix, fmt::format_string<Args...> format, Args&&... args) {
    if (!enabled(level)) return;
    fmt::print(stderr, "{}{}\n", prefix, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void error(fmt::format_string<Args...> format, Args&&... args) {
    write(Level::Error, "error: ", format, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(fmt::format_string<Args...> format, Args&&... args) {
    write(Level::Warn, "warning: ", format, std::forward<Args>(args)...);
}

template <typename... Args>
void info(fmt::format_string<Args...> format, Args&&... args) {
    write(Level::Info, "", format, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args) {
    write(Level::Debug, "[DEBUG] ", format, std::forward<Args>(args)...);
}

} // namespace Log
} // namespace FlowGen
