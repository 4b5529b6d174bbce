/*
 * Diagnostic logger - jobrunner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <filesystem>
#include <string>
#include <utility>
#include <fmt/core.h>

namespace jobrunner {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Leveled logger. Records at Warn or above always reach stderr; when a file
// sink is open it receives every record up to the configured level.
namespace logging {

void set_level(LogLevel level);
LogLevel level();
// Unknown names leave the level unchanged and return false.
bool set_level(const std::string& name);
// Mirror every enabled record to stderr, not just warnings and errors.
void set_verbose(bool on);

bool open_file(const std::filesystem::path& path);
void close_file();

bool enabled(LogLevel level);
void write(LogLevel level, const std::string& msg) noexcept;

template <typename... Args>
void error(fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(LogLevel::Error)) write(LogLevel::Error, fmt::format(f, std::forward<Args>(args)...));
}
template <typename... Args>
void warn(fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(LogLevel::Warn)) write(LogLevel::Warn, fmt::format(f, std::forward<Args>(args)...));
}
template <typename... Args>
void info(fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(LogLevel::Info)) write(LogLevel::Info, fmt::format(f, std::forward<Args>(args)...));
}
template <typename... Args>
void debug(fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(LogLevel::Debug)) write(LogLevel::Debug, fmt::format(f, std::forward<Args>(args)...));
}

} // namespace logging

// ISO-8601 local timestamp, second resolution. Also used for log markers.
std::string timestamp_now();

} // namespace jobrunner
