/*
 * Diagnostic logger implementation - jobrunner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <jobrunner/log/logger.hpp>
#include <fmt/chrono.h>
#include <fmt/core.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>

namespace jobrunner {

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Warn)};
std::atomic<bool> g_verbose{false};
std::mutex g_mutex;     // guards g_file and the sinks
std::ofstream g_file;

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Info: return "INFO";
        case LogLevel::Debug: return "DEBUG";
    }
    return "?";
}
} // namespace

std::string timestamp_now() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}", tm);
}

namespace logging {

void set_level(LogLevel level) { g_level = static_cast<int>(level); }
LogLevel level() { return static_cast<LogLevel>(g_level.load()); }

bool set_level(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c){ return std::tolower(c); });
    if (n=="error") set_level(LogLevel::Error);
    else if (n=="warn"||n=="warning") set_level(LogLevel::Warn);
    else if (n=="info") set_level(LogLevel::Info);
    else if (n=="debug") set_level(LogLevel::Debug);
    else return false;
    return true;
}

void set_verbose(bool on) { g_verbose = on; }

bool open_file(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_file.is_open()) g_file.close();
    g_file.open(path, std::ios::app);
    return g_file.is_open();
}

void close_file() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_file.is_open()) g_file.close();
}

bool enabled(LogLevel lvl) { return static_cast<int>(lvl) <= g_level.load(); }

void write(LogLevel lvl, const std::string& msg) noexcept {
    try {
        std::string line = fmt::format("[{}] [{}] {}\n", timestamp_now(), level_tag(lvl), msg);
        std::lock_guard<std::mutex> lock(g_mutex);
        if (g_file.is_open()) { g_file << line; g_file.flush(); }
        if (lvl <= LogLevel::Warn || g_verbose.load()) std::cerr << line;
    } catch (const std::exception& e) {
        std::cerr << "logger: " << e.what() << '\n';
    }
}

} // namespace logging

} // namespace jobrunner
