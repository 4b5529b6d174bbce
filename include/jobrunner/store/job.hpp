/*
 * Job record - jobrunner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace jobrunner {

enum class JobState { Running, Succeeded, Failed, Unknown };

const char* to_string(JobState state);

// Reserved exit codes, outside the 0..255 range of real process exits.
constexpr int kExitSpawnFailed = -1; // shell could not be started
constexpr int kExitLost = -2;        // process status could not be collected

struct Job {
    std::string id;
    std::string name;
    std::string command;
    JobState state = JobState::Unknown;
    std::optional<int> exit_code;   // set once terminal
    std::filesystem::path dir;
    std::filesystem::path name_path;
    std::filesystem::path command_path;
    std::filesystem::path pid_path;
    std::filesystem::path log_path;
    std::filesystem::path status_path;
};

struct StatusRecord {
    JobState state = JobState::Unknown;
    std::optional<int> exit_code;
};

// "exit <code>" with optional trailing whitespace; nullopt for anything else.
std::optional<int> parse_status_line(const std::string& content);
std::string format_status_line(int exit_code);

inline JobState state_for_exit(int exit_code) {
    return exit_code == 0 ? JobState::Succeeded : JobState::Failed;
}

} // namespace jobrunner
