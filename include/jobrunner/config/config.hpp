/*
 * Runner configuration - jobrunner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace jobrunner {

struct RunnerConfig {
    std::string root_override;               // root= / JOBRUNNER_ROOT
    std::vector<std::string> preferred_roots; // probed after the override
    bool force_non_interactive = false;      // non_interactive= / JOBRUNNER_NONINTERACTIVE
    bool exit_on_completion = false;         // exit_on_completion= / JOBRUNNER_EXIT_ON_COMPLETION
    std::string shell = "sh";                // shell= / JOBRUNNER_SHELL
    std::string log_level = "warn";          // error|warn|info|debug
    bool log_to_file = true;                 // <root>/jobrunner.log
    std::size_t tail_lines = 20;
};

// Defaults, with the preferred roots derived from XDG_STATE_HOME and HOME.
RunnerConfig default_config();

// Applies key=value lines from an rc file. Returns false if the file can't be opened.
bool load_config_file(const std::string& path, RunnerConfig& cfg);

// Applies JOBRUNNER_* environment overrides.
void apply_env(RunnerConfig& cfg);

// defaults -> ~/.jobrunnerrc -> environment
RunnerConfig load_config();

bool parse_flag(const std::string& value);

} // namespace jobrunner
