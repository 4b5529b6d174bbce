/*
 * Environment detection - jobrunner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <jobrunner/config/config.hpp>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

namespace jobrunner {

// No writable root could be found. Fatal.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Environment {
public:
    explicit Environment(RunnerConfig cfg) : m_cfg(std::move(cfg)) {}

    // Override, then preferred roots, then <cwd>/.jobrunner. The chosen root
    // and its jobs/ subdirectory exist on return. Throws ConfigError.
    std::filesystem::path resolve_root() const;

    // stdin and stdout both attached to a terminal, unless forced off.
    bool is_interactive() const;

    // Whether a computed return code should become the process exit status.
    bool propagate_exit_code() const;

    const RunnerConfig& config() const { return m_cfg; }

private:
    RunnerConfig m_cfg;
};

// Creates <dir>/jobs if needed and checks it is writable.
bool prepare_root(const std::filesystem::path& dir);

} // namespace jobrunner
