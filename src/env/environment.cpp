/*
 * Environment detection implementation - jobrunner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <jobrunner/env/environment.hpp>
#include <jobrunner/log/logger.hpp>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace jobrunner {
namespace fs = std::filesystem;

bool prepare_root(const fs::path& dir) {
    std::error_code ec;
    fs::path jobs = dir / "jobs";
    fs::create_directories(jobs, ec);
    if (ec) {
        logging::debug("root candidate {}: {}", dir.string(), ec.message());
        return false;
    }
    if (!fs::is_directory(jobs, ec)) return false;
    return access(jobs.c_str(), W_OK | X_OK) == 0;
}

fs::path Environment::resolve_root() const {
    if (!m_cfg.root_override.empty()) {
        fs::path p(m_cfg.root_override);
        if (prepare_root(p)) return p;
        logging::warn("root override {} is not writable, probing defaults", p.string());
    }
    for (auto &cand : m_cfg.preferred_roots) {
        if (cand.empty()) continue;
        if (prepare_root(cand)) return fs::path(cand);
    }
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (!ec) {
        fs::path fallback = cwd / ".jobrunner";
        if (prepare_root(fallback)) return fallback;
    }
    throw ConfigError("no writable job root (set JOBRUNNER_ROOT)");
}

bool Environment::is_interactive() const {
    if (m_cfg.force_non_interactive) return false;
    return isatty(STDIN_FILENO) && isatty(STDOUT_FILENO);
}

bool Environment::propagate_exit_code() const {
    return m_cfg.exit_on_completion || is_interactive();
}

} // namespace jobrunner
