/*
 * Runner configuration implementation - jobrunner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <jobrunner/config/config.hpp>
#include <jobrunner/log/logger.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <string>

namespace jobrunner {

static std::string getenv_or(const char* k, const std::string& def="") { const char* v = std::getenv(k); return v?std::string(v):def; }

static std::string trim(const std::string& s) {
    size_t a=0; while (a<s.size() && std::isspace((unsigned char)s[a])) ++a;
    size_t b=s.size(); while (b>a && std::isspace((unsigned char)s[b-1])) --b;
    return s.substr(a,b-a);
}

bool parse_flag(const std::string& value) {
    std::string v = trim(value);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return std::tolower(c); });
    return v=="1"||v=="true"||v=="on"||v=="yes";
}

RunnerConfig default_config() {
    RunnerConfig cfg;
    std::string xdg = getenv_or("XDG_STATE_HOME");
    std::string home = getenv_or("HOME");
    if (!xdg.empty()) cfg.preferred_roots.push_back(xdg + "/jobrunner");
    if (!home.empty()) cfg.preferred_roots.push_back(home + "/.local/state/jobrunner");
    cfg.preferred_roots.push_back("/tmp/jobrunner");
    return cfg;
}

static void apply_key(RunnerConfig& cfg, const std::string& key, const std::string& val) {
    if (key=="root") cfg.root_override = val;
    else if (key=="non_interactive") cfg.force_non_interactive = parse_flag(val);
    else if (key=="exit_on_completion") cfg.exit_on_completion = parse_flag(val);
    else if (key=="shell") { if (!val.empty()) cfg.shell = val; }
    else if (key=="log_level") cfg.log_level = val;
    else if (key=="log_file") cfg.log_to_file = parse_flag(val);
    else if (key=="tail_lines") {
        try { cfg.tail_lines = static_cast<std::size_t>(std::stoul(val)); }
        catch (const std::exception&) { logging::warn("config: invalid tail_lines '{}'", val); }
    }
    else logging::debug("config: ignoring unknown key '{}'", key);
}

bool load_config_file(const std::string& path, RunnerConfig& cfg) {
    std::ifstream in(path);
    if (!in) return false;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0]=='#') continue;
        auto eq = line.find('=');
        if (eq==std::string::npos) { logging::debug("config: skipping '{}'", line); continue; }
        apply_key(cfg, trim(line.substr(0,eq)), trim(line.substr(eq+1)));
    }
    return true;
}

void apply_env(RunnerConfig& cfg) {
    if (const char* v = std::getenv("JOBRUNNER_ROOT")) cfg.root_override = v;
    if (const char* v = std::getenv("JOBRUNNER_NONINTERACTIVE")) cfg.force_non_interactive = parse_flag(v);
    if (const char* v = std::getenv("JOBRUNNER_EXIT_ON_COMPLETION")) cfg.exit_on_completion = parse_flag(v);
    if (const char* v = std::getenv("JOBRUNNER_SHELL")) { if (*v) cfg.shell = v; }
    if (const char* v = std::getenv("JOBRUNNER_LOG_LEVEL")) cfg.log_level = v;
    if (const char* v = std::getenv("JOBRUNNER_LOG_FILE")) cfg.log_to_file = parse_flag(v);
}

RunnerConfig load_config() {
    RunnerConfig cfg = default_config();
    std::string home = getenv_or("HOME");
    if (!home.empty()) load_config_file(home + "/.jobrunnerrc", cfg);
    apply_env(cfg);
    return cfg;
}

} // namespace jobrunner
