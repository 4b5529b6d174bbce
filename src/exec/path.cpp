/*
 * Shell resolution implementation - jobrunner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <jobrunner/exec/path.hpp>
#include <cstdlib>
#include <sys/stat.h>
#include <unistd.h>

namespace jobrunner {

static bool is_executable_file(const std::string& p) {
    struct stat st{};
    if (stat(p.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return access(p.c_str(), X_OK) == 0;
}

std::vector<std::string> split_search_path(const std::string& search_path) {
    std::vector<std::string> dirs;
    size_t start = 0;
    while (start <= search_path.size()) {
        size_t colon = search_path.find(':', start);
        if (colon == std::string::npos) colon = search_path.size();
        // An empty entry means the current directory.
        std::string d = search_path.substr(start, colon-start);
        dirs.push_back(d.empty() ? "." : d);
        start = colon+1;
    }
    return dirs;
}

std::optional<std::string> resolve_executable(const std::string& name, const std::string& search_path) {
    if (name.empty()) return std::nullopt;
    if (name.find('/') != std::string::npos) {
        if (is_executable_file(name)) return name;
        return std::nullopt;
    }
    for (auto &dir : split_search_path(search_path)) {
        std::string full = dir + '/' + name;
        if (is_executable_file(full)) return full;
    }
    return std::nullopt;
}

std::optional<std::string> resolve_executable(const std::string& name) {
    const char* env = std::getenv("PATH");
    return resolve_executable(name, env && *env ? env : "/usr/bin:/bin");
}

} // namespace jobrunner
