/*
 * Shell resolution - jobrunner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace jobrunner {

// Absolute path of an executable file. Names containing '/' are checked
// as given; bare names are searched in the colon separated search_path.
std::optional<std::string> resolve_executable(const std::string& name, const std::string& search_path);

// Same, searching $PATH (or the POSIX default when unset).
std::optional<std::string> resolve_executable(const std::string& name);

std::vector<std::string> split_search_path(const std::string& search_path);

} // namespace jobrunner
