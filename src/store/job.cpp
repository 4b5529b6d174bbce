/*
 * Job record implementation - jobrunner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <jobrunner/store/job.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace jobrunner {

const char* to_string(JobState state) {
    switch (state) {
        case JobState::Running: return "running";
        case JobState::Succeeded: return "succeeded";
        case JobState::Failed: return "failed";
        case JobState::Unknown: return "unknown";
    }
    return "unknown";
}

std::optional<int> parse_status_line(const std::string& content) {
    static const std::string prefix = "exit ";
    size_t end = content.size();
    while (end>0 && std::isspace((unsigned char)content[end-1])) --end;
    if (end <= prefix.size() || content.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    std::string num = content.substr(prefix.size(), end-prefix.size());
    // [-]digits only; stoi alone would also take a sign or leading blanks.
    size_t digits = (!num.empty() && num[0]=='-') ? 1 : 0;
    if (digits >= num.size() || !std::all_of(num.begin()+digits, num.end(), [](unsigned char c){ return std::isdigit(c); }))
        return std::nullopt;
    try {
        size_t pos = 0;
        int code = std::stoi(num, &pos);
        if (pos != num.size()) return std::nullopt;
        return code;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

std::string format_status_line(int exit_code) {
    return "exit " + std::to_string(exit_code);
}

} // namespace jobrunner
