/*
 * Status reporting - jobrunner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <jobrunner/store/job_store.hpp>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace jobrunner {

struct JobSummary {
    std::string id;
    std::string name;
    JobState state = JobState::Unknown;
    std::optional<int> exit_code;
};

// Read side only: never mutates job records.
class StatusReporter {
public:
    explicit StatusReporter(const JobStore& store) : m_store(store) {}

    std::vector<JobSummary> summarize() const;   // submission order
    std::vector<Job> recent(std::size_t n) const; // newest first

    void print_summary(std::ostream& out, const std::vector<JobSummary>& rows) const;
    void print_job(std::ostream& out, const Job& job) const;

    // Summary plus every job log, as one plain-text document.
    void write_report(std::ostream& out) const;
    // Writes <root>/report-YYYYmmdd-HHMMSS.txt and returns its path.
    std::optional<std::filesystem::path> export_report() const;

private:
    const JobStore& m_store;
};

} // namespace jobrunner
