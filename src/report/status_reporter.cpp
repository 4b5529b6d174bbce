/*
 * Status reporting implementation - jobrunner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <jobrunner/report/status_reporter.hpp>
#include <jobrunner/log/logger.hpp>
#include <fmt/chrono.h>
#include <fmt/core.h>
#include <ctime>
#include <fstream>
#include <system_error>

namespace jobrunner {
namespace fs = std::filesystem;

static std::string code_text(const std::optional<int>& code) {
    return code ? std::to_string(*code) : std::string("-");
}

std::vector<JobSummary> StatusReporter::summarize() const {
    std::vector<JobSummary> rows;
    for (const Job& j : m_store.list()) {
        rows.push_back(JobSummary{j.id, j.name, j.state, j.exit_code});
    }
    return rows;
}

std::vector<Job> StatusReporter::recent(std::size_t n) const {
    std::vector<Job> out;
    auto listing = m_store.list();
    const auto& ids = listing.ids();
    for (auto it = ids.rbegin(); it != ids.rend() && out.size() < n; ++it) {
        out.push_back(m_store.load(*it));
    }
    return out;
}

void StatusReporter::print_summary(std::ostream& out, const std::vector<JobSummary>& rows) const {
    out << fmt::format("{:<26}  {:<9}  {:>5}  {}\n", "JOB_ID", "STATE", "CODE", "NAME");
    for (auto &r : rows) {
        out << fmt::format("{:<26}  {:<9}  {:>5}  {}\n",
                           r.id, to_string(r.state), code_text(r.exit_code), r.name.empty() ? "unnamed" : r.name);
    }
}

void StatusReporter::print_job(std::ostream& out, const Job& job) const {
    out << "id:      " << job.id << '\n'
        << "name:    " << job.name << '\n'
        << "command: " << job.command << '\n'
        << "state:   " << to_string(job.state) << '\n'
        << "exit:    " << code_text(job.exit_code) << '\n'
        << "log:     " << job.log_path.string() << '\n';
}

void StatusReporter::write_report(std::ostream& out) const {
    out << "jobrunner report - " << timestamp_now() << "\n\n";
    print_summary(out, summarize());
    out << '\n';
    for (const Job& j : m_store.list()) {
        out << "===== " << j.id << " =====\n";
        std::ifstream in(j.log_path, std::ios::binary);
        if (!in) out << "(no log)\n";
        // Inserting an empty streambuf would set failbit on out.
        else if (in.peek() != std::ifstream::traits_type::eof()) out << in.rdbuf();
        out << '\n';
    }
}

std::optional<fs::path> StatusReporter::export_report() const {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::string stem = fmt::format("report-{:%Y%m%d-%H%M%S}", tm);
    fs::path target = m_store.root() / (stem + ".txt");
    std::error_code ec;
    for (int i=1; fs::exists(target, ec) && i<100; ++i)
        target = m_store.root() / fmt::format("{}-{}.txt", stem, i);

    std::ofstream out(target);
    if (!out) {
        logging::error("cannot write report {}", target.string());
        return std::nullopt;
    }
    write_report(out);
    out.close();
    if (out.fail()) {
        logging::error("report {} incomplete", target.string());
        return std::nullopt;
    }
    logging::info("report written: {}", target.string());
    return target;
}

} // namespace jobrunner
