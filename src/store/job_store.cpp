/*
 * Job store implementation - jobrunner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <jobrunner/store/job_store.hpp>
#include <jobrunner/log/logger.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <deque>
#include <fstream>
#include <sstream>
#include <system_error>
#include <tuple>
#include <unistd.h>

namespace jobrunner {
namespace fs = std::filesystem;

namespace {

std::atomic<unsigned long> g_seq{0};

using IdKey = std::tuple<long long, long long, long long>;

// (ms, pid, seq) for ids this store generated; nullopt for foreign names.
std::optional<IdKey> parse_id(const std::string& id) {
    long long parts[3];
    size_t start = 0;
    for (int i=0;i<3;++i) {
        size_t dash = id.find('-', start);
        if ((i<2) != (dash!=std::string::npos)) return std::nullopt;
        std::string part = id.substr(start, i<2 ? dash-start : std::string::npos);
        if (part.empty() || !std::all_of(part.begin(), part.end(), [](unsigned char c){ return std::isdigit(c); }))
            return std::nullopt;
        try { parts[i] = std::stoll(part); } catch (const std::out_of_range&) { return std::nullopt; }
        start = dash+1;
    }
    return IdKey{parts[0], parts[1], parts[2]};
}

bool id_less(const std::string& a, const std::string& b) {
    auto ka = parse_id(a), kb = parse_id(b);
    if (ka && kb) return *ka < *kb;
    if (ka || kb) return static_cast<bool>(ka); // well-formed ids first
    return a < b;
}

bool write_text(const fs::path& p, const std::string& content) {
    std::ofstream out(p, std::ios::trunc);
    if (!out) return false;
    out << content;
    out.close();
    return !out.fail();
}

std::optional<std::string> read_text(const fs::path& p) {
    std::ifstream in(p);
    if (!in) return std::nullopt;
    std::ostringstream oss; oss << in.rdbuf();
    return oss.str();
}

std::string first_line(const std::string& s) {
    return s.substr(0, s.find('\n'));
}

std::string chomp(std::string s) {
    while (!s.empty() && (s.back()=='\n' || s.back()=='\r')) s.pop_back();
    return s;
}

} // namespace

Job JobListing::iterator::operator*() const { return m_store->load(*m_it); }

JobStore::JobStore(fs::path root) : m_root(std::move(root)), m_jobs(m_root / "jobs") {}

std::string JobStore::make_id() {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return std::to_string(ms) + '-' + std::to_string(getpid()) + '-' + std::to_string(g_seq.fetch_add(1));
}

Job JobStore::layout(const std::string& id) const {
    Job j;
    j.id = id;
    j.dir = m_jobs / id;
    j.name_path = j.dir / "name.txt";
    j.command_path = j.dir / "command.txt";
    j.pid_path = j.dir / "pid.txt";
    j.log_path = j.dir / "log.txt";
    j.status_path = j.dir / "status.txt";
    return j;
}

std::optional<Job> JobStore::allocate(const std::string& name, const std::string& command) const {
    std::error_code ec;
    fs::create_directories(m_jobs, ec);
    if (ec) { logging::error("cannot create {}: {}", m_jobs.string(), ec.message()); return std::nullopt; }
    // create_directory reports false when the path already exists; try the next sequence number.
    for (int attempt=0; attempt<64; ++attempt) {
        Job j = layout(make_id());
        bool created = fs::create_directory(j.dir, ec);
        if (ec) { logging::error("cannot create job dir {}: {}", j.dir.string(), ec.message()); return std::nullopt; }
        if (!created) continue;
        j.name = name.empty() ? command : name;
        j.command = command;
        j.state = JobState::Running;
        // The directory exists now, so the job has to reach a status even if
        // its metadata is incomplete on disk.
        if (!write_text(j.name_path, j.name + '\n') || !write_text(j.command_path, command + '\n'))
            logging::error("job {}: cannot persist name/command", j.id);
        logging::debug("allocated job {} ({})", j.id, j.name);
        return j;
    }
    logging::error("could not allocate a unique job id under {}", m_jobs.string());
    return std::nullopt;
}

JobListing JobStore::list() const {
    std::vector<std::string> ids;
    std::error_code ec;
    for (fs::directory_iterator it(m_jobs, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code dec;
        if (it->is_directory(dec)) ids.push_back(it->path().filename().string());
    }
    if (ec && ec != std::errc::no_such_file_or_directory)
        logging::warn("listing {}: {}", m_jobs.string(), ec.message());
    std::sort(ids.begin(), ids.end(), id_less);
    return JobListing(this, std::move(ids));
}

Job JobStore::load(const std::string& id) const {
    Job j = layout(id);
    if (auto name = read_text(j.name_path)) j.name = first_line(*name);
    if (auto cmd = read_text(j.command_path)) j.command = chomp(*cmd);
    auto st = read_status(j);
    j.state = st.state;
    j.exit_code = st.exit_code;
    return j;
}

std::optional<Job> JobStore::find(const std::string& id) const {
    if (id.empty() || id.find('/') != std::string::npos || id=="." || id=="..") return std::nullopt;
    std::error_code ec;
    if (!fs::is_directory(m_jobs / id, ec)) return std::nullopt;
    return load(id);
}

StatusRecord JobStore::read_status(const Job& job) const {
    StatusRecord r;
    std::error_code ec;
    if (!fs::is_directory(job.dir, ec)) return r;
    if (!fs::exists(job.status_path, ec)) {
        r.state = ec ? JobState::Unknown : JobState::Running;
        return r;
    }
    auto content = read_text(job.status_path);
    if (!content) return r;
    auto code = parse_status_line(*content);
    if (!code) {
        logging::debug("job {}: malformed status '{}'", job.id, first_line(*content));
        return r;
    }
    r.exit_code = *code;
    r.state = state_for_exit(*code);
    return r;
}

StatusRecord JobStore::read_status(const std::string& id) const {
    auto job = find(id);
    if (!job) return StatusRecord{};
    return StatusRecord{job->state, job->exit_code};
}

std::vector<std::string> JobStore::tail_log(const Job& job, std::size_t n) const {
    std::vector<std::string> out;
    if (n == 0) return out;
    std::ifstream in(job.log_path);
    if (!in) return out;
    std::deque<std::string> window;
    std::string line;
    while (std::getline(in, line)) {
        window.push_back(line);
        if (window.size() > n) window.pop_front();
    }
    out.assign(window.begin(), window.end());
    return out;
}

bool JobStore::write_status(const Job& job, int exit_code) const {
    std::error_code ec;
    if (fs::exists(job.status_path, ec)) {
        logging::warn("job {}: status already written, keeping it", job.id);
        return false;
    }
    fs::path tmp = job.dir / "status.txt.tmp";
    if (!write_text(tmp, format_status_line(exit_code) + '\n')) {
        logging::error("job {}: cannot write {}", job.id, tmp.string());
        return false;
    }
    fs::rename(tmp, job.status_path, ec);
    if (ec) {
        logging::error("job {}: cannot publish status: {}", job.id, ec.message());
        return false;
    }
    return true;
}

bool JobStore::write_pid(const Job& job, pid_t pid) const {
    return write_text(job.pid_path, std::to_string(pid) + '\n');
}

} // namespace jobrunner
