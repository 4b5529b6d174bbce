/*
 * Job log sink implementation - jobrunner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <jobrunner/exec/log_sink.hpp>
#include <jobrunner/exec/spawn.hpp>
#include <jobrunner/log/logger.hpp>
#include <array>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <utility>

namespace jobrunner {

LogSink::LogSink(const JobStore& store, Job job) : m_store(store), m_job(std::move(job)) {}

bool LogSink::open() {
    m_out.open(m_job.log_path, std::ios::out | std::ios::app | std::ios::binary);
    m_ok = m_out.is_open();
    if (!m_ok) logging::error("job {}: cannot open {}", m_job.id, m_job.log_path.string());
    return m_ok;
}

void LogSink::write_header() {
    write_line("== JOB: " + m_job.name + " ==");
    write_line("== COMMAND: " + m_job.command + " ==");
    write_line("== START: " + timestamp_now() + " ==");
}

void LogSink::write_line(const std::string& line) {
    std::string l = line + '\n';
    write_chunk(l.data(), l.size());
}

void LogSink::write_chunk(const char* data, std::size_t len) {
    if (!m_ok) return;
    m_out.write(data, static_cast<std::streamsize>(len));
    m_out.flush();
    if (!m_out) {
        // Keep draining the pipe, just stop writing.
        m_ok = false;
        logging::error("job {}: write to {} failed, output from here on is dropped", m_job.id, m_job.log_path.string());
        return;
    }
    m_bytes += len;
}

namespace {
struct FdCloser {
    int fd;
    ~FdCloser() { close(fd); }
};
} // namespace

void LogSink::pump(int fd) {
    FdCloser closer{fd};
    std::array<char, 4096> buf;
    while (true) {
        ssize_t n = read(fd, buf.data(), buf.size());
        if (n > 0) { write_chunk(buf.data(), static_cast<std::size_t>(n)); continue; }
        if (n == 0) break;
        if (errno == EINTR) continue;
        logging::warn("job {}: output stream error: {}", m_job.id, std::strerror(errno));
        break;
    }
}

void LogSink::finish(int exit_code) {
    if (m_finished) return;
    write_line("== END: " + timestamp_now() + " (exit " + std::to_string(exit_code) + ") ==");
    if (m_out.is_open()) m_out.close();
    // Last action for the job: readers treat status.txt as the terminal signal.
    if (!m_store.write_status(m_job, exit_code))
        logging::error("job {}: status not recorded (exit {})", m_job.id, exit_code);
    m_finished = true;
    logging::info("job {} finished: exit {}", m_job.id, exit_code);
}

void LogSink::run(int fd, pid_t pid) noexcept {
    try {
        pump(fd);
    } catch (const std::exception& e) {
        logging::write(LogLevel::Error, "job " + m_job.id + ": log capture aborted: " + e.what());
    }
    int code = wait_for_exit(pid);
    try {
        finish(code);
    } catch (const std::exception& e) {
        logging::write(LogLevel::Error, "job " + m_job.id + ": finish failed: " + e.what());
        if (!m_finished && m_store.write_status(m_job, code)) m_finished = true;
    }
}

} // namespace jobrunner
