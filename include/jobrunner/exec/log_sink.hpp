/*
 * Job log sink - jobrunner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <jobrunner/store/job.hpp>
#include <jobrunner/store/job_store.hpp>
#include <cstddef>
#include <fstream>
#include <string>
#include <sys/types.h>

namespace jobrunner {

// Owns one job's log.txt for the lifetime of the job and, at the end,
// publishes its status. Nothing here throws back to the submitter: write
// failures are logged and the status write is still attempted.
class LogSink {
public:
    LogSink(const JobStore& store, Job job);
    LogSink(const LogSink&) = delete;
    LogSink& operator=(const LogSink&) = delete;

    bool open();
    void write_header();
    void write_line(const std::string& line);

    // Copies fd to the log until end of stream or a read error, flushing
    // every chunk. Closes fd.
    void pump(int fd);

    // Appends the END marker, closes the log, then writes status.txt.
    void finish(int exit_code);

    // pump + wait for pid + finish
    void run(int fd, pid_t pid) noexcept;

    bool healthy() const { return m_ok; }
    bool finished() const { return m_finished; }
    std::size_t bytes_written() const { return m_bytes; }

private:
    void write_chunk(const char* data, std::size_t len);

    const JobStore& m_store;
    Job m_job;
    std::ofstream m_out;
    bool m_ok = false;
    bool m_finished = false;
    std::size_t m_bytes = 0;
};

} // namespace jobrunner
