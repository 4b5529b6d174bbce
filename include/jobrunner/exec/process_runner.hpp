/*
 * Process runner - jobrunner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <jobrunner/store/job_store.hpp>
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace jobrunner {

struct ExecResult {
    bool background = false;
    int exit_code = 0;   // foreground result; kExitSpawnFailed when no job record could be made
    std::string job_id;  // background only
};

// Runs opaque shell command lines. The caller owns quoting and sanitizing:
// the string is handed to `<shell> -c` untouched.
class ProcessRunner {
public:
    explicit ProcessRunner(const JobStore& store, std::string shell = "sh");
    ~ProcessRunner();
    ProcessRunner(const ProcessRunner&) = delete;
    ProcessRunner& operator=(const ProcessRunner&) = delete;

    ExecResult execute(const std::string& command, bool background, const std::string& name = "");

    // Blocks until the command exits; stdio is inherited. No job record.
    int run(const std::string& command);

    // Starts a tracked job and returns its id without waiting. Spawn
    // failures still produce a finished job (exit kExitSpawnFailed).
    std::optional<std::string> submit(const std::string& command, const std::string& name = "");

    void wait_all();
    std::size_t active_jobs() const;

private:
    struct Task {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    void reap_finished(); // joins tasks whose job already ended

    const JobStore& m_store;
    std::string m_shell;
    mutable std::mutex m_mutex;
    std::vector<Task> m_tasks;
};

} // namespace jobrunner
