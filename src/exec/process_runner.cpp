/*
 * Process runner implementation - jobrunner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <jobrunner/exec/process_runner.hpp>
#include <jobrunner/exec/log_sink.hpp>
#include <jobrunner/exec/path.hpp>
#include <jobrunner/exec/spawn.hpp>
#include <jobrunner/log/logger.hpp>
#include <cstring>
#include <iostream>
#include <utility>

namespace jobrunner {

ProcessRunner::ProcessRunner(const JobStore& store, std::string shell)
    : m_store(store), m_shell(shell.empty() ? "sh" : std::move(shell)) {}

ProcessRunner::~ProcessRunner() { wait_all(); }

ExecResult ProcessRunner::execute(const std::string& command, bool background, const std::string& name) {
    ExecResult r;
    r.background = background;
    if (!background) {
        r.exit_code = run(command);
        return r;
    }
    auto id = submit(command, name);
    if (id) r.job_id = *id;
    else r.exit_code = kExitSpawnFailed;
    return r;
}

int ProcessRunner::run(const std::string& command) {
    auto shell = resolve_executable(m_shell);
    if (!shell) {
        logging::warn("{}: shell not found", m_shell);
        return kExitSpawnFailed;
    }
    std::cout.flush();
    std::cerr.flush();
    SpawnResult sp = spawn_shell(*shell, command, false);
    if (!sp.ok()) {
        logging::warn("cannot run '{}': {} failed: {}", command, sp.step, std::strerror(sp.error));
        return kExitSpawnFailed;
    }
    int code = wait_for_exit(sp.pid);
    logging::debug("'{}' exited with {}", command, code);
    return code;
}

std::optional<std::string> ProcessRunner::submit(const std::string& command, const std::string& name) {
    reap_finished();
    auto job = m_store.allocate(name, command);
    if (!job) return std::nullopt;
    std::string id = job->id;

    auto sink = std::make_shared<LogSink>(m_store, *job);
    sink->open();
    sink->write_header();

    auto shell = resolve_executable(m_shell);
    if (!shell) {
        sink->write_line(m_shell + ": shell not found");
        sink->finish(kExitSpawnFailed);
        logging::warn("job {}: {}: shell not found", id, m_shell);
        return id;
    }
    SpawnResult sp = spawn_shell(*shell, command, true);
    if (!sp.ok()) {
        sink->write_line("spawn failed: " + sp.step + ": " + std::strerror(sp.error));
        sink->finish(kExitSpawnFailed);
        logging::warn("job {}: spawn failed: {}: {}", id, sp.step, std::strerror(sp.error));
        return id;
    }
    if (!m_store.write_pid(*job, sp.pid)) logging::warn("job {}: cannot record pid {}", id, sp.pid);
    logging::info("job {} started (pid {}): {}", id, sp.pid, command);

    auto done = std::make_shared<std::atomic<bool>>(false);
    int fd = sp.output_fd;
    pid_t pid = sp.pid;
    try {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_tasks.reserve(m_tasks.size() + 1);
        m_tasks.push_back(Task{std::thread([sink, fd, pid, done]() {
            sink->run(fd, pid);
            done->store(true);
        }), done});
    } catch (const std::exception& e) {
        // No thread available: capture in the caller's context instead.
        logging::error("job {}: cannot start log task ({}), capturing inline", id, e.what());
        sink->run(fd, pid);
    }
    return id;
}

void ProcessRunner::reap_finished() {
    std::vector<Task> finished;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_tasks.begin(); it != m_tasks.end();) {
            if (it->done->load()) { finished.push_back(std::move(*it)); it = m_tasks.erase(it); }
            else ++it;
        }
    }
    for (auto &t : finished) if (t.thread.joinable()) t.thread.join();
}

void ProcessRunner::wait_all() {
    while (true) {
        std::vector<Task> pending;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            pending.swap(m_tasks);
        }
        if (pending.empty()) return;
        for (auto &t : pending) if (t.thread.joinable()) t.thread.join();
    }
}

std::size_t ProcessRunner::active_jobs() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::size_t n = 0;
    for (auto &t : m_tasks) if (!t.done->load()) ++n;
    return n;
}

} // namespace jobrunner
