/*
 * Shell process spawning implementation - jobrunner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <jobrunner/exec/spawn.hpp>
#include <jobrunner/store/job.hpp>
#include <cerrno>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace jobrunner {

static void close_fd(int& fd) {
    if (fd != -1) { close(fd); fd = -1; }
}

// Child side: only async-signal-safe calls from here on.
[[noreturn]] static void child_fail(int status_fd) {
    int e = errno;
    ssize_t w = write(status_fd, &e, sizeof e);
    (void)w;
    _exit(127);
}

SpawnResult spawn_shell(const std::string& shell, const std::string& command, bool capture) {
    SpawnResult r;
    int status_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int devnull = -1;
    auto fail = [&](const char* step) {
        r.error = errno ? errno : EIO;
        r.step = step;
        close_fd(status_pipe[0]); close_fd(status_pipe[1]);
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(devnull);
        return r;
    };

    // Everything is close-on-exec so concurrent spawns never inherit each other's pipes.
    if (pipe2(status_pipe, O_CLOEXEC) != 0) return fail("pipe");
    if (capture) {
        if (pipe2(out_pipe, O_CLOEXEC) != 0) return fail("pipe");
        devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull < 0) return fail("open /dev/null");
    }

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(shell.c_str()));
    argv.push_back(const_cast<char*>("-c"));
    argv.push_back(const_cast<char*>(command.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) return fail("fork");
    if (pid == 0) {
        if (capture) {
            setpgid(0, 0);
            if (dup2(devnull, STDIN_FILENO) < 0) child_fail(status_pipe[1]);
            if (dup2(out_pipe[1], STDOUT_FILENO) < 0) child_fail(status_pipe[1]);
            if (dup2(out_pipe[1], STDERR_FILENO) < 0) child_fail(status_pipe[1]);
        }
        execv(argv[0], argv.data());
        child_fail(status_pipe[1]);
    }

    if (capture) setpgid(pid, pid); // both sides, whichever runs first
    close_fd(status_pipe[1]);
    close_fd(out_pipe[1]);
    close_fd(devnull);

    int child_errno = 0;
    ssize_t n;
    do { n = read(status_pipe[0], &child_errno, sizeof child_errno); } while (n < 0 && errno == EINTR);
    close_fd(status_pipe[0]);
    if (n > 0) {
        int st = 0;
        while (waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
        close_fd(out_pipe[0]);
        r.error = child_errno ? child_errno : EIO;
        r.step = "exec";
        return r;
    }

    r.pid = pid;
    r.output_fd = out_pipe[0];
    return r;
}

int exit_code_from_wait_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return kExitLost;
}

int wait_for_exit(pid_t pid) {
    int st = 0;
    while (waitpid(pid, &st, 0) < 0) {
        if (errno != EINTR) return kExitLost;
    }
    return exit_code_from_wait_status(st);
}

} // namespace jobrunner
