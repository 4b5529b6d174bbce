/*
 * Shell process spawning - jobrunner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <sys/types.h>

namespace jobrunner {

struct SpawnResult {
    pid_t pid = -1;
    int output_fd = -1;   // read end of merged stdout+stderr (capture mode)
    int error = 0;        // errno of the step that failed, 0 on success
    std::string step;     // "pipe", "fork", "exec", ...
    bool ok() const { return error == 0; }
};

// Runs `shell -c command`. With capture the child gets stdin from /dev/null,
// stdout and stderr on one pipe and its own process group; otherwise it
// inherits the caller's stdio. A failed exec is reported through a
// close-on-exec pipe, so ok() means the shell is actually running.
SpawnResult spawn_shell(const std::string& shell, const std::string& command, bool capture);

// Blocks until pid exits. Signals map to 128+signo, lost status to kExitLost.
int wait_for_exit(pid_t pid);

int exit_code_from_wait_status(int status);

} // namespace jobrunner
