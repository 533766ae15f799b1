/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <command.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <util.h>

namespace WallpaperRotate {

CommandResult ProcessCommandRunner::Run(const std::vector<std::string>& argv)
{
    CommandResult result;

    if (argv.empty()) {
        error_log("%s: empty command.",
                  __func__);
        return result;
    }

    debug_log("INFO: %s: executing: %s",
              __func__,
              CommandToString(argv));

    int pipe_fds[2];

    if (pipe2(pipe_fds, O_CLOEXEC) == -1) {
        error_log("%s: pipe2() failed for %s: %s",
                  __func__,
                  argv[0],
                  strerror(errno));
        return result;
    }

    // Build the argument vector before forking. Only async-signal-safe calls are allowed in the child.
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);

    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }

    c_argv.push_back(nullptr);

    pid_t pid = fork();

    if (pid == -1) {
        error_log("%s: fork() failed for %s: %s",
                  __func__,
                  argv[0],
                  strerror(errno));

        close(pipe_fds[0]);
        close(pipe_fds[1]);
        return result;
    }

    if (pid == 0) {
        // Child. dup2 clears O_CLOEXEC on the new descriptor.
        if (dup2(pipe_fds[1], STDOUT_FILENO) == -1) {
            _exit(127);
        }

        execvp(c_argv[0], c_argv.data());

        _exit(127);
    }

    // Parent
    close(pipe_fds[1]);

    char buffer[4096];

    while (true) {
        ssize_t bytes_read = read(pipe_fds[0], buffer, sizeof(buffer));

        if (bytes_read > 0) {
            result.m_output.append(buffer, static_cast<size_t>(bytes_read));
        } else if (bytes_read == 0) {
            break;
        } else if (errno != EINTR) {
            error_log("%s: error reading output of %s: %s",
                      __func__,
                      argv[0],
                      strerror(errno));
            break;
        }
    }

    close(pipe_fds[0]);

    int status = 0;

    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            error_log("%s: waitpid() failed for %s: %s",
                      __func__,
                      argv[0],
                      strerror(errno));
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.m_exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.m_exit_code = 128 + WTERMSIG(status);
    }

    if (result.m_exit_code == 127) {
        debug_log("WARNING: %s: %s exited with 127, the program may not be installed.",
                  __func__,
                  argv[0]);
    }

    return result;
}

std::string CommandToString(const std::vector<std::string>& argv)
{
    std::string out;

    for (const auto& arg : argv) {
        if (!out.empty()) {
            out += " ";
        }

        out += arg;
    }

    return out;
}

} // namespace WallpaperRotate
