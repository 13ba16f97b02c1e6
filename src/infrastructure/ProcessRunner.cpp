/**
 * @file ProcessRunner.cpp
 * @brief Implementation of ProcessRunner.
 */

#include "infrastructure/ProcessRunner.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace smartocr::infrastructure {

std::string ProcessRunner::Quote(const std::string& value) {
    std::string out = "'";
    for (char ch : value) {
        if (ch == '\'') {
            out += "'\\''";
        } else {
            out.push_back(ch);
        }
    }
    out += "'";
    return out;
}

ProcessResult ProcessRunner::RunShell(const std::string& commandLine) {
    ProcessResult result;
    int fds[2];
    // Close-on-exec so commands started concurrently from other threads never hold our write end.
    if (pipe2(fds, O_CLOEXEC) != 0) {
        std::cerr << "[ProcessRunner] pipe failed: " << std::strerror(errno) << std::endl;
        return result;
    }

    const pid_t pid = fork();
    if (pid < 0) {
        std::cerr << "[ProcessRunner] fork failed: " << std::strerror(errno) << std::endl;
        ::close(fds[0]);
        ::close(fds[1]);
        return result;
    }

    if (pid == 0) {
        // Own process group: a terminal Ctrl-C reaches only us, and we turn it into a cancellation.
        setpgid(0, 0);
        int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            ::close(devNull);
        }
        dup2(fds[1], STDOUT_FILENO);
        ::close(fds[0]);
        ::close(fds[1]);
        execl("/bin/sh", "sh", "-c", commandLine.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    ::close(fds[1]);
    char buffer[4096];
    std::stringstream ss;
    while (true) {
        const ssize_t n = read(fds[0], buffer, sizeof(buffer));
        if (n > 0) {
            ss.write(buffer, static_cast<std::streamsize>(n));
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    ::close(fds[0]);

    int status = 0;
    pid_t waited = 0;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited == pid && WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    }
    result.output = ss.str();
    return result;
}

ProcessResult ProcessRunner::Run(const std::string& program,
                                 const std::vector<std::string>& args,
                                 std::chrono::seconds timeout,
                                 bool mergeStderr) {
    std::stringstream cmd;
    if (timeout.count() > 0 && IsAvailable("timeout")) {
        cmd << "timeout " << timeout.count() << " ";
    }
    cmd << Quote(program);
    for (const auto& arg : args) {
        cmd << " " << Quote(arg);
    }
    cmd << (mergeStderr ? " 2>&1" : " 2>/dev/null");
    return RunShell(cmd.str());
}

bool ProcessRunner::IsAvailable(const std::string& program) {
    return RunShell("command -v " + Quote(program) + " >/dev/null 2>&1").succeeded();
}

} // namespace smartocr::infrastructure
