#include "infrastructure/ProcessCommandRunner.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace submitkit::infrastructure {

namespace {

void CloseFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Child side: never returns. Must not allocate; the argv array comes from the parent.
[[noreturn]] void ExecChild(char* const* args, int outFd, int errorReportFd) {
    setpgid(0, 0);

    // The server blocks SIGINT/SIGTERM for its watcher thread; tools get the default mask.
    sigset_t none;
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, nullptr);

    int devNull = open("/dev/null", O_RDONLY);
    if (devNull >= 0) {
        dup2(devNull, STDIN_FILENO);
        close(devNull);
    }
    dup2(outFd, STDOUT_FILENO);
    dup2(outFd, STDERR_FILENO);
    close(outFd);

    execvp(args[0], args);

    // Only reached when exec failed; report errno through the CLOEXEC pipe.
    int err = errno;
    ssize_t ignored = write(errorReportFd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

} // namespace

ProcessCommandRunner::ProcessCommandRunner(size_t maxCapturedBytes)
    : m_maxCapturedBytes(maxCapturedBytes) {}

domain::CommandResult ProcessCommandRunner::run(const std::vector<std::string>& argv, std::chrono::seconds timeout) {
    domain::CommandResult result;
    if (argv.empty()) return result;

    // Built before fork(): the child of a multithreaded process must not allocate.
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (pipe(outPipe) != 0) {
        std::cerr << "[ProcessRunner] pipe() failed: " << std::strerror(errno) << std::endl;
        return result;
    }
    if (pipe2(errPipe, O_CLOEXEC) != 0) {
        std::cerr << "[ProcessRunner] pipe2() failed: " << std::strerror(errno) << std::endl;
        CloseFd(outPipe[0]);
        CloseFd(outPipe[1]);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        std::cerr << "[ProcessRunner] fork() failed: " << std::strerror(errno) << std::endl;
        CloseFd(outPipe[0]);
        CloseFd(outPipe[1]);
        CloseFd(errPipe[0]);
        CloseFd(errPipe[1]);
        return result;
    }

    if (pid == 0) {
        close(outPipe[0]);
        close(errPipe[0]);
        ExecChild(args.data(), outPipe[1], errPipe[1]);
    }

    setpgid(pid, pid);
    CloseFd(outPipe[1]);
    CloseFd(errPipe[1]);

    // A successful exec closes the CLOEXEC pipe without writing to it.
    int execErrno = 0;
    ssize_t got;
    do {
        got = read(errPipe[0], &execErrno, sizeof(execErrno));
    } while (got < 0 && errno == EINTR);
    CloseFd(errPipe[0]);

    if (got == static_cast<ssize_t>(sizeof(execErrno))) {
        int status = 0;
        waitpid(pid, &status, 0);
        CloseFd(outPipe[0]);
        result.output = std::strerror(execErrno);
        return result;
    }
    result.started = true;

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool exited = false;
    int status = 0;
    char buffer[4096];

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) break;

        if (outPipe[0] >= 0) {
            struct pollfd pfd = {outPipe[0], POLLIN, 0};
            int waitMs = static_cast<int>(std::min<long long>(remaining.count(), 100));
            int ready = poll(&pfd, 1, waitMs);
            if (ready > 0) {
                ssize_t n = read(outPipe[0], buffer, sizeof(buffer));
                if (n > 0) {
                    size_t room = m_maxCapturedBytes > result.output.size() ? m_maxCapturedBytes - result.output.size() : 0;
                    result.output.append(buffer, std::min(static_cast<size_t>(n), room));
                } else if (n == 0) {
                    CloseFd(outPipe[0]);
                }
            }
        } else {
            usleep(20 * 1000);
        }

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            exited = true;
            break;
        }
    }

    if (!exited) {
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        waitpid(pid, &status, 0);
        CloseFd(outPipe[0]);
        result.timedOut = true;
        result.exitCode = -1;
        return result;
    }

    // Drain whatever the child wrote right before exiting.
    if (outPipe[0] >= 0) {
        fcntl(outPipe[0], F_SETFL, fcntl(outPipe[0], F_GETFL) | O_NONBLOCK);
        ssize_t n;
        while ((n = read(outPipe[0], buffer, sizeof(buffer))) > 0) {
            size_t room = m_maxCapturedBytes > result.output.size() ? m_maxCapturedBytes - result.output.size() : 0;
            result.output.append(buffer, std::min(static_cast<size_t>(n), room));
        }
        CloseFd(outPipe[0]);
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else {
        result.exitCode = -1;
    }
    return result;
}

} // namespace submitkit::infrastructure
