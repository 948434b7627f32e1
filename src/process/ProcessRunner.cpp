#include "process/ProcessRunner.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <thread>
#include <unistd.h>
#include <sys/wait.h>
#include <fmt/core.h>

using namespace ms::process;
using Clock = std::chrono::steady_clock;

namespace {

int decodeStatus(const int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

void killGroup(const pid_t pid) {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
}

int remainingMs(const Clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

}

ProcessResult PosixProcessRunner::run(const std::vector<std::string>& argv,
                                      const std::chrono::milliseconds timeout,
                                      const size_t maxOutput) {
    if (argv.empty()) throw std::invalid_argument("Cannot run an empty command line");

    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) == -1) throw std::runtime_error("Failed to create pipe for subprocess output");

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        throw std::runtime_error(fmt::format("Failed to fork subprocess for {}", argv.front()));
    }

    if (pid == 0) {
        // Child: own process group so a timeout can take down anything it spawned
        setpgid(0, 0);
        dup2(pipefd[1], STDOUT_FILENO);
        if (const int devnull = open("/dev/null", O_RDWR); devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) close(devnull);
        }
        execvp(args[0], args.data());
        _exit(127); // exec failed
    }

    close(pipefd[1]);
    const int fd = pipefd[0];
    fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK);

    ProcessResult result;
    const auto deadline = Clock::now() + timeout;
    std::array<char, 8192> buf{};

    while (true) {
        const int left = remainingMs(deadline);
        if (left == 0) {
            result.timed_out = true;
            break;
        }

        pollfd pfd{fd, POLLIN, 0};
        const int rc = poll(&pfd, 1, left);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;

        const ssize_t n = read(fd, buf.data(), buf.size());
        if (n > 0) {
            result.out.append(buf.data(), static_cast<size_t>(n));
            if (result.out.size() > maxOutput) {
                result.output_truncated = true;
                result.out.resize(maxOutput);
                break;
            }
            continue;
        }
        if (n == 0) break; // EOF
        if (errno == EAGAIN || errno == EINTR) continue;
        break;
    }
    close(fd);

    if (result.timed_out || result.output_truncated) killGroup(pid);

    // stdout may close before the process exits; keep honouring the deadline
    int status = 0;
    while (true) {
        const pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) break;
        if (w < 0 && errno != EINTR) {
            status = -1;
            break;
        }
        if (remainingMs(deadline) == 0 && !result.timed_out) {
            result.timed_out = true;
            killGroup(pid);
        }
        if (result.timed_out || result.output_truncated) {
            waitpid(pid, &status, 0);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    result.exit_code = status == -1 ? -1 : decodeStatus(status);
    return result;
}
