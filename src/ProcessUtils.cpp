#include "ProcessUtils.hpp"
#include <unistd.h>
#include <sys/wait.h>
#include <sys/select.h>
#include <array>
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <chrono>
#include <utility>

namespace ipmicurve {

namespace {

void closePipe(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
    fds[0] = fds[1] = -1;
}

// Appends whatever is currently readable; returns false once the pipe hit EOF.
bool drain(int fd, std::string& sink) {
    std::array<char, 1024> buffer;
    for (;;) {
        ssize_t bytes = read(fd, buffer.data(), buffer.size());
        if (bytes > 0) {
            sink.append(buffer.data(), static_cast<size_t>(bytes));
            continue;
        }
        if (bytes == 0) return false;
        if (errno == EINTR) continue;
        return true; // EAGAIN: nothing more for now
    }
}

[[noreturn]] void execChild(const std::vector<std::string>& args, int outFd, int errFd) {
    dup2(outFd, STDOUT_FILENO);
    dup2(errFd, STDERR_FILENO);
    if (outFd != STDOUT_FILENO && outFd != STDERR_FILENO) close(outFd);
    if (errFd != STDOUT_FILENO && errFd != STDERR_FILENO) close(errFd);

    std::vector<std::vector<char>> argStorage;
    std::vector<char*> cArgs;
    argStorage.reserve(args.size());

    for (const auto& arg : args) {
        std::vector<char> copy(arg.begin(), arg.end());
        copy.push_back('\0');
        argStorage.push_back(std::move(copy));
    }
    for (auto& stored : argStorage) {
        cArgs.push_back(stored.data());
    }
    cArgs.push_back(nullptr);

    execvp(cArgs[0], cArgs.data());
    _exit(127);
}

} // namespace

ProcessResult executeSafe(const std::vector<std::string>& args, int timeoutSec) {
    ProcessResult result = { -1, false, "", "" };

    if (args.empty()) return result;

    int pipeOut[2] = { -1, -1 };
    int pipeErr[2] = { -1, -1 };

    if (pipe(pipeOut) == -1 || pipe(pipeErr) == -1) {
        result.stdErr = "pipe() failed";
        closePipe(pipeOut);
        closePipe(pipeErr);
        return result;
    }

    pid_t pid = fork();

    if (pid == -1) {
        result.stdErr = "fork() failed";
        closePipe(pipeOut);
        closePipe(pipeErr);
        return result;
    }

    if (pid == 0) {
        close(pipeOut[0]);
        close(pipeErr[0]);
        execChild(args, pipeOut[1], pipeErr[1]);
    }

    close(pipeOut[1]);
    close(pipeErr[1]);
    fcntl(pipeOut[0], F_SETFL, O_NONBLOCK);
    fcntl(pipeErr[0], F_SETFL, O_NONBLOCK);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeoutSec);
    bool outOpen = true;
    bool errOpen = true;
    bool exited = false;
    int status = 0;

    while (!exited) {
        if (outOpen || errOpen) {
            fd_set readFds;
            FD_ZERO(&readFds);
            if (outOpen) FD_SET(pipeOut[0], &readFds);
            if (errOpen) FD_SET(pipeErr[0], &readFds);

            struct timeval tv;
            tv.tv_sec = 0;
            tv.tv_usec = 200000;

            int ready = select(std::max(pipeOut[0], pipeErr[0]) + 1, &readFds, nullptr, nullptr, &tv);
            if (ready > 0) {
                if (outOpen && FD_ISSET(pipeOut[0], &readFds)) outOpen = drain(pipeOut[0], result.stdOut);
                if (errOpen && FD_ISSET(pipeErr[0], &readFds)) errOpen = drain(pipeErr[0], result.stdErr);
            }
        } else {
            usleep(20000);
        }

        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            exited = true;
        } else if (std::chrono::steady_clock::now() > deadline) {
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            result.timedOut = true;
            exited = true;
        }
    }

    // Output still buffered in the pipes after the child exited
    if (outOpen) drain(pipeOut[0], result.stdOut);
    if (errOpen) drain(pipeErr[0], result.stdErr);

    close(pipeOut[0]);
    close(pipeErr[0]);

    if (!result.timedOut && WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    }

    return result;
}

std::string describeFailure(const ProcessResult& result) {
    if (result.timedOut) return "timed out";
    if (result.exitCode == 127) return "command not found";

    std::string reason = "exit code " + std::to_string(result.exitCode);
    std::string detail = result.stdErr;
    while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r')) {
        detail.pop_back();
    }
    if (!detail.empty()) reason += ": " + detail;
    return reason;
}

} // namespace ipmicurve
