#include "process_runner.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <poll.h>
#include <signal.h>
#include <sstream>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace {

constexpr size_t kMaxErrorOutput = 64 * 1024;

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void terminateGroup(pid_t pid) {
    ::kill(-pid, SIGTERM);
    ::kill(pid, SIGTERM);
    for (int i = 0; i < 40; ++i) {
        int status = 0;
        if (::waitpid(pid, &status, WNOHANG) == pid) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
    int status = 0;
    ::waitpid(pid, &status, 0);
}

} // namespace

std::string ProcessResult::describe() const {
    if (timedOut) {
        return "timed out";
    }
    std::string firstLine;
    std::istringstream lines(errorOutput);
    while (std::getline(lines, firstLine) && firstLine.empty()) {
    }
    if (exitCode == 127 && firstLine.empty()) {
        firstLine = "command not found";
    }
    return firstLine.empty() ? std::format("exit {}", exitCode) : std::format("exit {}: {}", exitCode, firstLine);
}

std::expected<ProcessResult, std::string> ProcessRunner::run(const std::vector<std::string>& argv,
                                                             const ProcessOptions& options) const {
    if (argv.empty()) {
        return std::unexpected("Empty command line");
    }

    const bool captureOut = options.stdoutFile.empty();
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if ((captureOut && ::pipe2(outPipe, O_CLOEXEC) != 0) || ::pipe2(errPipe, O_CLOEXEC) != 0) {
        std::string err = std::format("Failed to create pipe for {}: {}", argv[0], std::strerror(errno));
        closeFd(outPipe[0]); closeFd(outPipe[1]);
        closeFd(errPipe[0]); closeFd(errPipe[1]);
        return std::unexpected(err);
    }

    const std::string inPath = options.stdinFile.empty() ? "/dev/null" : options.stdinFile;
    int inFd = ::open(inPath.c_str(), O_RDONLY | O_CLOEXEC);
    int outFd = captureOut ? -1 : ::open(options.stdoutFile.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (inFd < 0 || (!captureOut && outFd < 0)) {
        std::string err = std::format("Failed to open redirection for {}: {}", argv[0], std::strerror(errno));
        closeFd(inFd); closeFd(outFd);
        closeFd(outPipe[0]); closeFd(outPipe[1]);
        closeFd(errPipe[0]); closeFd(errPipe[1]);
        return std::unexpected(err);
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        std::string err = std::format("Failed to fork for {}: {}", argv[0], std::strerror(errno));
        closeFd(inFd); closeFd(outFd);
        closeFd(outPipe[0]); closeFd(outPipe[1]);
        closeFd(errPipe[0]); closeFd(errPipe[1]);
        return std::unexpected(err);
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        if (options.lowPriority) {
            int niceValue = ::nice(10);
            (void)niceValue;
        }
        if (!options.workingDir.empty() && ::chdir(options.workingDir.c_str()) != 0) {
            _exit(126);
        }
        ::dup2(inFd, STDIN_FILENO);
        ::dup2(captureOut ? outPipe[1] : outFd, STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::execvp(args[0], args.data());
        _exit(127);
    }

    ::setpgid(pid, pid);
    closeFd(inFd);
    closeFd(outFd);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    const bool bounded = options.timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + options.timeout;
    ProcessResult result;

    char buf[8192];
    while (outPipe[0] >= 0 || errPipe[0] >= 0) {
        if (bounded && std::chrono::steady_clock::now() >= deadline) {
            result.timedOut = true;
            break;
        }
        pollfd fds[2];
        nfds_t count = 0;
        if (outPipe[0] >= 0) fds[count++] = {outPipe[0], POLLIN, 0};
        if (errPipe[0] >= 0) fds[count++] = {errPipe[0], POLLIN, 0};
        int ready = ::poll(fds, count, 200);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (nfds_t i = 0; i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n <= 0) {
                if (n < 0 && errno == EINTR) continue;
                if (fds[i].fd == outPipe[0]) closeFd(outPipe[0]);
                else closeFd(errPipe[0]);
                continue;
            }
            if (fds[i].fd == outPipe[0]) {
                result.output.append(buf, static_cast<size_t>(n));
            } else if (result.errorOutput.size() < kMaxErrorOutput) {
                result.errorOutput.append(buf, static_cast<size_t>(n));
            }
        }
    }
    closeFd(outPipe[0]);
    closeFd(errPipe[0]);

    if (result.timedOut) {
        terminateGroup(pid);
        return result;
    }

    int status = 0;
    while (true) {
        pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            break;
        }
        if (done < 0 && errno != EINTR) {
            return std::unexpected(std::format("waitpid failed for {}: {}", argv[0], std::strerror(errno)));
        }
        if (bounded && std::chrono::steady_clock::now() >= deadline) {
            result.timedOut = true;
            terminateGroup(pid);
            return result;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    result.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}

bool ProcessRunner::commandExists(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return ::access(name.c_str(), X_OK) == 0;
    }
    const char* path = std::getenv("PATH");
    if (!path) {
        return false;
    }
    std::istringstream dirs(path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        if (::access((dir + "/" + name).c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}
