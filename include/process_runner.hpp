/**
 * @file process_runner.hpp
 * @brief Runs external tools (gpg, docker, rclone) without a shell.
 *
 * Arguments are passed straight to execvp, so nothing is re-parsed by a shell and
 * secrets never appear on a command line. Each run has an optional wall-clock
 * timeout after which the child is terminated.
 */

#ifndef PROCESS_RUNNER_HPP
#define PROCESS_RUNNER_HPP

#include <chrono>
#include <expected>
#include <string>
#include <vector>

/**
 * @brief Per-invocation options.
 */
struct ProcessOptions {
    std::chrono::seconds timeout{0}; ///< Zero means no limit.
    bool lowPriority = false;        ///< Run the child at nice 10.
    std::string stdinFile;           ///< Redirect stdin from this file (default /dev/null).
    std::string stdoutFile;          ///< Redirect stdout to this file instead of capturing it.
    std::string workingDir;          ///< Change to this directory in the child.
};

/**
 * @brief Outcome of a finished (or killed) child process.
 */
struct ProcessResult {
    int exitCode = -1;        ///< Exit status, or -1 if killed by a signal.
    bool timedOut = false;    ///< True if the timeout expired and the child was killed.
    std::string output;       ///< Captured stdout (empty when redirected to a file).
    std::string errorOutput;  ///< Captured stderr, truncated to 64 KiB.

    bool ok() const { return !timedOut && exitCode == 0; }

    /**
     * @brief One-line description for logs ("exit 2: <first stderr line>").
     */
    std::string describe() const;
};

class ProcessRunner {
public:
    /**
     * @brief Runs a command and waits for it.
     *
     * @param argv Program and arguments; argv[0] is looked up in PATH.
     * @param options Redirection, priority and timeout options.
     * @return std::expected<ProcessResult, std::string> The result, or an error if the process could not be started.
     */
    std::expected<ProcessResult, std::string> run(const std::vector<std::string>& argv,
                                                  const ProcessOptions& options = {}) const;

    /**
     * @brief Checks whether an executable is reachable through PATH.
     */
    static bool commandExists(const std::string& name);
};

#endif // PROCESS_RUNNER_HPP
