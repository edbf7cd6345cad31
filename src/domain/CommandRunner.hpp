/**
 * @file CommandRunner.hpp
 * @brief Interface for running external binaries.
 */

#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace submitkit::domain {

/**
 * @struct CommandResult
 * @brief What a finished (or killed) subprocess left behind.
 */
struct CommandResult {
    int exitCode = -1;     ///< Exit status; -1 when the process never started or was killed.
    bool started = false;  ///< False when the binary could not be executed at all.
    bool timedOut = false; ///< True when the deadline expired and the child was killed.
    std::string output;    ///< Combined stdout/stderr, truncated to a few KiB.
};

/**
 * @class CommandRunner
 * @brief Abstract capability to execute an argv vector without a shell.
 *
 * The production implementation forks a child process; tests inject a fake
 * that records invocations and fabricates output files.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Runs argv[0] with the remaining arguments and waits for it.
     * @param argv Program name (looked up in PATH) followed by its arguments.
     * @param timeout Upper bound on wall-clock time before the child is killed.
     */
    virtual CommandResult run(const std::vector<std::string>& argv, std::chrono::seconds timeout) = 0;
};

} // namespace submitkit::domain
