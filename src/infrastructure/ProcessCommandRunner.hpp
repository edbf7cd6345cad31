/**
 * @file ProcessCommandRunner.hpp
 * @brief CommandRunner backed by a forked child process.
 */

#pragma once
#include "domain/CommandRunner.hpp"

namespace submitkit::infrastructure {

/**
 * @class ProcessCommandRunner
 * @brief Executes binaries via fork/execvp with no shell in between.
 *
 * Arguments are passed as a vector, so file names can never be interpreted
 * as shell syntax. The child runs in its own process group; on timeout the
 * whole group is killed.
 */
class ProcessCommandRunner : public domain::CommandRunner {
public:
    explicit ProcessCommandRunner(size_t maxCapturedBytes = 16 * 1024);

    domain::CommandResult run(const std::vector<std::string>& argv, std::chrono::seconds timeout) override;

private:
    size_t m_maxCapturedBytes;
};

} // namespace submitkit::infrastructure
