/**
 * @file process.hpp
 * @brief Run a child process to completion with piped stdin/stdout/stderr
 */

#pragma once

#include <string>
#include <vector>
#include <sys/types.h>

namespace Terrasplit {

struct ProcessResult {
    int exit_code = -1;        // -1 when the child was killed by a signal
    int signal = 0;
    std::string stdout_text;
    std::string stderr_text;

    bool succeeded() const { return exit_code == 0; }
};

/**
 * @brief Owns a forked child until it has been waited for
 *
 * If the owner unwinds before wait(), the destructor kills the child with
 * SIGKILL and reaps it so no zombie is left behind.
 */
class ChildProcess {
public:
    explicit ChildProcess(pid_t pid) : pid_(pid) {}
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /**
     * @brief Block until the child exits; returns the raw waitpid status.
     * @throws std::system_error if waitpid fails
     */
    int wait();

    pid_t pid() const { return pid_; }
    bool reaped() const { return reaped_; }

private:
    pid_t pid_;
    bool reaped_ = false;
};

/**
 * @brief Execute `executable args...` in working_directory and wait for it
 *
 * The executable is looked up on PATH. `input` is written to the child's
 * stdin, which is then closed. Exit status 127 with a message on stderr
 * means the executable could not be started; 126 means the working
 * directory could not be entered.
 *
 * @throws std::system_error if pipes or the child cannot be created
 */
ProcessResult run_process(const std::string& executable,
                          const std::vector<std::string>& args,
                          const std::string& working_directory,
                          const std::string& input = "");

} // namespace Terrasplit
