#pragma once

#include <chrono>
#include <string>
#include <vector>

/**
 * @brief Outcome of one external process run
 */
struct ProcessResult
{
    bool launched = false;
    bool timed_out = false;
    int exit_status = -1; // -1 when the process did not exit normally
    std::string error_output;

    bool success() const { return launched && !timed_out && exit_status == 0; }
};

/**
 * @brief Runs an external program to completion
 */
class ProcessRunner
{
public:
    virtual ~ProcessRunner() = default;

    /**
     * @brief Run args[0] with the remaining arguments and wait for it to exit
     * @param args Program followed by its arguments, passed without a shell
     * @param timeout Kill the process after this long; zero means no limit
     */
    virtual ProcessResult run(const std::vector<std::string> &args, std::chrono::seconds timeout) = 0;
};

/**
 * @brief fork/exec runner capturing the child's stderr
 *
 * stdin and stdout of the child are /dev/null. Only the last
 * MAX_CAPTURED_BYTES of stderr are kept.
 */
class PosixProcessRunner : public ProcessRunner
{
public:
    static constexpr size_t MAX_CAPTURED_BYTES = 64 * 1024;

    ProcessResult run(const std::vector<std::string> &args, std::chrono::seconds timeout) override;
};

// Render args as a shell-quoted command line for logging
std::string describeCommand(const std::vector<std::string> &args);
