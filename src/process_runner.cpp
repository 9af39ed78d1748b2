#include "core/process_runner.hpp"
#include "logging/logger.hpp"
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace
{
    constexpr int POLL_INTERVAL_MS = 200;
    constexpr char EXEC_FAILED_MESSAGE[] = "failed to execute program\n";

    bool needsQuoting(const std::string &arg)
    {
        if (arg.empty())
            return true;
        for (char c : arg)
        {
            if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' ||
                  c == '/' || c == ':' || c == '=' || c == ','))
            {
                return true;
            }
        }
        return false;
    }

    void appendCapped(std::string &buffer, const char *data, size_t length)
    {
        buffer.append(data, length);
        if (buffer.size() > PosixProcessRunner::MAX_CAPTURED_BYTES)
        {
            buffer.erase(0, buffer.size() - PosixProcessRunner::MAX_CAPTURED_BYTES);
        }
    }

    int waitForChild(pid_t pid)
    {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0)
        {
            if (errno != EINTR)
            {
                return -1;
            }
        }
        return status;
    }

    // Non-blocking reap; true once the child is gone (or cannot be waited for)
    bool reapIfExited(pid_t pid, int &status)
    {
        pid_t reaped = waitpid(pid, &status, WNOHANG);
        if (reaped == pid)
        {
            return true;
        }
        if (reaped < 0 && errno != EINTR)
        {
            status = -1;
            return true;
        }
        return false;
    }

    // Read whatever the pipe holds right now without waiting for more
    void drainAvailable(int fd, std::string &output)
    {
        char buffer[4096];
        pollfd pfd{fd, POLLIN, 0};
        while (poll(&pfd, 1, 0) > 0)
        {
            ssize_t n = read(fd, buffer, sizeof(buffer));
            if (n <= 0)
            {
                break;
            }
            appendCapped(output, buffer, static_cast<size_t>(n));
        }
    }
}

std::string describeCommand(const std::vector<std::string> &args)
{
    std::string cmd;
    for (const auto &arg : args)
    {
        if (!cmd.empty())
            cmd += " ";
        if (!needsQuoting(arg))
        {
            cmd += arg;
            continue;
        }
        cmd += "'";
        for (char c : arg)
        {
            if (c == '\'')
                cmd += "'\\''";
            else
                cmd += c;
        }
        cmd += "'";
    }
    return cmd;
}

ProcessResult PosixProcessRunner::run(const std::vector<std::string> &args, std::chrono::seconds timeout)
{
    ProcessResult result;
    if (args.empty())
    {
        result.error_output = "no program given";
        return result;
    }

    // Everything the child touches is prepared before fork()
    std::vector<char *> argv;
    argv.reserve(args.size() + 1);
    for (const auto &arg : args)
    {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0)
    {
        result.error_output = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0)
    {
        result.error_output = std::string("fork failed: ") + std::strerror(errno);
        close(fds[0]);
        close(fds[1]);
        return result;
    }

    if (pid == 0)
    {
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0)
        {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
        }
        dup2(fds[1], STDERR_FILENO);
        execvp(argv[0], argv.data());
        ssize_t ignored = write(STDERR_FILENO, EXEC_FAILED_MESSAGE, sizeof(EXEC_FAILED_MESSAGE) - 1);
        (void)ignored;
        _exit(127);
    }

    close(fds[1]);
    result.launched = true;

    // Runs until the child is reaped, whatever happens to its stderr
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    char buffer[4096];
    bool pipe_open = true;
    bool reaped = false;
    int status = -1;
    while (!reaped)
    {
        if (timeout.count() > 0 && std::chrono::steady_clock::now() >= deadline)
        {
            Logger::warn("Process " + args[0] + " (pid " + std::to_string(pid) + ") exceeded " +
                         std::to_string(timeout.count()) + "s, killing it");
            kill(pid, SIGKILL);
            result.timed_out = true;
            break;
        }

        if (!pipe_open)
        {
            poll(nullptr, 0, POLL_INTERVAL_MS);
            reaped = reapIfExited(pid, status);
            continue;
        }

        pollfd pfd{fds[0], POLLIN, 0};
        int ready = poll(&pfd, 1, POLL_INTERVAL_MS);
        if (ready > 0)
        {
            ssize_t n = read(fds[0], buffer, sizeof(buffer));
            if (n > 0)
            {
                appendCapped(result.error_output, buffer, static_cast<size_t>(n));
            }
            else if (n == 0 || errno != EINTR)
            {
                pipe_open = false; // EOF: nobody holds stderr any more
            }
        }
        else if (ready < 0 && errno != EINTR)
        {
            pipe_open = false;
        }
        reaped = reapIfExited(pid, status);
    }

    if (reaped && pipe_open)
    {
        drainAvailable(fds[0], result.error_output);
    }
    close(fds[0]);

    if (!reaped)
    {
        status = waitForChild(pid);
    }
    if (status >= 0 && WIFEXITED(status))
    {
        result.exit_status = WEXITSTATUS(status);
    }
    return result;
}
