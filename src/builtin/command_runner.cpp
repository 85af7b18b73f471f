#include "mcps/builtin/command_runner.hpp"

#include "mcps/log/logger.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <thread>
#include <vector>

namespace mcps::builtin {

namespace {

using Clock = std::chrono::steady_clock;

constexpr auto kReapPollInterval = std::chrono::milliseconds(10);

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

int remaining_ms(Clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

void kill_group(pid_t pid) {
    // Negative pid: the child's whole process group
    ::kill(-pid, SIGKILL);
}

}  // namespace

tl::expected<CommandOutcome, CommandError> run_shell_command(
    const std::string& command,
    const CommandOptions& options
) {
    // Everything the child touches is prepared before fork(); after fork()
    // only async-signal-safe calls are made.
    std::string shell = "/bin/sh";
    std::string flag = "-c";
    std::string script = command;
    std::array<char*, 4> argv{shell.data(), flag.data(), script.data(), nullptr};
    const std::string cwd = options.working_directory.string();

    int output_pipe[2];
    if (::pipe2(output_pipe, O_CLOEXEC) == -1) {
        return tl::unexpected(CommandError{"Failed to create pipe: " + std::string(std::strerror(errno))});
    }
    const int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull == -1) {
        ::close(output_pipe[0]);
        ::close(output_pipe[1]);
        return tl::unexpected(CommandError{"Failed to open /dev/null: " + std::string(std::strerror(errno))});
    }

    const pid_t pid = ::fork();
    if (pid == -1) {
        const int saved = errno;
        ::close(output_pipe[0]);
        ::close(output_pipe[1]);
        ::close(devnull);
        return tl::unexpected(CommandError{"Failed to fork: " + std::string(std::strerror(saved))});
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(devnull, STDIN_FILENO);
        ::dup2(output_pipe[1], STDOUT_FILENO);
        ::dup2(output_pipe[1], STDERR_FILENO);
        if (!cwd.empty() && ::chdir(cwd.c_str()) == -1) {
            _exit(126);
        }
        ::execv(argv[0], argv.data());
        _exit(127);
    }

    // Also from the parent, so kill_group() works even if the child has not
    // run setpgid yet
    ::setpgid(pid, pid);
    ::close(output_pipe[1]);
    ::close(devnull);

    CommandOutcome outcome;
    const auto deadline = Clock::now() + options.timeout;
    std::array<char, 4096> chunk{};

    while (true) {
        const int wait_ms = remaining_ms(deadline);
        if (wait_ms == 0) {
            outcome.timed_out = true;
            break;
        }

        pollfd pfd{};
        pfd.fd = output_pipe[0];
        pfd.events = POLLIN;
        const int ready = ::poll(&pfd, 1, wait_ms);
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (ready == 0) {
            continue;
        }

        const ssize_t n = ::read(output_pipe[0], chunk.data(), chunk.size());
        if (n == -1 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            break;  // every writer closed its end
        }

        const std::size_t room = options.max_output_bytes - std::min(options.max_output_bytes, outcome.output.size());
        const std::size_t take = std::min(room, static_cast<std::size_t>(n));
        outcome.output.append(chunk.data(), take);
        if (take < static_cast<std::size_t>(n)) {
            outcome.truncated = true;
        }
    }
    ::close(output_pipe[0]);

    int status = 0;
    if (outcome.timed_out) {
        kill_group(pid);
        ::waitpid(pid, &status, 0);
        outcome.exit_code = decode_status(status);
        MCPS_LOG_WARN("Command timed out after " + std::to_string(options.timeout.count()) + "ms: " + command);
        return outcome;
    }

    // Output closed; the shell may still be exiting
    while (true) {
        const pid_t reaped = ::waitpid(pid, &status, WNOHANG);
        if (reaped == pid) {
            break;
        }
        if (reaped == -1 && errno != EINTR) {
            return tl::unexpected(CommandError{"waitpid failed: " + std::string(std::strerror(errno))});
        }
        if (remaining_ms(deadline) == 0) {
            outcome.timed_out = true;
            kill_group(pid);
            ::waitpid(pid, &status, 0);
            break;
        }
        std::this_thread::sleep_for(kReapPollInterval);
    }

    outcome.exit_code = decode_status(status);
    return outcome;
}

}  // namespace mcps::builtin
