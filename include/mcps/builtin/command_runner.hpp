#pragma once

// Platform check - fork/exec and process groups
#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "command_runner is only available on POSIX-compatible systems"
#endif

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

#include <tl/expected.hpp>

namespace mcps::builtin {

// ═══════════════════════════════════════════════════════════════════════════
// Shell command execution for the run_command tool
// ═══════════════════════════════════════════════════════════════════════════
// Runs `/bin/sh -c <command>` in its own process group with stdin from
// /dev/null and stderr merged into stdout. On timeout the whole group gets
// SIGKILL.

struct CommandOptions {
    std::filesystem::path working_directory;
    std::chrono::milliseconds timeout{30'000};
    std::size_t max_output_bytes{64 * 1024};
};

struct CommandOutcome {
    int exit_code{0};        // 128 + signal when killed by a signal
    bool timed_out{false};
    bool truncated{false};   // output beyond max_output_bytes was dropped
    std::string output;
};

struct CommandError {
    std::string message;
};

/// Fails only when the process cannot be started. A non-zero exit status or
/// a timeout is a successful run with that outcome.
[[nodiscard]] tl::expected<CommandOutcome, CommandError> run_shell_command(
    const std::string& command,
    const CommandOptions& options
);

}  // namespace mcps::builtin
