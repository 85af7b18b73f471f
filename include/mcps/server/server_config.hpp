#ifndef MCPS_SERVER_SERVER_CONFIG_HPP
#define MCPS_SERVER_SERVER_CONFIG_HPP

#include "mcps/log/logger.hpp"
#include "mcps/protocol/mcp_types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <tl/expected.hpp>

namespace mcps {

// ─────────────────────────────────────────────────────────────────────────────
// Server Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct ServerConfig {
    // ─────────────────────────────────────────────────────────────────────────
    // Listener
    // ─────────────────────────────────────────────────────────────────────────

    std::string host{"127.0.0.1"};

    // 0 binds an ephemeral port; TcpServer::start() reports the real one.
    std::uint16_t port{8888};

    // Longest accepted frame, excluding the newline. A longer line closes
    // the connection because framing cannot be recovered.
    std::size_t max_message_size{1024 * 1024};

    // ─────────────────────────────────────────────────────────────────────────
    // Logging
    // ─────────────────────────────────────────────────────────────────────────

    LoggingLevel log_level{LoggingLevel::Info};

    // Also log to this file when set.
    std::optional<std::string> log_file;

    // ─────────────────────────────────────────────────────────────────────────
    // Built-in tools
    // ─────────────────────────────────────────────────────────────────────────

    // File tools cannot reach outside this directory.
    std::filesystem::path workspace_root{std::filesystem::current_path()};

    // Registers run_command.
    bool enable_shell{true};

    std::chrono::seconds command_timeout{30};

    // Captured command output beyond this is dropped and flagged.
    std::size_t max_output_bytes{64 * 1024};

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-Style Helpers
    // ─────────────────────────────────────────────────────────────────────────

    ServerConfig& with_host(std::string value);
    ServerConfig& with_port(std::uint16_t value);
    ServerConfig& with_max_message_size(std::size_t bytes);
    ServerConfig& with_log_level(LoggingLevel level);
    ServerConfig& with_log_file(std::string path);
    ServerConfig& with_workspace_root(std::filesystem::path root);
    ServerConfig& with_shell(bool enabled);
    ServerConfig& with_command_timeout(std::chrono::seconds timeout);
    ServerConfig& with_max_output_bytes(std::size_t bytes);
};

struct ConfigError {
    enum class Kind {
        Invalid,        // bad flag, bad value, unusable workspace
        HelpRequested   // --help; message holds the usage text
    };

    Kind kind{Kind::Invalid};
    std::string message;
};

template <typename T>
using ConfigResult = tl::expected<T, ConfigError>;

/// Check values that the type system does not: non-empty host, non-zero
/// sizes and timeout, workspace is an existing directory.
[[nodiscard]] ConfigResult<void> validate(const ServerConfig& config);

/// Parse the command line. MCPS_HOST, MCPS_PORT, MCPS_LOG_LEVEL and
/// MCPS_WORKSPACE provide defaults that flags override. The workspace root
/// of the returned config is canonical.
[[nodiscard]] ConfigResult<ServerConfig> load_config(int argc, const char* const argv[]);

/// Map an MCP logging level onto the logger's coarser scale.
[[nodiscard]] LogLevel to_log_level(LoggingLevel level) noexcept;

}  // namespace mcps

#endif  // MCPS_SERVER_SERVER_CONFIG_HPP
