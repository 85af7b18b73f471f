#include "mcps/server/server_config.hpp"

#include <cxxopts.hpp>

#include <cstdlib>
#include <limits>
#include <system_error>

namespace mcps {

ServerConfig& ServerConfig::with_host(std::string value) {
    host = std::move(value);
    return *this;
}

ServerConfig& ServerConfig::with_port(std::uint16_t value) {
    port = value;
    return *this;
}

ServerConfig& ServerConfig::with_max_message_size(std::size_t bytes) {
    max_message_size = bytes;
    return *this;
}

ServerConfig& ServerConfig::with_log_level(LoggingLevel level) {
    log_level = level;
    return *this;
}

ServerConfig& ServerConfig::with_log_file(std::string path) {
    log_file = std::move(path);
    return *this;
}

ServerConfig& ServerConfig::with_workspace_root(std::filesystem::path root) {
    workspace_root = std::move(root);
    return *this;
}

ServerConfig& ServerConfig::with_shell(bool enabled) {
    enable_shell = enabled;
    return *this;
}

ServerConfig& ServerConfig::with_command_timeout(std::chrono::seconds timeout) {
    command_timeout = timeout;
    return *this;
}

ServerConfig& ServerConfig::with_max_output_bytes(std::size_t bytes) {
    max_output_bytes = bytes;
    return *this;
}

namespace {

tl::unexpected<ConfigError> invalid(std::string message) {
    return tl::unexpected(ConfigError{ConfigError::Kind::Invalid, std::move(message)});
}

std::string get_env(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? value : fallback;
}

ConfigResult<std::uint16_t> parse_port(const std::string& text) {
    std::size_t consumed = 0;
    long value = -1;
    try {
        value = std::stol(text, &consumed);
    } catch (const std::exception&) {
        return invalid("port is not a number: '" + text + "'");
    }
    if (consumed != text.size() || value < 0 || value > std::numeric_limits<std::uint16_t>::max()) {
        return invalid("port must be between 0 and 65535: '" + text + "'");
    }
    return static_cast<std::uint16_t>(value);
}

}  // namespace

ConfigResult<void> validate(const ServerConfig& config) {
    if (config.host.empty()) {
        return invalid("host cannot be empty");
    }
    if (config.max_message_size == 0) {
        return invalid("max message size must be positive");
    }
    if (config.command_timeout.count() <= 0) {
        return invalid("command timeout must be positive");
    }
    if (config.max_output_bytes == 0) {
        return invalid("max output bytes must be positive");
    }
    std::error_code ec;
    if (std::filesystem::is_directory(config.workspace_root, ec) == false) {
        return invalid("workspace is not a directory: " + config.workspace_root.string());
    }
    return {};
}

ConfigResult<ServerConfig> load_config(int argc, const char* const argv[]) {
    cxxopts::Options options("mcps-server", "Model Context Protocol server over TCP");

    ServerConfig defaults;
    options.add_options()
        ("host", "Address to bind (or MCPS_HOST)",
            cxxopts::value<std::string>()->default_value(get_env("MCPS_HOST", defaults.host)))
        ("p,port", "Port to bind, 0 for any (or MCPS_PORT)",
            cxxopts::value<std::string>()->default_value(get_env("MCPS_PORT", std::to_string(defaults.port))))
        ("max-message-size", "Largest accepted message in bytes",
            cxxopts::value<std::size_t>()->default_value(std::to_string(defaults.max_message_size)))
        ("log-level", "debug, info, notice, warning, error, critical, alert or emergency (or MCPS_LOG_LEVEL)",
            cxxopts::value<std::string>()->default_value(get_env("MCPS_LOG_LEVEL", to_string(defaults.log_level))))
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>())
        ("w,workspace", "Root directory for the file tools (or MCPS_WORKSPACE)",
            cxxopts::value<std::string>()->default_value(get_env("MCPS_WORKSPACE", defaults.workspace_root.string())))
        ("no-shell", "Do not register the run_command tool")
        ("command-timeout", "Seconds before run_command is killed",
            cxxopts::value<long>()->default_value(std::to_string(defaults.command_timeout.count())))
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            return tl::unexpected(ConfigError{ConfigError::Kind::HelpRequested, options.help()});
        }

        ServerConfig config;
        config.with_host(result["host"].as<std::string>());

        auto port = parse_port(result["port"].as<std::string>());
        if (!port) {
            return tl::unexpected(port.error());
        }
        config.with_port(*port);

        config.with_max_message_size(result["max-message-size"].as<std::size_t>());

        const auto level_name = result["log-level"].as<std::string>();
        const auto level = logging_level_from_string(level_name);
        if (!level) {
            return invalid("unknown log level: '" + level_name + "'");
        }
        config.with_log_level(*level);

        if (result.count("log-file")) {
            config.with_log_file(result["log-file"].as<std::string>());
        }

        std::error_code ec;
        const auto workspace = std::filesystem::weakly_canonical(result["workspace"].as<std::string>(), ec);
        if (ec) {
            return invalid("cannot resolve workspace: " + ec.message());
        }
        config.with_workspace_root(workspace);

        config.with_shell(result.count("no-shell") == 0);
        config.with_command_timeout(std::chrono::seconds(result["command-timeout"].as<long>()));

        auto valid = validate(config);
        if (!valid) {
            return tl::unexpected(valid.error());
        }
        return config;
    } catch (const cxxopts::exceptions::exception& e) {
        return invalid(e.what());
    }
}

LogLevel to_log_level(LoggingLevel level) noexcept {
    switch (level) {
        case LoggingLevel::Debug:     return LogLevel::Debug;
        case LoggingLevel::Info:      return LogLevel::Info;
        case LoggingLevel::Notice:    return LogLevel::Info;
        case LoggingLevel::Warning:   return LogLevel::Warn;
        case LoggingLevel::Error:     return LogLevel::Error;
        case LoggingLevel::Critical:  return LogLevel::Fatal;
        case LoggingLevel::Alert:     return LogLevel::Fatal;
        case LoggingLevel::Emergency: return LogLevel::Fatal;
    }
    return LogLevel::Info;
}

}  // namespace mcps
