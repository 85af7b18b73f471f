// ─────────────────────────────────────────────────────────────────────────────
// mcps-server - MCP server over TCP
// ─────────────────────────────────────────────────────────────────────────────
// Usage:
//   mcps-server --port 8888 --workspace ./sandbox
//   mcps-server --port 0 --no-shell --log-level debug --log-file server.log
//
// Each client connects over TCP and exchanges newline-delimited JSON-RPC
// messages. SIGINT or SIGTERM stops accepting, lets in-flight requests
// finish and exits.

#include "mcps/builtin/prompts.hpp"
#include "mcps/builtin/tools.hpp"
#include "mcps/json/fast_json.hpp"
#include "mcps/log/logger.hpp"
#include "mcps/log/spdlog_logger.hpp"
#include "mcps/server/dispatcher.hpp"
#include "mcps/server/server_config.hpp"
#include "mcps/transport/tcp_server.hpp"
#include "mcps/version.hpp"

#include <asio/signal_set.hpp>

#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

using namespace mcps;

namespace {

void install_logger(const ServerConfig& config) {
    SpdlogOptions options;
    options.threshold = to_log_level(config.log_level);
    options.file = config.log_file;
    set_logger(make_spdlog_logger(options));
}

}  // namespace

int main(int argc, char* argv[]) {
    auto loaded = load_config(argc, argv);
    if (!loaded) {
        if (loaded.error().kind == ConfigError::Kind::HelpRequested) {
            std::cout << loaded.error().message << "\n";
            return 0;
        }
        std::cerr << "mcps-server: " << loaded.error().message << "\n";
        return 2;
    }
    const ServerConfig config = std::move(*loaded);

    try {
        install_logger(config);
    } catch (const std::exception& e) {
        std::cerr << "mcps-server: cannot set up logging: " << e.what() << "\n";
        return 2;
    }

    MCPS_LOG_INFO(std::string(kServerName) + " " + MCPS_VERSION + " starting (json kernel: "
                  + fast_json_implementation() + ")");

    try {
        auto tools = std::make_shared<ToolRegistry>();
        builtin::register_builtin_tools(*tools, config);

        auto prompts = std::make_shared<PromptRegistry>();
        builtin::register_builtin_prompts(*prompts);

        MCPS_LOG_INFO("Workspace: " + config.workspace_root.string() + ", "
                      + std::to_string(tools->size()) + " tools, "
                      + std::to_string(prompts->size()) + " prompts");

        auto dispatcher = std::make_shared<const Dispatcher>(
            std::shared_ptr<const ToolRegistry>(std::move(tools)),
            std::shared_ptr<const PromptRegistry>(std::move(prompts))
        );

        TcpServer server(config, dispatcher);
        auto endpoint = server.start();
        if (!endpoint) {
            MCPS_LOG_FATAL("Cannot listen on " + config.host + ":" + std::to_string(config.port)
                           + ": " + endpoint.error().message);
            return 1;
        }
        MCPS_LOG_INFO("Listening on " + endpoint->address().to_string() + ":"
                      + std::to_string(endpoint->port()));

        asio::signal_set signals(server.io_context(), SIGINT, SIGTERM);
        signals.async_wait([&server](const asio::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            MCPS_LOG_INFO("Signal " + std::to_string(signal_number) + " received, shutting down");
            server.stop();
        });

        server.run();
        server.stop();
    } catch (const std::exception& e) {
        MCPS_LOG_FATAL(std::string("Server failed: ") + e.what());
        return 1;
    }

    MCPS_LOG_INFO("Server stopped");
    return 0;
}
