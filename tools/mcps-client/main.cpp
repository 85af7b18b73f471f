// ─────────────────────────────────────────────────────────────────────────────
// mcps-client - command-line client for mcps-server
// ─────────────────────────────────────────────────────────────────────────────
// Usage:
//   mcps-client --port 8888 --list-tools
//   mcps-client --call-tool calculator --tool-args '{"expression":"2^10"}'
//   mcps-client --get-prompt code_review --prompt-args '{"language":"c++","code":"int x;"}'
//   mcps-client --interactive
//
// Connects over TCP, performs the initialize handshake, runs one command
// and exits. Without a command it prints the server info.

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "mcps/protocol/mcp_types.hpp"
#include "mcps/transport/tcp_client.hpp"
#include "mcps/version.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

using namespace mcps;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";
    const char* magenta = "\033[35m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Client
// ═══════════════════════════════════════════════════════════════════════════

struct CliFailure {
    std::string message;
};

template <typename T>
using CliResult = tl::expected<T, CliFailure>;

class CliClient {
public:
    explicit CliClient(TcpClient& connection)
        : connection_(connection)
    {}

    /// The "result" member of the reply, or the server's error message.
    CliResult<Json> request(std::string_view method, const Json& params = Json::object()) {
        const auto message = Message::request(
            JsonRpcId::integer(++request_id_), std::string(method),
            params.empty() ? std::nullopt : std::optional<Json>(params));

        if (auto sent = connection_.send(message.to_json()); !sent) {
            return tl::unexpected(CliFailure{sent.error().message});
        }

        auto reply = connection_.receive();
        if (!reply) {
            return tl::unexpected(CliFailure{reply.error().message});
        }
        auto decoded = Message::from_json(*reply);
        if (!decoded) {
            return tl::unexpected(CliFailure{"malformed reply: " + decoded.error().message});
        }
        if (decoded->error().has_value()) {
            const auto& error = *decoded->error();
            return tl::unexpected(CliFailure{
                error.message + " (" + std::string(error_code_name(static_cast<int>(error.code))) + ")"});
        }
        if (decoded->result().has_value() == false) {
            return tl::unexpected(CliFailure{"reply carries no result"});
        }
        return *decoded->result();
    }

    CliResult<InitializeResult> initialize() {
        InitializeParams params;
        params.protocol_version = MCP_PROTOCOL_VERSION;
        params.client_info = {"mcps-client", MCPS_VERSION};

        auto result = request(method::Initialize, params.to_json());
        if (!result) {
            return tl::unexpected(result.error());
        }

        const auto notification = Message::notification(std::string(method::InitializedNotification));
        if (auto sent = connection_.send(notification.to_json()); !sent) {
            return tl::unexpected(CliFailure{sent.error().message});
        }
        return InitializeResult::from_json(*result);
    }

private:
    TcpClient& connection_;
    std::int64_t request_id_ = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_header(const std::string& title) {
    std::cout << "\n" << color::c(color::bold) << color::c(color::cyan)
              << "═══ " << title << " ═══" << color::c(color::reset) << "\n\n";
}

void print_json(const Json& j) {
    std::cout << j.dump(2) << "\n";
}

void print_content(const std::vector<Content>& content) {
    for (const auto& block : content) {
        if (const auto* text = std::get_if<TextContent>(&block)) {
            std::cout << text->text << "\n";
        }
    }
}

CliResult<Json> parse_arguments(const std::string& text) {
    if (text.empty()) {
        return Json::object();
    }
    try {
        auto parsed = Json::parse(text);
        if (parsed.is_object() == false) {
            return tl::unexpected(CliFailure{"arguments must be a JSON object"});
        }
        return parsed;
    } catch (const Json::parse_error& e) {
        return tl::unexpected(CliFailure{std::string("Invalid JSON arguments: ") + e.what()});
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Command Handlers
// ═══════════════════════════════════════════════════════════════════════════

int cmd_list_tools(CliClient& client, bool json_output) {
    auto result = client.request(method::ToolsList);
    if (!result) {
        print_error(result.error().message);
        return 1;
    }
    const auto tools = ListToolsResult::from_json(*result);

    if (json_output) {
        print_json((*result)["tools"]);
        return 0;
    }
    print_header("Tools");
    if (tools.tools.empty()) {
        std::cout << color::c(color::dim) << "(no tools available)" << color::c(color::reset) << "\n";
    }
    for (const auto& tool : tools.tools) {
        std::cout << color::c(color::bold) << color::c(color::yellow)
                  << "• " << tool.name << color::c(color::reset) << "\n  "
                  << color::c(color::dim) << tool.description << color::c(color::reset) << "\n";
        const auto props = tool.input_schema.find("properties");
        if (props != tool.input_schema.end() && props->empty() == false) {
            std::cout << "  Arguments: ";
            bool first = true;
            for (const auto& [name, _] : props->items()) {
                std::cout << (first ? "" : ", ") << name;
                first = false;
            }
            std::cout << "\n";
        }
        std::cout << "\n";
    }
    return 0;
}

int cmd_list_prompts(CliClient& client, bool json_output) {
    auto result = client.request(method::PromptsList);
    if (!result) {
        print_error(result.error().message);
        return 1;
    }
    const auto prompts = ListPromptsResult::from_json(*result);

    if (json_output) {
        print_json((*result)["prompts"]);
        return 0;
    }
    print_header("Prompts");
    if (prompts.prompts.empty()) {
        std::cout << color::c(color::dim) << "(no prompts available)" << color::c(color::reset) << "\n";
    }
    for (const auto& prompt : prompts.prompts) {
        std::cout << color::c(color::bold) << color::c(color::magenta)
                  << "• " << prompt.name << color::c(color::reset) << "\n  "
                  << color::c(color::dim) << prompt.description << color::c(color::reset);
        if (prompt.arguments.empty() == false) {
            std::cout << "\n  Arguments: ";
            for (std::size_t i = 0; i < prompt.arguments.size(); ++i) {
                if (i > 0) std::cout << ", ";
                std::cout << prompt.arguments[i].name;
                if (prompt.arguments[i].required) {
                    std::cout << color::c(color::red) << "*" << color::c(color::reset);
                }
            }
        }
        std::cout << "\n\n";
    }
    return 0;
}

int cmd_call_tool(CliClient& client, const std::string& tool_name,
                  const std::string& args_json, bool json_output) {
    auto args = parse_arguments(args_json);
    if (!args) {
        print_error(args.error().message);
        return 1;
    }

    auto result = client.request(method::ToolsCall, CallToolParams{tool_name, *args}.to_json());
    if (!result) {
        print_error(result.error().message);
        return 1;
    }
    auto call_result = CallToolResult::from_json(*result);
    if (!call_result) {
        print_error("malformed tool result: " + call_result.error().message);
        return 1;
    }

    if (json_output) {
        print_json(*result);
    } else {
        if (call_result->is_error) {
            print_error("Tool returned error");
        }
        print_content(call_result->content);
    }
    return call_result->is_error ? 1 : 0;
}

int cmd_get_prompt(CliClient& client, const std::string& prompt_name,
                   const std::string& args_json, bool json_output) {
    auto args = parse_arguments(args_json);
    if (!args) {
        print_error(args.error().message);
        return 1;
    }

    auto result = client.request(method::PromptsGet, {{"name", prompt_name}, {"arguments", *args}});
    if (!result) {
        print_error(result.error().message);
        return 1;
    }
    auto prompt = GetPromptResult::from_json(*result);
    if (!prompt) {
        print_error("malformed prompt: " + prompt.error().message);
        return 1;
    }

    if (json_output) {
        print_json(*result);
        return 0;
    }
    print_header(prompt_name);
    std::cout << color::c(color::dim) << prompt->description << color::c(color::reset) << "\n\n";
    for (const auto& message : prompt->messages) {
        std::cout << color::c(color::bold) << "[" << to_string(message.role) << "]"
                  << color::c(color::reset) << "\n";
        print_content({message.content});
        std::cout << "\n";
    }
    return 0;
}

int cmd_ping(CliClient& client, bool json_output) {
    auto result = client.request(method::Ping);
    if (!result) {
        print_error(result.error().message);
        return 1;
    }
    if (json_output) {
        print_json({{"status", "ok"}});
    } else {
        std::cout << color::c(color::green) << "✓ " << color::c(color::reset) << "Server is alive\n";
    }
    return 0;
}

int cmd_info(const InitializeResult& init_result, bool json_output) {
    if (json_output) {
        print_json(init_result.to_json());
        return 0;
    }
    print_header("Server Info");
    std::cout << color::c(color::bold) << "Name:     " << color::c(color::reset)
              << init_result.server_info.name << "\n";
    std::cout << color::c(color::bold) << "Version:  " << color::c(color::reset)
              << init_result.server_info.version << "\n";
    std::cout << color::c(color::bold) << "Protocol: " << color::c(color::reset)
              << init_result.protocol_version << "\n";

    std::cout << "\n" << color::c(color::bold) << "Capabilities:" << color::c(color::reset) << "\n";
    std::cout << "  • Tools:     " << (init_result.capabilities.tools ? "✓" : "✗") << "\n";
    std::cout << "  • Prompts:   " << (init_result.capabilities.prompts ? "✓" : "✗") << "\n";
    std::cout << "  • Logging:   " << (init_result.capabilities.logging ? "✓" : "✗") << "\n";

    if (init_result.instructions) {
        std::cout << "\n" << color::c(color::bold) << "Instructions:" << color::c(color::reset) << "\n";
        std::cout << *init_result.instructions << "\n";
    }
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Interactive REPL
// ═══════════════════════════════════════════════════════════════════════════

void print_repl_help() {
    std::cout << "\n" << color::c(color::bold) << "Available commands:" << color::c(color::reset) << "\n";
    std::cout << "  tools                  - List available tools\n";
    std::cout << "  prompts                - List available prompts\n";
    std::cout << "  call <tool> [args]     - Call a tool (args as JSON)\n";
    std::cout << "  prompt <name> [args]   - Render a prompt (args as JSON)\n";
    std::cout << "  ping                   - Ping the server\n";
    std::cout << "  info                   - Show server info\n";
    std::cout << "  help                   - Show this help\n";
    std::cout << "  quit                   - Exit\n\n";
}

// "name {json}" -> {name, json}
std::pair<std::string, std::string> split_command_args(const std::string& rest) {
    const auto start = rest.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return {"", ""};
    }
    const auto name_end = rest.find_first_of(" \t", start);
    if (name_end == std::string::npos) {
        return {rest.substr(start), ""};
    }
    const auto args_start = rest.find_first_not_of(" \t", name_end);
    return {rest.substr(start, name_end - start),
            args_start == std::string::npos ? "" : rest.substr(args_start)};
}

int run_repl(CliClient& client, const InitializeResult& init_result) {
    std::cout << "\n" << color::c(color::bold) << color::c(color::green)
              << "Connected to " << init_result.server_info.name
              << " v" << init_result.server_info.version
              << color::c(color::reset) << "\nType 'help' for commands.\n";

    std::string line;
    while (true) {
        std::cout << color::c(color::cyan) << "mcps> " << color::c(color::reset) << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }
        const auto [cmd, rest] = split_command_args(line);
        if (cmd.empty()) {
            continue;
        }

        if (cmd == "quit" || cmd == "exit") {
            break;
        } else if (cmd == "help") {
            print_repl_help();
        } else if (cmd == "tools") {
            cmd_list_tools(client, false);
        } else if (cmd == "prompts") {
            cmd_list_prompts(client, false);
        } else if (cmd == "ping") {
            cmd_ping(client, false);
        } else if (cmd == "info") {
            cmd_info(init_result, false);
        } else if (cmd == "call" || cmd == "prompt") {
            const auto [name, args] = split_command_args(rest);
            if (name.empty()) {
                print_error("Usage: " + cmd + " <name> [json_args]");
                continue;
            }
            if (cmd == "call") {
                cmd_call_tool(client, name, args, false);
            } else {
                cmd_get_prompt(client, name, args, false);
            }
        } else {
            print_error("Unknown command: " + cmd + ". Type 'help' for available commands.");
        }
    }
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

std::string get_env(const char* name, const std::string& fallback = "") {
    const char* value = std::getenv(name);
    return value ? value : fallback;
}

int main(int argc, char* argv[]) {
    cxxopts::Options options("mcps-client", "Command-line client for mcps-server");
    options.add_options()
        ("host", "Server address", cxxopts::value<std::string>()->default_value(get_env("MCPS_HOST", "127.0.0.1")))
        ("p,port", "Server port", cxxopts::value<std::uint16_t>()->default_value(get_env("MCPS_PORT", "8888")))
        ("list-tools", "List available tools")
        ("list-prompts", "List available prompts")
        ("call-tool", "Call a tool by name", cxxopts::value<std::string>())
        ("tool-args", "JSON arguments for tool call", cxxopts::value<std::string>()->default_value("{}"))
        ("get-prompt", "Render a prompt by name", cxxopts::value<std::string>())
        ("prompt-args", "JSON arguments for the prompt", cxxopts::value<std::string>()->default_value("{}"))
        ("ping", "Ping the server")
        ("info", "Show server info")
        ("i,interactive", "Start interactive REPL mode")
        ("j,json", "Output results as JSON")
        ("no-color", "Disable colored output")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        color::enabled = !result.count("no-color");
        const bool json_output = result.count("json") > 0;
        const auto host = result["host"].as<std::string>();
        const auto port = result["port"].as<std::uint16_t>();

        TcpClient connection;
        if (auto connected = connection.connect(host, port); !connected) {
            print_error(connected.error().message);
            return 1;
        }

        CliClient client(connection);
        auto init_result = client.initialize();
        if (!init_result) {
            print_error("Failed to initialize: " + init_result.error().message);
            return 1;
        }

        int exit_code = 0;
        if (result.count("interactive")) {
            exit_code = run_repl(client, *init_result);
        } else if (result.count("list-tools")) {
            exit_code = cmd_list_tools(client, json_output);
        } else if (result.count("list-prompts")) {
            exit_code = cmd_list_prompts(client, json_output);
        } else if (result.count("call-tool")) {
            exit_code = cmd_call_tool(client, result["call-tool"].as<std::string>(),
                                      result["tool-args"].as<std::string>(), json_output);
        } else if (result.count("get-prompt")) {
            exit_code = cmd_get_prompt(client, result["get-prompt"].as<std::string>(),
                                       result["prompt-args"].as<std::string>(), json_output);
        } else if (result.count("ping")) {
            exit_code = cmd_ping(client, json_output);
        } else {
            exit_code = cmd_info(*init_result, json_output);
        }

        connection.close();
        return exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }
}
