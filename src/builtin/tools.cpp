#include "mcps/builtin/tools.hpp"

#include "mcps/builtin/calculator.hpp"
#include "mcps/builtin/command_runner.hpp"
#include "mcps/log/logger.hpp"
#include "mcps/security/path_sandbox.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace mcps::builtin {

namespace fs = std::filesystem;
using security::PathSandbox;
using security::SandboxError;

namespace {

// ─────────────────────────────────────────────────────────────────────────────
// Schema helpers
// ─────────────────────────────────────────────────────────────────────────────

Json string_property(const char* description) {
    return {{"type", "string"}, {"description", description}};
}

Json object_schema(Json properties, std::vector<std::string> required = {}) {
    Json schema = {{"type", "object"}, {"properties", std::move(properties)}};
    if (required.empty() == false) {
        schema["required"] = std::move(required);
    }
    return schema;
}

std::string optional_arg(const Json& arguments, const char* key, std::string fallback) {
    const auto it = arguments.find(key);
    if (it == arguments.end() || it->is_string() == false) {
        return fallback;
    }
    return it->get<std::string>();
}

CallToolResult sandbox_failure(const SandboxError& error) {
    const char* prefix = (error.code == SandboxError::Code::Escape) ? "Access denied: " : "Invalid path: ";
    return CallToolResult::error(prefix + error.message);
}

// ─────────────────────────────────────────────────────────────────────────────
// calculator / datetime
// ─────────────────────────────────────────────────────────────────────────────

CallToolResult calculate(const Json& arguments) {
    const auto expression = arguments.at("expression").get<std::string>();
    const auto value = evaluate(expression);
    if (!value) {
        return CallToolResult::error("Error evaluating expression: " + value.error().message);
    }
    return CallToolResult::text("Result: " + format_number(*value));
}

CallToolResult current_datetime(const Json&) {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    if (localtime_r(&now, &local) == nullptr) {
        return CallToolResult::error("Local time is unavailable");
    }
    char buffer[32];
    const auto written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &local);
    return CallToolResult::text("Current date and time: " + std::string(buffer, written));
}

// ─────────────────────────────────────────────────────────────────────────────
// File tools
// ─────────────────────────────────────────────────────────────────────────────

CallToolResult read_file(const PathSandbox& sandbox, const Json& arguments) {
    const auto resolved = sandbox.resolve(arguments.at("path").get<std::string>());
    if (!resolved) {
        return sandbox_failure(resolved.error());
    }
    std::error_code ec;
    if (fs::is_regular_file(*resolved, ec) == false) {
        return CallToolResult::error("Not a file: " + sandbox.display(*resolved));
    }

    std::ifstream in(*resolved, std::ios::binary);
    if (!in) {
        return CallToolResult::error("Cannot open " + sandbox.display(*resolved));
    }
    std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        return CallToolResult::error("Read failed: " + sandbox.display(*resolved));
    }
    return CallToolResult::text(std::move(content));
}

CallToolResult write_file(const PathSandbox& sandbox, const Json& arguments) {
    const auto resolved = sandbox.resolve(arguments.at("path").get<std::string>());
    if (!resolved) {
        return sandbox_failure(resolved.error());
    }
    if (*resolved == sandbox.root()) {
        return CallToolResult::error("Cannot write to the workspace root");
    }
    const auto content = arguments.at("content").get<std::string>();

    std::error_code ec;
    fs::create_directories(resolved->parent_path(), ec);
    if (ec) {
        return CallToolResult::error("Cannot create directory: " + ec.message());
    }

    std::ofstream out(*resolved, std::ios::binary | std::ios::trunc);
    if (!out) {
        return CallToolResult::error("Cannot open " + sandbox.display(*resolved) + " for writing");
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        return CallToolResult::error("Write failed: " + sandbox.display(*resolved));
    }
    return CallToolResult::text("Wrote " + std::to_string(content.size()) + " bytes to "
                                + sandbox.display(*resolved));
}

CallToolResult list_files(const PathSandbox& sandbox, const Json& arguments) {
    const auto resolved = sandbox.resolve(optional_arg(arguments, "path", "."));
    if (!resolved) {
        return sandbox_failure(resolved.error());
    }
    std::error_code ec;
    if (fs::is_directory(*resolved, ec) == false) {
        return CallToolResult::error("Not a directory: " + sandbox.display(*resolved));
    }

    std::vector<std::string> names;
    fs::directory_iterator it(*resolved, ec);
    if (ec) {
        return CallToolResult::error("Cannot list " + sandbox.display(*resolved) + ": " + ec.message());
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            return CallToolResult::error("Listing failed: " + ec.message());
        }
        std::string name = it->path().filename().string();
        std::error_code type_ec;
        if (it->is_directory(type_ec)) {
            name += '/';
        }
        names.push_back(std::move(name));
    }
    std::sort(names.begin(), names.end());

    if (names.empty()) {
        return CallToolResult::text("(empty directory)");
    }
    std::ostringstream out;
    for (const auto& name : names) {
        out << name << '\n';
    }
    return CallToolResult::text(out.str());
}

CallToolResult delete_file(const PathSandbox& sandbox, const Json& arguments) {
    const auto resolved = sandbox.resolve(arguments.at("path").get<std::string>());
    if (!resolved) {
        return sandbox_failure(resolved.error());
    }
    std::error_code ec;
    const auto status = fs::symlink_status(*resolved, ec);
    if (ec || fs::exists(status) == false) {
        return CallToolResult::error("No such file: " + sandbox.display(*resolved));
    }
    if (fs::is_directory(status)) {
        return CallToolResult::error("Refusing to delete directory: " + sandbox.display(*resolved));
    }
    if (fs::remove(*resolved, ec) == false || ec) {
        return CallToolResult::error("Delete failed: " + (ec ? ec.message() : sandbox.display(*resolved)));
    }
    return CallToolResult::text("Deleted " + sandbox.display(*resolved));
}

CallToolResult search_files(const PathSandbox& sandbox, const Json& arguments) {
    const auto pattern = arguments.at("pattern").get<std::string>();
    const auto resolved = sandbox.resolve(optional_arg(arguments, "path", "."));
    if (!resolved) {
        return sandbox_failure(resolved.error());
    }
    std::error_code ec;
    if (fs::is_directory(*resolved, ec) == false) {
        return CallToolResult::error("Not a directory: " + sandbox.display(*resolved));
    }

    std::vector<std::string> matches;
    bool capped = false;
    fs::recursive_directory_iterator it(*resolved, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return CallToolResult::error("Cannot search " + sandbox.display(*resolved) + ": " + ec.message());
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return CallToolResult::error("Search failed: " + ec.message());
        }
        if (it->path().filename().string().find(pattern) == std::string::npos) {
            continue;
        }
        if (matches.size() == kMaxSearchResults) {
            capped = true;
            break;
        }
        matches.push_back(sandbox.display(it->path()));
    }
    std::sort(matches.begin(), matches.end());

    if (matches.empty()) {
        return CallToolResult::text("No files matching '" + pattern + "'");
    }
    std::ostringstream out;
    for (const auto& match : matches) {
        out << match << '\n';
    }
    if (capped) {
        out << "(results truncated at " << kMaxSearchResults << ")\n";
    }
    return CallToolResult::text(out.str());
}

// ─────────────────────────────────────────────────────────────────────────────
// run_command
// ─────────────────────────────────────────────────────────────────────────────

CallToolResult run_command(const CommandOptions& options, const Json& arguments) {
    const auto command = arguments.at("command").get<std::string>();
    MCPS_LOG_INFO("run_command: " + command);

    const auto outcome = run_shell_command(command, options);
    if (!outcome) {
        return CallToolResult::error("Failed to start command: " + outcome.error().message);
    }

    std::string text = "Exit code: " + std::to_string(outcome->exit_code) + "\n";
    if (outcome->timed_out) {
        text += "Timed out after " + std::to_string(options.timeout.count()) + " ms\n";
    }
    text += outcome->output;
    if (outcome->truncated) {
        text += "\n(output truncated at " + std::to_string(options.max_output_bytes) + " bytes)";
    }

    const bool failed = outcome->timed_out || outcome->exit_code != 0;
    return failed ? CallToolResult::error(std::move(text)) : CallToolResult::text(std::move(text));
}

}  // namespace

void register_builtin_tools(ToolRegistry& registry, const ServerConfig& config) {
    registry.add(
        Tool{"calculator", "Evaluate an arithmetic expression",
             object_schema({{"expression", string_property("Expression such as 2 * (3 + sqrt(16))")}},
                           {"expression"})},
        calculate);

    registry.add(Tool{"datetime", "Get the current local date and time", object_schema(Json::object())},
                 current_datetime);

    auto sandbox = std::make_shared<const PathSandbox>(config.workspace_root);

    registry.add(
        Tool{"read_file", "Read a text file from the workspace",
             object_schema({{"path", string_property("Path relative to the workspace")}}, {"path"})},
        [sandbox](const Json& args) { return read_file(*sandbox, args); });

    registry.add(
        Tool{"write_file", "Create or overwrite a file in the workspace",
             object_schema({{"path", string_property("Path relative to the workspace")},
                            {"content", string_property("Text to write")}},
                           {"path", "content"})},
        [sandbox](const Json& args) { return write_file(*sandbox, args); });

    registry.add(
        Tool{"list_files", "List a directory in the workspace",
             object_schema({{"path", string_property("Directory, defaults to the workspace root")}})},
        [sandbox](const Json& args) { return list_files(*sandbox, args); });

    registry.add(
        Tool{"delete_file", "Delete a file from the workspace",
             object_schema({{"path", string_property("Path relative to the workspace")}}, {"path"})},
        [sandbox](const Json& args) { return delete_file(*sandbox, args); });

    registry.add(
        Tool{"search_files", "Find files whose name contains a pattern",
             object_schema({{"pattern", string_property("Substring to look for in file names")},
                            {"path", string_property("Directory to search, defaults to the workspace root")}},
                           {"pattern"})},
        [sandbox](const Json& args) { return search_files(*sandbox, args); });

    if (config.enable_shell == false) {
        MCPS_LOG_INFO("Shell tool disabled");
        return;
    }

    CommandOptions options;
    options.working_directory = sandbox->root();
    options.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config.command_timeout);
    options.max_output_bytes = config.max_output_bytes;

    registry.add(
        Tool{"run_command", "Run a shell command in the workspace",
             object_schema({{"command", string_property("Command line passed to /bin/sh -c")}}, {"command"})},
        [options](const Json& args) { return run_command(options, args); });
}

}  // namespace mcps::builtin
