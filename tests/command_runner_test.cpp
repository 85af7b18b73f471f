#include <catch2/catch_test_macros.hpp>

#include "mcps/builtin/command_runner.hpp"
#include "mocks/recording_logger.hpp"
#include "mocks/temp_workspace.hpp"

#include <chrono>
#include <string>

using namespace mcps::builtin;
using mcps::testing::ScopedRecordingLogger;
using mcps::testing::TempWorkspace;

namespace {

CommandOutcome run_ok(const std::string& command, const CommandOptions& options = CommandOptions{}) {
    auto outcome = run_shell_command(command, options);
    INFO(command);
    REQUIRE(outcome.has_value());
    return std::move(*outcome);
}

}  // namespace

TEST_CASE("Command output and exit status are captured", "[command_runner]") {
    auto outcome = run_ok("echo hello");
    REQUIRE(outcome.exit_code == 0);
    REQUIRE(outcome.output == "hello\n");
    REQUIRE_FALSE(outcome.timed_out);
    REQUIRE_FALSE(outcome.truncated);

    REQUIRE(run_ok("exit 3").exit_code == 3);
    REQUIRE(run_ok("no_such_command_mcps_test").exit_code == 127);
}

TEST_CASE("stderr is merged into the output", "[command_runner]") {
    auto outcome = run_ok("echo out; echo err 1>&2");
    REQUIRE(outcome.output.find("out\n") != std::string::npos);
    REQUIRE(outcome.output.find("err\n") != std::string::npos);
}

TEST_CASE("stdin is empty", "[command_runner]") {
    auto outcome = run_ok("cat; echo done");
    REQUIRE(outcome.output == "done\n");
}

TEST_CASE("Commands run in the working directory", "[command_runner]") {
    TempWorkspace ws;
    ws.write("marker.txt", "found");

    CommandOptions options;
    options.working_directory = ws.root();
    REQUIRE(run_ok("cat marker.txt", options).output == "found");

    options.working_directory = ws.root() / "missing";
    REQUIRE(run_ok("true", options).exit_code == 126);
}

TEST_CASE("Long running commands are killed at the deadline", "[command_runner]") {
    ScopedRecordingLogger logger;
    CommandOptions options;
    options.timeout = std::chrono::milliseconds(200);

    const auto started = std::chrono::steady_clock::now();
    auto outcome = run_ok("echo begin; sleep 10", options);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(outcome.timed_out);
    REQUIRE(outcome.output == "begin\n");
    REQUIRE(elapsed < std::chrono::seconds(5));
    REQUIRE(logger->contains("timed out"));
}

TEST_CASE("Background children do not outlive the timeout", "[command_runner]") {
    CommandOptions options;
    options.timeout = std::chrono::milliseconds(200);

    const auto started = std::chrono::steady_clock::now();
    auto outcome = run_ok("sleep 10 & sleep 10", options);
    REQUIRE(outcome.timed_out);
    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
}

TEST_CASE("Output beyond the cap is dropped and flagged", "[command_runner]") {
    CommandOptions options;
    options.max_output_bytes = 16;

    auto outcome = run_ok("printf '%0100d' 0", options);
    REQUIRE(outcome.exit_code == 0);
    REQUIRE(outcome.truncated);
    REQUIRE(outcome.output == std::string(16, '0'));
}
