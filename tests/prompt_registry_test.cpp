#include <catch2/catch_test_macros.hpp>

#include "mcps/server/prompt_registry.hpp"

#include <stdexcept>

using namespace mcps;

namespace {

std::vector<PromptMessage> greet(const PromptArguments& arguments) {
    return {PromptMessage{Role::User, TextContent{"Hello " + arguments.at("name")}}};
}

Prompt greeting_prompt() {
    return Prompt{"greeting", "Say hello", {{"name", "Who to greet", true}, {"tone", "Optional tone", false}}};
}

}  // namespace

TEST_CASE("PromptRegistry finds and lists prompts", "[registry][prompts]") {
    PromptRegistry registry;
    registry.add(greeting_prompt(), greet);
    registry.add(Prompt{"farewell", "Say goodbye", {}}, [](const PromptArguments&) {
        return std::vector<PromptMessage>{};
    });

    REQUIRE(registry.size() == 2);
    REQUIRE(registry.find("greeting") != nullptr);
    REQUIRE(registry.find("unknown") == nullptr);

    const auto prompts = registry.list();
    REQUIRE(prompts[0].name == "greeting");
    REQUIRE(prompts[1].name == "farewell");
    REQUIRE(prompts[0].arguments.size() == 2);
}

TEST_CASE("PromptEntry reports the first missing required argument", "[registry][prompts]") {
    PromptRegistry registry;
    registry.add(greeting_prompt(), greet);
    const auto* entry = registry.find("greeting");

    REQUIRE(entry->missing_required({}) == std::optional<std::string>("name"));
    REQUIRE(entry->missing_required({{"tone", "warm"}}) == std::optional<std::string>("name"));
    REQUIRE_FALSE(entry->missing_required({{"name", "Ada"}}).has_value());
}

TEST_CASE("PromptEntry renderer receives the arguments", "[registry][prompts]") {
    PromptRegistry registry;
    registry.add(greeting_prompt(), greet);

    const auto messages = registry.find("greeting")->renderer({{"name", "Ada"}});

    REQUIRE(messages.size() == 1);
    REQUIRE(messages[0].role == Role::User);
    REQUIRE(std::get<TextContent>(messages[0].content).text == "Hello Ada");
}

TEST_CASE("PromptRegistry rejects bad registrations", "[registry][prompts]") {
    PromptRegistry registry;
    registry.add(greeting_prompt(), greet);

    REQUIRE_THROWS_AS(registry.add(greeting_prompt(), greet), std::invalid_argument);
    REQUIRE_THROWS_AS(registry.add(Prompt{"", "no name", {}}, greet), std::invalid_argument);
    REQUIRE_THROWS_AS(registry.add(Prompt{"empty", "no renderer", {}}, PromptRenderer{}), std::invalid_argument);
    REQUIRE_THROWS_AS(
        registry.add(Prompt{"twice", "repeats", {{"a", "", true}, {"a", "", false}}}, greet),
        std::invalid_argument);
    REQUIRE(registry.size() == 1);
}
