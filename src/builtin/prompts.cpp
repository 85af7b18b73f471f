#include "mcps/builtin/prompts.hpp"

#include <charconv>
#include <string>
#include <vector>

namespace mcps::builtin {

namespace {

PromptMessage message(Role role, std::string text) {
    return PromptMessage{role, TextContent{std::move(text)}};
}

std::string value_or(const PromptArguments& arguments, const std::string& key, std::string fallback) {
    const auto it = arguments.find(key);
    if (it == arguments.end() || it->second.empty()) {
        return fallback;
    }
    return it->second;
}

int summary_words(const PromptArguments& arguments) {
    const auto it = arguments.find("length");
    if (it == arguments.end()) {
        return kDefaultSummaryWords;
    }
    int words = 0;
    const auto* first = it->second.data();
    const auto* last = first + it->second.size();
    const auto [end, ec] = std::from_chars(first, last, words);
    if (ec != std::errc{} || end != last || words <= 0) {
        return kDefaultSummaryWords;
    }
    return words;
}

std::string fenced(const std::string& language, const std::string& code) {
    return "```" + language + "\n" + code + "\n```";
}

// ─────────────────────────────────────────────────────────────────────────────
// Renderers
// ─────────────────────────────────────────────────────────────────────────────

std::vector<PromptMessage> render_code_review(const PromptArguments& arguments) {
    const auto& language = arguments.at("language");
    const auto& code = arguments.at("code");
    return {
        message(Role::System,
                "You are an experienced " + language + " reviewer. Be specific and point at lines."),
        message(Role::User,
                "Review this " + language + " code:\n\n" + fenced(language, code)
                    + "\n\nComment on code style, possible bugs and optimizations."),
    };
}

std::vector<PromptMessage> render_text_summary(const PromptArguments& arguments) {
    const auto words = summary_words(arguments);
    return {
        message(Role::User,
                "Summarize the following text in approximately " + std::to_string(words) + " words:\n\n"
                    + arguments.at("text")),
    };
}

std::vector<PromptMessage> render_code_explanation(const PromptArguments& arguments) {
    const auto language = value_or(arguments, "language", "");
    const auto audience = value_or(arguments, "audience", "a developer new to this code");
    const auto subject = language.empty() ? std::string("code") : language + " code";
    return {
        message(Role::System, "You explain source code clearly for " + audience + "."),
        message(Role::User,
                "Explain what this " + subject + " does, step by step:\n\n"
                    + fenced(language, arguments.at("code"))),
    };
}

std::vector<PromptMessage> render_test_generation(const PromptArguments& arguments) {
    const auto& language = arguments.at("language");
    const auto framework = value_or(arguments, "framework", "the usual test framework for " + language);
    return {
        message(Role::System, "You write thorough, deterministic unit tests."),
        message(Role::User,
                "Write unit tests using " + framework + " for this " + language + " code:\n\n"
                    + fenced(language, arguments.at("code"))
                    + "\n\nCover normal inputs, edge cases and error paths."),
    };
}

}  // namespace

void register_builtin_prompts(PromptRegistry& registry) {
    registry.add(
        Prompt{"code_review", "Ask for a review of a piece of code",
               {{"language", "Programming language of the code", true},
                {"code", "Code to review", true}}},
        render_code_review);

    registry.add(
        Prompt{"text_summary", "Ask for a summary of a text",
               {{"text", "Text to summarize", true},
                {"length", "Approximate summary length in words (default 100)", false}}},
        render_text_summary);

    registry.add(
        Prompt{"code_explanation", "Ask for an explanation of a piece of code",
               {{"code", "Code to explain", true},
                {"language", "Programming language of the code", false},
                {"audience", "Who the explanation is for", false}}},
        render_code_explanation);

    registry.add(
        Prompt{"test_generation", "Ask for unit tests for a piece of code",
               {{"code", "Code under test", true},
                {"language", "Programming language of the code", true},
                {"framework", "Test framework to use", false}}},
        render_test_generation);
}

}  // namespace mcps::builtin
