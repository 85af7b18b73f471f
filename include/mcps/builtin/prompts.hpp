#pragma once

#include "mcps/server/prompt_registry.hpp"

namespace mcps::builtin {

// text_summary target length when `length` is absent or not a positive number
inline constexpr int kDefaultSummaryWords = 100;

/// Register code_review, text_summary, code_explanation and test_generation.
void register_builtin_prompts(PromptRegistry& registry);

}  // namespace mcps::builtin
