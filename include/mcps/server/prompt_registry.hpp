#pragma once

#include "mcps/protocol/mcp_types.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mcps {

// ─────────────────────────────────────────────────────────────────────────────
// PromptRegistry - name -> {descriptor, renderer}
// ─────────────────────────────────────────────────────────────────────────────
// Same lifecycle as ToolRegistry: built at startup, read-only afterwards.

/// Argument values supplied by prompts/get, keyed by argument name.
using PromptArguments = std::map<std::string, std::string>;

/// Called only after every required argument has been checked present.
using PromptRenderer = std::function<std::vector<PromptMessage>(const PromptArguments& arguments)>;

struct PromptEntry {
    Prompt prompt;
    PromptRenderer renderer;

    /// First required argument absent from `arguments`, if any.
    [[nodiscard]] std::optional<std::string> missing_required(const PromptArguments& arguments) const;
};

class PromptRegistry {
public:
    /// Throws std::invalid_argument on an empty or duplicate prompt name, a
    /// missing renderer, or repeated argument names.
    void add(Prompt prompt, PromptRenderer renderer);

    [[nodiscard]] const PromptEntry* find(std::string_view name) const;

    [[nodiscard]] std::vector<Prompt> list() const;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

private:
    std::vector<PromptEntry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace mcps
