#include "mcps/server/prompt_registry.hpp"

#include <set>
#include <stdexcept>

namespace mcps {

std::optional<std::string> PromptEntry::missing_required(const PromptArguments& arguments) const {
    for (const auto& arg : prompt.arguments) {
        if (arg.required && (arguments.count(arg.name) == 0)) {
            return arg.name;
        }
    }
    return std::nullopt;
}

void PromptRegistry::add(Prompt prompt, PromptRenderer renderer) {
    if (prompt.name.empty()) {
        throw std::invalid_argument("PromptRegistry: prompt name cannot be empty");
    }
    if (!renderer) {
        throw std::invalid_argument("PromptRegistry: prompt '" + prompt.name + "' has no renderer");
    }
    if (index_.count(prompt.name) > 0) {
        throw std::invalid_argument("PromptRegistry: duplicate prompt name '" + prompt.name + "'");
    }

    std::set<std::string> seen;
    for (const auto& arg : prompt.arguments) {
        if (seen.insert(arg.name).second == false) {
            throw std::invalid_argument(
                "PromptRegistry: prompt '" + prompt.name + "' repeats argument '" + arg.name + "'");
        }
    }

    index_.emplace(prompt.name, entries_.size());
    entries_.push_back(PromptEntry{std::move(prompt), std::move(renderer)});
}

const PromptEntry* PromptRegistry::find(std::string_view name) const {
    const auto it = index_.find(std::string(name));
    if (it == index_.end()) {
        return nullptr;
    }
    return &entries_[it->second];
}

std::vector<Prompt> PromptRegistry::list() const {
    std::vector<Prompt> prompts;
    prompts.reserve(entries_.size());
    for (const auto& entry : entries_) {
        prompts.push_back(entry.prompt);
    }
    return prompts;
}

}  // namespace mcps
