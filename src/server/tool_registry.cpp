#include "mcps/server/tool_registry.hpp"

#include "mcps/log/logger.hpp"

#include <stdexcept>

namespace mcps {

CallToolResult ToolEntry::invoke(const Json& arguments) const {
    try {
        return handler(arguments);
    } catch (const std::exception& e) {
        MCPS_LOG_WARN("Tool '" + tool.name + "' failed: " + e.what());
        return CallToolResult::error(std::string("Tool error: ") + e.what());
    }
}

void ToolRegistry::add(Tool tool, ToolHandler handler) {
    if (tool.name.empty()) {
        throw std::invalid_argument("ToolRegistry: tool name cannot be empty");
    }
    if (!handler) {
        throw std::invalid_argument("ToolRegistry: tool '" + tool.name + "' has no handler");
    }
    if (tool.input_schema.is_object() == false) {
        throw std::invalid_argument("ToolRegistry: input schema of '" + tool.name + "' must be an object");
    }
    if (index_.count(tool.name) > 0) {
        throw std::invalid_argument("ToolRegistry: duplicate tool name '" + tool.name + "'");
    }

    index_.emplace(tool.name, entries_.size());
    entries_.push_back(ToolEntry{std::move(tool), std::move(handler)});
}

const ToolEntry* ToolRegistry::find(std::string_view name) const {
    const auto it = index_.find(std::string(name));
    if (it == index_.end()) {
        return nullptr;
    }
    return &entries_[it->second];
}

std::vector<Tool> ToolRegistry::list() const {
    std::vector<Tool> tools;
    tools.reserve(entries_.size());
    for (const auto& entry : entries_) {
        tools.push_back(entry.tool);
    }
    return tools;
}

}  // namespace mcps
