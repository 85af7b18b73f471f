#pragma once

#include "mcps/protocol/mcp_types.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mcps {

// ─────────────────────────────────────────────────────────────────────────────
// ToolRegistry - name -> {descriptor, handler}
// ─────────────────────────────────────────────────────────────────────────────
// Filled once at startup, then shared read-only by every connection. There
// is no locking; nothing may call add() after the server starts.

/// Receives the already schema-validated "arguments" object. May block and
/// may throw; exceptions become an isError result.
using ToolHandler = std::function<CallToolResult(const Json& arguments)>;

struct ToolEntry {
    Tool tool;
    ToolHandler handler;

    /// Run the handler, converting any exception into an isError result.
    [[nodiscard]] CallToolResult invoke(const Json& arguments) const;
};

class ToolRegistry {
public:
    /// Throws std::invalid_argument on an empty or duplicate name, a missing
    /// handler, or an input schema that is not an object.
    void add(Tool tool, ToolHandler handler);

    /// nullptr when no tool has this name.
    [[nodiscard]] const ToolEntry* find(std::string_view name) const;

    /// Public descriptors in registration order.
    [[nodiscard]] std::vector<Tool> list() const;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

private:
    std::vector<ToolEntry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace mcps
