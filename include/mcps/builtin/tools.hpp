#pragma once

#include "mcps/server/server_config.hpp"
#include "mcps/server/tool_registry.hpp"

#include <cstddef>

namespace mcps::builtin {

// Result lists from search_files stop after this many matches.
inline constexpr std::size_t kMaxSearchResults = 200;

/// Register calculator, datetime, the workspace file tools and, when
/// `config.enable_shell` is set, run_command. Throws std::invalid_argument
/// if the workspace root is unusable or a name is already taken.
void register_builtin_tools(ToolRegistry& registry, const ServerConfig& config);

}  // namespace mcps::builtin
