#pragma once

#define MCPS_VERSION_MAJOR 1
#define MCPS_VERSION_MINOR 0
#define MCPS_VERSION_PATCH 0
#define MCPS_VERSION "1.0.0"

namespace mcps {

/// serverInfo.name reported in every InitializeResult
inline constexpr const char* kServerName = "mcp-server";

}  // namespace mcps
