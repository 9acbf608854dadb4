#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Result Formatter
// ═══════════════════════════════════════════════════════════════════════════
// Turns a successful engine payload into MCP content blocks:
//
//   1. markdown summary   "**<title>** summary:" + up to 8 scalar bullets,
//                         or the payload's _formatting.summary, followed by
//                         _formatting.interpretation when present
//   2. formatted text     what the script printed before its payload
//   3. JSON payload       pretty-printed, annotated application/json
//
// structuredContent carries the payload without its _formatting member.
// Pure functions; inputs are never modified.

#include "statmcp/protocol/mcp_types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace statmcp {

using Json = nlohmann::json;

inline constexpr std::size_t kMaxSummaryBullets = 8;

/// Integers as integers; other numbers with at most 4 decimals, trailing
/// zeros removed (tiny magnitudes fall back to scientific notation).
[[nodiscard]] std::string format_number(const Json& number);

[[nodiscard]] std::string build_summary(std::string_view title, const Json& payload);

[[nodiscard]] CallToolResult format_success(std::string_view title,
                                            const Json& payload,
                                            std::string_view formatted_text);

}  // namespace statmcp
