#pragma once

#include "statmcp/context/request_context.hpp"
#include "statmcp/protocol/errors.hpp"
#include "statmcp/protocol/mcp_types.hpp"
#include "statmcp/registry/catalog.hpp"

#include <asio/awaitable.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace statmcp {

// ═══════════════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════════════

/// Runs with arguments that already passed the input schema
using ToolHandler = std::function<asio::awaitable<ServerResult<CallToolResult>>(RequestContext&, Json arguments)>;

struct ToolDescriptor {
    std::string name;
    std::optional<std::string> title;
    std::string description;
    Json input_schema = Json{{"type", "object"}};
    std::optional<Json> output_schema;
    ToolAnnotations annotations;

    /// Overrides the runtime's default per-call timeout
    std::optional<std::chrono::milliseconds> timeout;

    ToolHandler handler;

    [[nodiscard]] const std::string& key() const noexcept { return name; }

    /// Wire shape used by tools/list
    [[nodiscard]] Json to_json() const;
};

class ToolRegistry {
public:
    ToolRegistry();

    /// Fails with InvalidParams on a composition keyword in either schema,
    /// an empty name, a duplicate name or a missing handler.
    [[nodiscard]] ServerResult<void> register_tool(ToolDescriptor descriptor);

    /// {"tools": [...], "nextCursor"?}
    [[nodiscard]] ServerResult<Json> list(const std::optional<std::string>& cursor,
                                          std::size_t page_size = 0) const;

    [[nodiscard]] std::optional<ToolDescriptor> find(std::string_view name) const;

    /// Validate `arguments` against the tool's input schema, then run it.
    /// ToolNotFound for an unknown name; InvalidParams (with the offending
    /// pointer in data) when validation fails, without calling the handler.
    [[nodiscard]] asio::awaitable<ServerResult<CallToolResult>> invoke(std::string_view name,
                                                                       RequestContext& context,
                                                                       Json arguments) const;

    [[nodiscard]] std::vector<ToolDescriptor> all() const { return catalog_.all(); }
    [[nodiscard]] std::size_t size() const { return catalog_.size(); }

    void set_change_listener(std::function<void()> listener) {
        catalog_.set_change_listener(std::move(listener));
    }

private:
    Catalog<ToolDescriptor> catalog_;
};

}  // namespace statmcp
