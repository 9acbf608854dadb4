#pragma once

#include "statmcp/context/request_context.hpp"
#include "statmcp/protocol/errors.hpp"
#include "statmcp/protocol/mcp_types.hpp"
#include "statmcp/registry/catalog.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace statmcp {

// ═══════════════════════════════════════════════════════════════════════════
// Prompts
// ═══════════════════════════════════════════════════════════════════════════

using PromptArguments = std::map<std::string, std::string>;

/// Runs with arguments already checked against the declared list
using PromptHandler = std::function<ServerResult<GetPromptResult>(RequestContext&, const PromptArguments&)>;

struct PromptDescriptor {
    std::string name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::vector<PromptArgument> arguments;

    /// Optional extra constraints on the argument object
    std::optional<Json> arguments_schema;

    PromptHandler handler;

    [[nodiscard]] const std::string& key() const noexcept { return name; }

    [[nodiscard]] Json to_json() const;
};

class PromptRegistry {
public:
    PromptRegistry();

    [[nodiscard]] ServerResult<void> register_prompt(PromptDescriptor descriptor);

    /// {"prompts": [...], "nextCursor"?}
    [[nodiscard]] ServerResult<Json> list(const std::optional<std::string>& cursor,
                                          std::size_t page_size = 0) const;

    /// PromptNotFound for an unknown name. InvalidParams when a required
    /// argument is missing, an argument is unknown or a value is not a string.
    [[nodiscard]] ServerResult<GetPromptResult> get(std::string_view name,
                                                    RequestContext& context,
                                                    const Json& arguments) const;

    [[nodiscard]] std::vector<PromptDescriptor> all() const { return catalog_.all(); }
    [[nodiscard]] std::size_t size() const { return catalog_.size(); }

    void set_change_listener(std::function<void()> listener) {
        catalog_.set_change_listener(std::move(listener));
    }

private:
    Catalog<PromptDescriptor> catalog_;
};

}  // namespace statmcp
