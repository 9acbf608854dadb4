#include "statmcp/registry/tool_registry.hpp"
#include "statmcp/log/logger.hpp"
#include "statmcp/registry/schema.hpp"

namespace statmcp {

Json ToolDescriptor::to_json() const {
    Json j = {
        {"name", name},
        {"description", description},
        {"inputSchema", input_schema}
    };
    if (title) {
        j["title"] = *title;
    }
    if (output_schema) {
        j["outputSchema"] = *output_schema;
    }
    if (annotations.empty() == false) {
        j["annotations"] = annotations.to_json();
    }
    return j;
}

ToolRegistry::ToolRegistry()
    : catalog_("tool") {}

ServerResult<void> ToolRegistry::register_tool(ToolDescriptor descriptor) {
    if (descriptor.handler == nullptr) {
        return tl::unexpected(ServerError::invalid_params(
            "tool '" + descriptor.name + "' has no handler"));
    }
    if (descriptor.input_schema.is_object() == false) {
        return tl::unexpected(ServerError::invalid_params(
            "tool '" + descriptor.name + "' inputSchema must be an object"));
    }

    if (auto where = find_disallowed_composition(descriptor.input_schema)) {
        return tl::unexpected(ServerError::invalid_params(
            "tool '" + descriptor.name + "' inputSchema uses a composition keyword at " + *where,
            Json{{"name", descriptor.name}, {"pointer", "/inputSchema" + *where}}));
    }
    if (descriptor.output_schema) {
        if (auto where = find_disallowed_composition(*descriptor.output_schema)) {
            return tl::unexpected(ServerError::invalid_params(
                "tool '" + descriptor.name + "' outputSchema uses a composition keyword at " + *where,
                Json{{"name", descriptor.name}, {"pointer", "/outputSchema" + *where}}));
        }
    }

    const std::string name = descriptor.name;
    auto added = catalog_.add(std::move(descriptor));
    if (added) {
        STATMCP_LOG_DEBUG("Registered tool: " + name);
    }
    return added;
}

ServerResult<Json> ToolRegistry::list(const std::optional<std::string>& cursor,
                                      std::size_t page_size) const {
    auto page = catalog_.list(cursor, page_size);
    if (!page) {
        return tl::unexpected(page.error());
    }

    Json tools = Json::array();
    for (const auto& tool : page->items) {
        tools.push_back(tool.to_json());
    }
    Json result = {{"tools", std::move(tools)}};
    if (page->next_cursor) {
        result["nextCursor"] = *page->next_cursor;
    }
    return result;
}

std::optional<ToolDescriptor> ToolRegistry::find(std::string_view name) const {
    return catalog_.find(name);
}

asio::awaitable<ServerResult<CallToolResult>> ToolRegistry::invoke(std::string_view name,
                                                                   RequestContext& context,
                                                                   Json arguments) const {
    auto tool = catalog_.find(name);
    if (tool.has_value() == false) {
        co_return tl::unexpected(ServerError::tool_not_found(name));
    }

    if (arguments.is_null()) {
        arguments = Json::object();
    }

    auto valid = validate(tool->input_schema, arguments);
    if (!valid) {
        STATMCP_LOG_DEBUG("Rejected arguments for " + tool->name + " at '" +
                          valid.error().pointer + "': " + valid.error().message);
        co_return tl::unexpected(ServerError::invalid_params(
            "arguments for '" + tool->name + "' at '" + valid.error().pointer + "': " + valid.error().message,
            Json{{"tool", tool->name}, {"pointer", valid.error().pointer}}));
    }

    auto result = co_await tool->handler(context, std::move(arguments));
    if (!result || (tool->output_schema.has_value() == false) || result->is_error) {
        co_return result;
    }

    // A declared output schema is a promise to the client
    if (result->structured_content.has_value() == false) {
        STATMCP_LOG_ERROR("Tool " + tool->name + " declares an output schema but returned no structured content");
        co_return tl::unexpected(ServerError::internal(
            "tool '" + tool->name + "' returned no structured content", Json{{"tool", tool->name}}));
    }
    auto conforms = validate(*tool->output_schema, *result->structured_content);
    if (!conforms) {
        STATMCP_LOG_ERROR("Tool " + tool->name + " broke its output schema at '" +
                          conforms.error().pointer + "': " + conforms.error().message);
        co_return tl::unexpected(ServerError::internal(
            "result of '" + tool->name + "' does not match its output schema at '" +
                conforms.error().pointer + "': " + conforms.error().message,
            Json{{"tool", tool->name}, {"pointer", conforms.error().pointer}}));
    }
    co_return result;
}

}  // namespace statmcp
