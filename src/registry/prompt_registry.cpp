#include "statmcp/registry/prompt_registry.hpp"
#include "statmcp/log/logger.hpp"
#include "statmcp/registry/schema.hpp"

#include <algorithm>
#include <set>

namespace statmcp {

Json PromptDescriptor::to_json() const {
    Json args = Json::array();
    for (const auto& argument : arguments) {
        args.push_back(argument.to_json());
    }
    Json j = {{"name", name}, {"arguments", std::move(args)}};
    if (title) j["title"] = *title;
    if (description) j["description"] = *description;
    return j;
}

PromptRegistry::PromptRegistry()
    : catalog_("prompt") {}

ServerResult<void> PromptRegistry::register_prompt(PromptDescriptor descriptor) {
    if (descriptor.handler == nullptr) {
        return tl::unexpected(ServerError::invalid_params(
            "prompt '" + descriptor.name + "' has no handler"));
    }

    std::set<std::string> seen;
    for (const auto& argument : descriptor.arguments) {
        if (argument.name.empty() || (seen.insert(argument.name).second == false)) {
            return tl::unexpected(ServerError::invalid_params(
                "prompt '" + descriptor.name + "' declares an empty or repeated argument name"));
        }
    }

    if (descriptor.arguments_schema) {
        if (auto where = find_disallowed_composition(*descriptor.arguments_schema)) {
            return tl::unexpected(ServerError::invalid_params(
                "prompt '" + descriptor.name + "' arguments schema uses a composition keyword at " + *where,
                Json{{"name", descriptor.name}, {"pointer", *where}}));
        }
    }

    const std::string name = descriptor.name;
    auto added = catalog_.add(std::move(descriptor));
    if (added) {
        STATMCP_LOG_DEBUG("Registered prompt: " + name);
    }
    return added;
}

ServerResult<Json> PromptRegistry::list(const std::optional<std::string>& cursor,
                                        std::size_t page_size) const {
    auto page = catalog_.list(cursor, page_size);
    if (!page) {
        return tl::unexpected(page.error());
    }

    Json prompts = Json::array();
    for (const auto& prompt : page->items) {
        prompts.push_back(prompt.to_json());
    }
    Json result = {{"prompts", std::move(prompts)}};
    if (page->next_cursor) {
        result["nextCursor"] = *page->next_cursor;
    }
    return result;
}

ServerResult<GetPromptResult> PromptRegistry::get(std::string_view name,
                                                  RequestContext& context,
                                                  const Json& arguments) const {
    auto prompt = catalog_.find(name);
    if (prompt.has_value() == false) {
        return tl::unexpected(ServerError::prompt_not_found(name));
    }

    if ((arguments.is_null() == false) && (arguments.is_object() == false)) {
        return tl::unexpected(ServerError::invalid_params("prompt arguments must be an object"));
    }

    PromptArguments values;
    if (arguments.is_object()) {
        for (const auto& [key, value] : arguments.items()) {
            const bool declared = std::any_of(prompt->arguments.begin(), prompt->arguments.end(),
                                              [&](const PromptArgument& a) { return a.name == key; });
            if (declared == false) {
                return tl::unexpected(ServerError::invalid_params(
                    "unknown argument '" + key + "' for prompt '" + prompt->name + "'",
                    Json{{"prompt", prompt->name}, {"pointer", "/" + escape_pointer_token(key)}}));
            }
            if (value.is_string() == false) {
                return tl::unexpected(ServerError::invalid_params(
                    "argument '" + key + "' must be a string",
                    Json{{"prompt", prompt->name}, {"pointer", "/" + escape_pointer_token(key)}}));
            }
            values.emplace(key, value.get<std::string>());
        }
    }

    for (const auto& argument : prompt->arguments) {
        if (argument.required && (values.contains(argument.name) == false)) {
            return tl::unexpected(ServerError::invalid_params(
                "missing required argument '" + argument.name + "' for prompt '" + prompt->name + "'",
                Json{{"prompt", prompt->name}, {"pointer", "/" + escape_pointer_token(argument.name)}}));
        }
    }

    if (prompt->arguments_schema) {
        const Json instance = arguments.is_object() ? arguments : Json::object();
        auto valid = validate(*prompt->arguments_schema, instance);
        if (!valid) {
            return tl::unexpected(ServerError::invalid_params(
                "arguments for prompt '" + prompt->name + "' at '" + valid.error().pointer + "': " +
                    valid.error().message,
                Json{{"prompt", prompt->name}, {"pointer", valid.error().pointer}}));
        }
    }

    return prompt->handler(context, values);
}

}  // namespace statmcp
