#include "statmcp/registry/resource_registry.hpp"
#include "statmcp/log/logger.hpp"

#include <cctype>
#include <mutex>

namespace statmcp {

Json ResourceDescriptor::to_json() const {
    Json j = {{"uri", uri}, {"name", name}};
    if (description) j["description"] = *description;
    if (mime_type) j["mimeType"] = *mime_type;
    return j;
}

std::string uri_scheme(std::string_view uri) {
    const auto colon = uri.find(':');
    if ((colon == std::string_view::npos) || (colon == 0)) {
        return {};
    }
    const std::string_view scheme = uri.substr(0, colon);
    if (std::isalpha(static_cast<unsigned char>(scheme.front())) == 0) {
        return {};
    }
    for (char c : scheme) {
        const auto u = static_cast<unsigned char>(c);
        if ((std::isalnum(u) == 0) && (c != '+') && (c != '-') && (c != '.')) {
            return {};
        }
    }
    std::string lowered(scheme);
    for (auto& c : lowered) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lowered;
}

ResourceRegistry::ResourceRegistry()
    : catalog_("resource") {}

ServerResult<void> ResourceRegistry::register_resource(ResourceDescriptor descriptor) {
    if (descriptor.reader == nullptr) {
        return tl::unexpected(ServerError::invalid_params(
            "resource '" + descriptor.uri + "' has no reader"));
    }
    if (descriptor.name.empty()) {
        descriptor.name = descriptor.uri;
    }
    const std::string uri = descriptor.uri;
    auto added = catalog_.add(std::move(descriptor));
    if (added) {
        STATMCP_LOG_DEBUG("Registered resource: " + uri);
    }
    return added;
}

ServerResult<void> ResourceRegistry::add_scheme_reader(std::string scheme, ResourceReader reader) {
    if (scheme.empty() || (reader == nullptr)) {
        return tl::unexpected(ServerError::invalid_params("scheme reader needs a scheme and a reader"));
    }
    std::unique_lock lock(schemes_mutex_);
    if (scheme_readers_.contains(scheme)) {
        return tl::unexpected(ServerError::invalid_params(
            "scheme '" + scheme + "' already has a reader"));
    }
    scheme_readers_.emplace(std::move(scheme), std::move(reader));
    return {};
}

ServerResult<Json> ResourceRegistry::list(const std::optional<std::string>& cursor,
                                          std::size_t page_size) const {
    auto page = catalog_.list(cursor, page_size);
    if (!page) {
        return tl::unexpected(page.error());
    }

    Json resources = Json::array();
    for (const auto& resource : page->items) {
        resources.push_back(resource.to_json());
    }
    Json result = {{"resources", std::move(resources)}};
    if (page->next_cursor) {
        result["nextCursor"] = *page->next_cursor;
    }
    return result;
}

ServerResult<ReadResourceResult> ResourceRegistry::read(const std::string& uri,
                                                        RequestContext& context) const {
    if (auto resource = catalog_.find(uri)) {
        return resource->reader(context, uri);
    }

    ResourceReader reader;
    {
        std::shared_lock lock(schemes_mutex_);
        const auto it = scheme_readers_.find(uri_scheme(uri));
        if (it != scheme_readers_.end()) {
            reader = it->second;
        }
    }
    if (reader == nullptr) {
        return tl::unexpected(ServerError::resource_not_found(uri));
    }
    return reader(context, uri);
}

}  // namespace statmcp
