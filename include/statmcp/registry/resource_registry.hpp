#pragma once

#include "statmcp/context/request_context.hpp"
#include "statmcp/protocol/errors.hpp"
#include "statmcp/protocol/mcp_types.hpp"
#include "statmcp/registry/catalog.hpp"

#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>

namespace statmcp {

// ═══════════════════════════════════════════════════════════════════════════
// Resources
// ═══════════════════════════════════════════════════════════════════════════

using ResourceReader = std::function<ServerResult<ReadResourceResult>(RequestContext&, const std::string& uri)>;

struct ResourceDescriptor {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;
    ResourceReader reader;

    [[nodiscard]] const std::string& key() const noexcept { return uri; }

    [[nodiscard]] Json to_json() const;
};

/// "file" for "file:///tmp/x.csv"; empty when there is no "scheme:" prefix.
[[nodiscard]] std::string uri_scheme(std::string_view uri);

class ResourceRegistry {
public:
    ResourceRegistry();

    [[nodiscard]] ServerResult<void> register_resource(ResourceDescriptor descriptor);

    /// Fallback reader for URIs of `scheme` that have no descriptor
    [[nodiscard]] ServerResult<void> add_scheme_reader(std::string scheme, ResourceReader reader);

    /// {"resources": [...], "nextCursor"?}
    [[nodiscard]] ServerResult<Json> list(const std::optional<std::string>& cursor,
                                          std::size_t page_size = 0) const;

    /// Exact descriptor match first, then a scheme reader, else ResourceNotFound.
    [[nodiscard]] ServerResult<ReadResourceResult> read(const std::string& uri, RequestContext& context) const;

    [[nodiscard]] std::vector<ResourceDescriptor> all() const { return catalog_.all(); }
    [[nodiscard]] std::size_t size() const { return catalog_.size(); }

    void set_change_listener(std::function<void()> listener) {
        catalog_.set_change_listener(std::move(listener));
    }

private:
    Catalog<ResourceDescriptor> catalog_;
    mutable std::shared_mutex schemes_mutex_;
    std::map<std::string, ResourceReader> scheme_readers_;
};

}  // namespace statmcp
