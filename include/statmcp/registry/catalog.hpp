#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Catalog
// ═══════════════════════════════════════════════════════════════════════════
// Ordered, key-indexed store shared by the tool, resource and prompt
// registries. Listing follows registration order and pages with an opaque
// cursor (the decimal offset of the next item).
//
// Thread-safety: writers take the lock exclusively, readers shared. find()
// copies the descriptor out so handlers run without the lock held.

#include "statmcp/protocol/errors.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace statmcp {

template <typename Descriptor>
struct Page {
    std::vector<Descriptor> items;
    std::optional<std::string> next_cursor;
};

/// Offset encoded in a list cursor; nullopt for anything that is not one.
[[nodiscard]] inline std::optional<std::size_t> parse_cursor(std::string_view cursor) {
    if (cursor.empty()) {
        return std::nullopt;
    }
    std::size_t offset = 0;
    const auto [ptr, ec] = std::from_chars(cursor.data(), cursor.data() + cursor.size(), offset);
    if ((ec != std::errc{}) || (ptr != cursor.data() + cursor.size())) {
        return std::nullopt;
    }
    return offset;
}

/// Descriptor must provide `const std::string& key() const`.
template <typename Descriptor>
class Catalog {
public:
    using ChangeListener = std::function<void()>;

    /// `kind` names the entries in error messages ("tool", "resource", ...)
    explicit Catalog(std::string kind)
        : kind_(std::move(kind)) {}

    Catalog(const Catalog&) = delete;
    Catalog& operator=(const Catalog&) = delete;

    /// Rejects an empty or already-registered key. Never overwrites.
    [[nodiscard]] ServerResult<void> add(Descriptor descriptor) {
        ChangeListener listener;
        {
            std::unique_lock lock(mutex_);
            const std::string key = descriptor.key();
            if (key.empty()) {
                return tl::unexpected(ServerError::invalid_params(kind_ + " name must not be empty"));
            }
            if (index_.contains(key)) {
                return tl::unexpected(ServerError::invalid_params(
                    kind_ + " '" + key + "' is already registered",
                    Json{{"name", key}}));
            }
            index_.emplace(key, entries_.size());
            entries_.push_back(std::move(descriptor));
            listener = listener_;
        }
        if (listener) {
            listener();
        }
        return {};
    }

    [[nodiscard]] std::optional<Descriptor> find(std::string_view key) const {
        std::shared_lock lock(mutex_);
        const auto it = index_.find(std::string(key));
        if (it == index_.end()) {
            return std::nullopt;
        }
        return entries_[it->second];
    }

    [[nodiscard]] bool contains(std::string_view key) const {
        std::shared_lock lock(mutex_);
        return index_.contains(std::string(key));
    }

    /// One page starting at `cursor`; page_size 0 returns everything.
    [[nodiscard]] ServerResult<Page<Descriptor>> list(const std::optional<std::string>& cursor,
                                                      std::size_t page_size) const {
        std::shared_lock lock(mutex_);

        std::size_t offset = 0;
        if (cursor.has_value()) {
            auto parsed = parse_cursor(*cursor);
            if ((parsed.has_value() == false) || (*parsed > entries_.size())) {
                return tl::unexpected(ServerError::invalid_params(
                    "invalid cursor '" + *cursor + "'",
                    Json{{"cursor", *cursor}}));
            }
            offset = *parsed;
        }

        const std::size_t remaining = entries_.size() - offset;
        const std::size_t count = (page_size == 0) ? remaining : std::min(page_size, remaining);

        Page<Descriptor> page;
        page.items.assign(entries_.begin() + static_cast<std::ptrdiff_t>(offset),
                          entries_.begin() + static_cast<std::ptrdiff_t>(offset + count));
        if (offset + count < entries_.size()) {
            page.next_cursor = std::to_string(offset + count);
        }
        return page;
    }

    [[nodiscard]] std::vector<Descriptor> all() const {
        std::shared_lock lock(mutex_);
        return entries_;
    }

    [[nodiscard]] std::size_t size() const {
        std::shared_lock lock(mutex_);
        return entries_.size();
    }

    /// Called after every successful add
    void set_change_listener(ChangeListener listener) {
        std::unique_lock lock(mutex_);
        listener_ = std::move(listener);
    }

    [[nodiscard]] const std::string& kind() const noexcept { return kind_; }

private:
    const std::string kind_;
    mutable std::shared_mutex mutex_;
    std::vector<Descriptor> entries_;
    std::unordered_map<std::string, std::size_t> index_;
    ChangeListener listener_;
};

}  // namespace statmcp
