#pragma once
#include "types.hpp"
#include "handlers.hpp"
#include "uri_template.hpp"
#include "shared_mutex.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mcpgate {

// ---------- Entries ----------

struct ResourceEntry {
    ResourceDefinition definition;
    std::shared_ptr<ResourceHandler> handler;
};

struct ResourceTemplateEntry {
    ResourceTemplate definition;
    UriTemplate matcher;
    std::shared_ptr<ResourceTemplateHandler> handler;
};

struct ToolEntry {
    ToolDefinition definition;
    std::shared_ptr<ToolHandler> handler;
};

struct PromptEntry {
    PromptDefinition definition;
    std::shared_ptr<PromptHandler> handler;
};

inline const std::string& registry_key(const ResourceEntry& e) { return e.definition.uri; }
inline const std::string& registry_key(const ResourceTemplateEntry& e) { return e.definition.uri_template; }
inline const std::string& registry_key(const ToolEntry& e) { return e.definition.name; }
inline const std::string& registry_key(const PromptEntry& e) { return e.definition.name; }

// ---------- Registry ----------

/// Keyed collection of capability entries, listed in registration order.
///
/// Many readers (list/find) run in parallel; add/remove are exclusive with
/// everything else. Readers always get copies, never a live view.
template <typename Entry>
class Registry {
public:
    using Definition = decltype(Entry::definition);

    /// Insert, or replace the entry with the same key in place.
    /// Returns true if an existing entry was replaced.
    bool add(Entry entry) {
        std::unique_lock<SharedMutex> lock(mutex_);
        const std::string& key = registry_key(entry);
        auto it = index_.find(key);
        if (it != index_.end()) {
            entries_[it->second] = std::move(entry);
            return true;
        }
        index_.emplace(key, entries_.size());
        entries_.push_back(std::move(entry));
        return false;
    }

    bool remove(const std::string& key) {
        std::unique_lock<SharedMutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) return false;
        size_t pos = it->second;
        index_.erase(it);
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(pos));
        for (size_t i = pos; i < entries_.size(); ++i) {
            index_[registry_key(entries_[i])] = i;
        }
        return true;
    }

    [[nodiscard]] std::optional<Entry> find(const std::string& key) const {
        std::shared_lock<SharedMutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) return std::nullopt;
        return entries_[it->second];
    }

    [[nodiscard]] std::vector<Definition> definitions() const {
        std::shared_lock<SharedMutex> lock(mutex_);
        std::vector<Definition> defs;
        defs.reserve(entries_.size());
        for (const auto& e : entries_) defs.push_back(e.definition);
        return defs;
    }

    [[nodiscard]] size_t size() const {
        std::shared_lock<SharedMutex> lock(mutex_);
        return entries_.size();
    }

    [[nodiscard]] bool empty() const { return size() == 0; }

protected:
    mutable SharedMutex mutex_;
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

using ResourceRegistry = Registry<ResourceEntry>;
using ToolRegistry = Registry<ToolEntry>;
using PromptRegistry = Registry<PromptEntry>;

struct TemplateMatch {
    ResourceTemplateEntry entry;
    UriParams params;
};

class ResourceTemplateRegistry : public Registry<ResourceTemplateEntry> {
public:
    /// First template, in registration order, that matches `uri`.
    /// Overlapping templates are not disambiguated further.
    [[nodiscard]] std::optional<TemplateMatch> match(std::string_view uri) const {
        std::shared_lock<SharedMutex> lock(mutex_);
        for (const auto& e : entries_) {
            if (auto params = e.matcher.match(uri)) {
                return TemplateMatch{e, std::move(*params)};
            }
        }
        return std::nullopt;
    }
};

} // namespace mcpgate
