#include "entry_cache.hpp"

namespace arbor {

std::vector<Entry> EntryCache::store_entries(const Url& url, std::vector<Entry> entries) {
    std::string key = _key(url);
    auto& old_children = _by_url[key];
    std::map<std::string, Entry> children;

    for (auto& entry : entries) {
        if (auto it = old_children.find(entry.name); it != old_children.end() && it->second.id) {
            entry.id = it->second.id;
        } else {
            entry.id = _next_id++;
        }
        children[entry.name] = entry;
    }

    for (const auto& [name, old] : old_children) {
        if (!children.count(name) && old.id) {
            _by_id.erase(*old.id);
        }
    }
    for (const auto& [name, entry] : children) {
        _by_id[*entry.id] = {key, name};
    }

    old_children = std::move(children);
    _urls[key] = addslash(url);
    return entries;
}

std::map<std::string, Entry> EntryCache::list_url(const Url& url) const {
    auto it = _by_url.find(_key(url));
    return it == _by_url.end() ? std::map<std::string, Entry>{} : it->second;
}

std::optional<Entry> EntryCache::get_entry_by_id(EntryId id) const {
    auto it = _by_id.find(id);
    if (it == _by_id.end()) {
        return std::nullopt;
    }
    const auto& [key, name] = it->second;
    return _by_url.at(key).at(name);
}

std::optional<Url> EntryCache::get_parent_url(EntryId id) const {
    auto it = _by_id.find(id);
    if (it == _by_id.end()) {
        return std::nullopt;
    }
    return _urls.at(it->second.first);
}

void EntryCache::clear_url(const Url& url) {
    std::string key = _key(url);
    auto it = _by_url.find(key);
    if (it == _by_url.end()) {
        return;
    }
    for (const auto& [name, entry] : it->second) {
        if (entry.id) _by_id.erase(*entry.id);
    }
    _by_url.erase(it);
    _urls.erase(key);
}

void EntryCache::clear() {
    _by_url.clear();
    _by_id.clear();
    _urls.clear();
}

} // namespace arbor
