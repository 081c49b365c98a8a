#pragma once

#include "types.hpp"
#include "url.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace arbor {

// EntryCache - the last listing seen for every directory url, with stable ids.
// A name listed again under the same url keeps its id, so rendered lines stay
// valid across re-renders. Ids are never reused within a session.
class EntryCache {
public:
    // Replace the cached listing of `url`; returns the entries with ids filled in
    std::vector<Entry> store_entries(const Url& url, std::vector<Entry> entries);

    // Cached children of `url` keyed by name; empty when never listed
    std::map<std::string, Entry> list_url(const Url& url) const;

    std::optional<Entry> get_entry_by_id(EntryId id) const;
    // Directory url the entry was listed under
    std::optional<Url> get_parent_url(EntryId id) const;

    void clear_url(const Url& url);
    void clear();

private:
    static std::string _key(const Url& url) { return addslash(url).to_string(); }

    EntryId _next_id = 1;
    std::map<std::string, std::map<std::string, Entry>> _by_url;  // url -> name -> entry
    std::map<EntryId, std::pair<std::string, std::string>> _by_id;  // id -> (url key, name)
    std::map<std::string, Url> _urls;
};

} // namespace arbor
