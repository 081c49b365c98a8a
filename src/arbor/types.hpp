#pragma once

#include "result.hpp"
#include <any>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace arbor {

// Value type for dynamic data (events, metadata, options)
using Value = std::any;
using Dict = std::map<std::string, Value>;
using List = std::vector<Value>;

// Helper to get value from std::any
template<typename T>
std::optional<T> get_as(const Value& v) {
    try {
        return std::any_cast<T>(v);
    } catch (const std::bad_any_cast&) {
        return std::nullopt;
    }
}

template<typename T>
std::optional<T> get_as(const Dict& d, const std::string& key) {
    auto it = d.find(key);
    if (it == d.end()) return std::nullopt;
    return get_as<T>(it->second);
}

// Host handles. Zero is never a live handle.
using BufferId = int;
using WindowId = int;
using EntryId = std::uint64_t;

constexpr BufferId NO_BUFFER = 0;
constexpr WindowId NO_WINDOW = 0;

enum class EntryType { File, Directory, Socket, Link };

const char* to_string(EntryType type);
std::optional<EntryType> entry_type_from_string(const std::string& s);

// One child of a directory, either reported by an adapter or typed by the user.
// `id` is empty until the entry cache has seen it.
struct Entry {
    std::string name;
    EntryType type = EntryType::File;
    std::optional<EntryId> id;
    Dict meta;

    // True for directories and for links whose target is a directory
    bool is_directory_like() const;
};

enum class SplitModifier { AboveLeft, BelowRight, TopLeft, BotRight };

struct Cursor {
    int line = 1;  // 1-based
    int col = 0;
};

} // namespace arbor
