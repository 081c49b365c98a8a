#include "types.hpp"

namespace arbor {

const char* to_string(EntryType type) {
    switch (type) {
        case EntryType::File: return "file";
        case EntryType::Directory: return "directory";
        case EntryType::Socket: return "socket";
        case EntryType::Link: return "link";
    }
    return "file";
}

std::optional<EntryType> entry_type_from_string(const std::string& s) {
    if (s == "file") return EntryType::File;
    if (s == "directory") return EntryType::Directory;
    if (s == "socket") return EntryType::Socket;
    if (s == "link") return EntryType::Link;
    return std::nullopt;
}

bool Entry::is_directory_like() const {
    if (type == EntryType::Directory) return true;
    if (type != EntryType::Link) return false;
    auto target = get_as<std::string>(meta, "link_type");
    return target && *target == "directory";
}

} // namespace arbor
