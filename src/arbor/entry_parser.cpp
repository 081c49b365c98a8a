#include "entry_parser.hpp"
#include <cctype>
#include <cstdio>

namespace arbor {

static std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

static constexpr std::string_view LINK_SEPARATOR = " -> ";

std::optional<ParsedLine> parse_line(std::string_view line, const std::vector<ColumnPtr>& columns) {
    if (line.size() < 2 || line[0] != '/') {
        return std::nullopt;
    }
    std::size_t pos = 1;
    while (pos < line.size() && std::isdigit(static_cast<unsigned char>(line[pos]))) ++pos;
    if (pos == 1 || pos >= line.size() || line[pos] != ' ' || pos + 1 >= line.size()) {
        return std::nullopt;
    }

    ParsedLine parsed;
    try {
        parsed.id = std::stoull(std::string(line.substr(1, pos - 1)));
    } catch (const std::exception&) {
        return std::nullopt;
    }

    std::string rest(line.substr(pos + 1));
    for (const auto& col : columns) {
        auto res = col->parse(rest);
        if (!res) {
            return std::nullopt;
        }
        parsed.column_values[col->name()] = res->first;
        rest = std::move(res->second);
    }
    if (rest.empty()) {
        return std::nullopt;
    }

    if (rest.back() == '/') {
        rest.pop_back();
        parsed.type = EntryType::Directory;
    }
    parsed.name = rest;
    if (parsed.name.empty()) {
        return std::nullopt;
    }
    return parsed;
}

// "<name> -> <target>" only means a link when the entry is one
static bool split_link_target(ParsedLine& parsed) {
    auto arrow = parsed.name.find(LINK_SEPARATOR);
    if (arrow == std::string::npos || arrow == 0) {
        return false;
    }
    parsed.link_target = parsed.name.substr(arrow + LINK_SEPARATOR.size());
    if (parsed.type == EntryType::Directory) {
        parsed.link_target += "/";
    }
    parsed.name.erase(arrow);
    parsed.type = EntryType::Link;
    return true;
}

std::optional<Entry> parse_entry(std::string_view line, const std::vector<ColumnPtr>& columns, const EntryCache& cache) {
    if (auto parsed = parse_line(line, columns)) {
        Entry entry;
        if (auto cached = cache.get_entry_by_id(parsed->id)) {
            entry = *cached;
            if (cached->type == EntryType::Link) {
                split_link_target(*parsed);
            } else if (cached->type == EntryType::File || cached->type == EntryType::Directory) {
                entry.type = parsed->type;
            }
            entry.name = parsed->name;
            return entry;
        }
        // Stale id: keep what the user sees, drop the id
        if (split_link_target(*parsed)) {
            bool to_dir = !parsed->link_target.empty() && parsed->link_target.back() == '/';
            parsed->type = to_dir ? EntryType::Directory : EntryType::File;
        }
        entry.name = parsed->name;
        entry.type = parsed->type;
        return entry;
    }

    std::string_view text = trim(line);
    if (text.empty()) {
        return std::nullopt;
    }
    Entry entry;
    if (text.back() == '/') {
        text.remove_suffix(1);
        entry.type = EntryType::Directory;
    }
    entry.name = std::string(text);
    if (entry.name.empty()) {
        return std::nullopt;
    }
    return entry;
}

std::string format_entry_id(EntryId id) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "/%03llu", static_cast<unsigned long long>(id));
    return buf;
}

std::string render_entry_line(const Entry& entry, const std::vector<ColumnPtr>& columns) {
    std::string line = format_entry_id(entry.id.value_or(0));
    for (const auto& col : columns) {
        line += " ";
        line += col->render(entry);
    }
    line += " ";
    line += entry.name;
    if (entry.type == EntryType::Link) {
        auto target = get_as<std::string>(entry.meta, "link").value_or("");
        line += std::string(LINK_SEPARATOR) + target;
        if (entry.is_directory_like() && (target.empty() || target.back() != '/')) {
            line += "/";
        }
    } else if (entry.type == EntryType::Directory) {
        line += "/";
    }
    return line;
}

} // namespace arbor
