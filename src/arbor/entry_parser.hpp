#pragma once

#include "adapter.hpp"
#include "entry_cache.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace arbor {

// One line of a directory buffer in its structured form:
//   /<id> <col_1> ... <col_n> <name>[/]      (links: <name> -> <target>)
// The link target is only split off once the entry is known to be a link.
struct ParsedLine {
    EntryId id = 0;
    std::string name;     // as typed, trailing slash removed
    EntryType type = EntryType::File;
    std::string link_target;
    Dict column_values;   // column name -> parsed value
};

// Structured parse only; nullopt when the line does not follow the grammar
std::optional<ParsedLine> parse_line(std::string_view line, const std::vector<ColumnPtr>& columns);

// Structured parse resolved against the cache, falling back to a literal name.
// - id known to the cache: the cached record under the typed name
// - id unknown: typed name and type, without id; " -> " is guessed to be a link
// - no structure: trimmed text, trailing '/' makes a directory
// - blank: nullopt
std::optional<Entry> parse_entry(std::string_view line, const std::vector<ColumnPtr>& columns, const EntryCache& cache);

std::string format_entry_id(EntryId id);
std::string render_entry_line(const Entry& entry, const std::vector<ColumnPtr>& columns);

} // namespace arbor
