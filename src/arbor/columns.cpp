#include "columns.hpp"
#include <cstdio>

namespace arbor {

const char* to_string(ActionType type) {
    switch (type) {
        case ActionType::Create: return "create";
        case ActionType::Delete: return "delete";
        case ActionType::Move: return "move";
        case ActionType::Copy: return "copy";
        case ActionType::Change: return "change";
    }
    return "create";
}

TokenColumn::TokenColumn(std::string name, int tokens, RenderFn render)
    : _name(std::move(name)), _tokens(tokens), _render(std::move(render)) {}

std::string TokenColumn::render(const Entry& entry) const {
    return _render(entry);
}

std::optional<std::pair<Value, std::string>> TokenColumn::parse(std::string_view text) const {
    std::size_t pos = 0;
    std::size_t start = std::string_view::npos;
    for (int i = 0; i < _tokens; ++i) {
        while (pos < text.size() && text[pos] == ' ') ++pos;
        if (pos >= text.size()) {
            return std::nullopt;
        }
        if (start == std::string_view::npos) start = pos;
        while (pos < text.size() && text[pos] != ' ') ++pos;
    }
    // The column must be followed by a separator and something after it
    if (pos >= text.size() || text[pos] != ' ') {
        return std::nullopt;
    }
    std::string value(text.substr(start, pos - start));
    std::string rest(text.substr(pos + 1));
    return std::make_pair(Value(value), rest);
}

std::vector<ColumnPtr> get_supported_columns(const Adapter& adapter, const std::vector<std::string>& names) {
    std::vector<ColumnPtr> out;
    for (const auto& n : names) {
        if (auto col = adapter.get_column(n)) {
            out.push_back(std::move(col));
        }
    }
    return out;
}

std::string format_size(std::uint64_t bytes) {
    static const char* units[] = {"B", "K", "M", "G", "T"};
    double v = static_cast<double>(bytes);
    int unit = 0;
    while (v >= 1024.0 && unit < 4) {
        v /= 1024.0;
        ++unit;
    }
    char buf[32];
    if (unit == 0) {
        std::snprintf(buf, sizeof(buf), "%lluB", static_cast<unsigned long long>(bytes));
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f%s", v, units[unit]);
    }
    return buf;
}

std::string format_permissions(unsigned mode) {
    std::string out = "---------";
    const char* flags = "rwxrwxrwx";
    for (int i = 0; i < 9; ++i) {
        if (mode & (1u << (8 - i))) out[i] = flags[i];
    }
    return out;
}

} // namespace arbor
