#pragma once

#include "adapter.hpp"
#include <functional>
#include <string>
#include <vector>

namespace arbor {

// TokenColumn - a column whose rendered text is a fixed number of
// whitespace separated tokens. Covers the columns the shipped adapters offer.
class TokenColumn : public ColumnDefinition {
public:
    using RenderFn = std::function<std::string(const Entry&)>;

    TokenColumn(std::string name, int tokens, RenderFn render);

    const std::string& name() const override { return _name; }
    std::string render(const Entry& entry) const override;
    std::optional<std::pair<Value, std::string>> parse(std::string_view text) const override;

private:
    std::string _name;
    int _tokens;
    RenderFn _render;
};

// Resolve column names through the adapter; unknown names are skipped
std::vector<ColumnPtr> get_supported_columns(const Adapter& adapter, const std::vector<std::string>& names);

// Shared renderers
std::string format_size(std::uint64_t bytes);
std::string format_permissions(unsigned mode);

} // namespace arbor
