#pragma once

#include "result.hpp"
#include "types.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace arbor {

struct FloatConfig {
    int padding = 2;
    int max_width = 0;
    int max_height = 0;
    std::string border = "rounded";
    Dict win_options;

    bool has_border() const { return border != "none" && !border.empty(); }
};

// Config - YAML loader for engine settings. A built-in default document is
// loaded first; every user file is merged on top, section by section.
class Config {
public:
    static Result<std::shared_ptr<Config>> create(const std::vector<std::filesystem::path>& paths = {});
    static Result<std::shared_ptr<Config>> create_from_string(const std::string& yaml_content);
    // Files first, then the inline document
    static Result<std::shared_ptr<Config>> create(const std::vector<std::filesystem::path>& paths,
                                                  const std::string& yaml_content);

    // scheme ("arbor://") -> adapter name ("files")
    const std::map<std::string, std::string>& adapters() const { return _adapters; }
    // alias scheme -> canonical scheme
    const std::map<std::string, std::string>& adapter_aliases() const { return _adapter_aliases; }
    const std::vector<std::string>& columns() const { return _columns; }
    const Dict& win_options() const { return _win_options; }
    const FloatConfig& float_config() const { return _float; }

    bool default_file_explorer() const { return _default_file_explorer; }
    bool restore_win_options() const { return _restore_win_options; }
    bool skip_confirm_for_simple_edits() const { return _skip_confirm_for_simple_edits; }
    bool silence_scp_warning() const { return _silence_scp_warning; }
    bool silence_netrw_warning() const { return _silence_netrw_warning; }

    void set_columns(std::vector<std::string> columns) { _columns = std::move(columns); }

    Result<void> init();

private:
    Config() = default;

    Result<void> _load_file(const std::filesystem::path& path);
    Result<void> _load_string(const std::string& yaml_content, const std::string& origin);
    Result<void> _apply(const YAML::Node& root, const std::string& origin);

    static Dict _yaml_to_dict(const YAML::Node& node);
    static Value _yaml_to_value(const YAML::Node& node);

    std::vector<std::filesystem::path> _paths;
    std::string _inline_yaml;

    std::map<std::string, std::string> _adapters;
    std::map<std::string, std::string> _adapter_aliases;
    std::vector<std::string> _columns;
    Dict _win_options;
    FloatConfig _float;
    bool _default_file_explorer = true;
    bool _restore_win_options = true;
    bool _skip_confirm_for_simple_edits = false;
    bool _silence_scp_warning = false;
    bool _silence_netrw_warning = false;
};

using ConfigPtr = std::shared_ptr<Config>;

} // namespace arbor
