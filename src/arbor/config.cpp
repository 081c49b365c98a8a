#include "config.hpp"
#include <spdlog/spdlog.h>

namespace arbor {

// Defaults; user files only need to name what they change
static const char* BUILTIN_YAML = R"(
adapters:
  "arbor://": files
  "arbor-mem://": memory

adapter-aliases: {}

columns: []

default-file-explorer: true
restore-win-options: true
skip-confirm-for-simple-edits: false
silence-scp-warning: false
silence-netrw-warning: false

win-options:
  wrap: false
  signcolumn: "no"
  cursorcolumn: false
  foldcolumn: "0"
  spell: false
  list: false
  conceallevel: 3
  concealcursor: "n"

float:
  padding: 2
  max-width: 0
  max-height: 0
  border: rounded
  win-options:
    winblend: 10
)";

Result<std::shared_ptr<Config>> Config::create(const std::vector<std::filesystem::path>& paths) {
    auto config = std::shared_ptr<Config>(new Config());
    config->_paths = paths;

    if (auto res = config->init(); !res) {
        return Err<std::shared_ptr<Config>>("Config::create: init failed", res);
    }
    return config;
}

Result<std::shared_ptr<Config>> Config::create_from_string(const std::string& yaml_content) {
    auto config = std::shared_ptr<Config>(new Config());
    config->_inline_yaml = yaml_content;

    if (auto res = config->init(); !res) {
        return Err<std::shared_ptr<Config>>("Config::create_from_string: init failed", res);
    }
    return config;
}

Result<std::shared_ptr<Config>> Config::create(const std::vector<std::filesystem::path>& paths,
                                               const std::string& yaml_content) {
    auto config = std::shared_ptr<Config>(new Config());
    config->_paths = paths;
    config->_inline_yaml = yaml_content;

    if (auto res = config->init(); !res) {
        return Err<std::shared_ptr<Config>>("Config::create: init failed", res);
    }
    return config;
}

Result<void> Config::init() {
    if (auto res = _load_string(BUILTIN_YAML, "builtin"); !res) {
        return Err<void>("Config::init: builtin defaults are broken", res);
    }

    for (const auto& path : _paths) {
        if (auto res = _load_file(path); !res) {
            return Err<void>("Config::init: failed to load '" + path.string() + "'", res);
        }
    }

    if (!_inline_yaml.empty()) {
        if (auto res = _load_string(_inline_yaml, "inline"); !res) {
            return Err<void>("Config::init: failed to load inline config", res);
        }
    }

    return Ok();
}

Result<void> Config::_load_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        return Err<void>("Config::_load_file: no such file: " + path.string());
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return Err<void>("Config::_load_file: YAML parse error: " + std::string(e.what()));
    }

    spdlog::debug("Config: loaded {}", path.string());
    return _apply(root, path.string());
}

Result<void> Config::_load_string(const std::string& yaml_content, const std::string& origin) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_content);
    } catch (const YAML::Exception& e) {
        return Err<void>("Config::_load_string: YAML parse error in " + origin + ": " + std::string(e.what()));
    }
    return _apply(root, origin);
}

static Result<void> _merge_scheme_table(const YAML::Node& node, const std::string& section,
                                        std::map<std::string, std::string>& table) {
    if (!node.IsMap()) {
        return Err<void>("'" + section + "' must be a map of scheme to name");
    }
    for (const auto& kv : node) {
        std::string scheme = kv.first.as<std::string>();
        if (scheme.size() <= 3 || scheme.compare(scheme.size() - 3, 3, "://") != 0) {
            return Err<void>("'" + section + "': scheme '" + scheme + "' must end with '://'");
        }
        if (kv.second.IsNull()) {
            table.erase(scheme);
            continue;
        }
        if (!kv.second.IsScalar()) {
            return Err<void>("'" + section + "': value for '" + scheme + "' must be a string");
        }
        table[scheme] = kv.second.as<std::string>();
    }
    return Ok();
}

Result<void> Config::_apply(const YAML::Node& root, const std::string& origin) {
    if (!root || root.IsNull()) {
        return Ok();
    }
    if (!root.IsMap()) {
        return Err<void>("Config::_apply: top level of " + origin + " must be a map");
    }

    try {
        if (root["adapters"]) {
            if (auto res = _merge_scheme_table(root["adapters"], "adapters", _adapters); !res) {
                return Err<void>("Config::_apply: " + origin, res);
            }
        }
        if (root["adapter-aliases"]) {
            if (auto res = _merge_scheme_table(root["adapter-aliases"], "adapter-aliases", _adapter_aliases); !res) {
                return Err<void>("Config::_apply: " + origin, res);
            }
        }

        if (root["columns"]) {
            _columns.clear();
            for (const auto& col : root["columns"]) {
                _columns.push_back(col.as<std::string>());
            }
        }

        if (root["default-file-explorer"]) _default_file_explorer = root["default-file-explorer"].as<bool>();
        if (root["restore-win-options"]) _restore_win_options = root["restore-win-options"].as<bool>();
        if (root["skip-confirm-for-simple-edits"]) _skip_confirm_for_simple_edits = root["skip-confirm-for-simple-edits"].as<bool>();
        if (root["silence-scp-warning"]) _silence_scp_warning = root["silence-scp-warning"].as<bool>();
        if (root["silence-netrw-warning"]) _silence_netrw_warning = root["silence-netrw-warning"].as<bool>();

        if (root["win-options"]) {
            for (auto& [k, v] : _yaml_to_dict(root["win-options"])) {
                _win_options[k] = v;
            }
        }

        if (auto f = root["float"]) {
            if (f["padding"]) _float.padding = f["padding"].as<int>();
            if (f["max-width"]) _float.max_width = f["max-width"].as<int>();
            if (f["max-height"]) _float.max_height = f["max-height"].as<int>();
            if (f["border"]) _float.border = f["border"].as<std::string>();
            if (f["win-options"]) {
                for (auto& [k, v] : _yaml_to_dict(f["win-options"])) {
                    _float.win_options[k] = v;
                }
            }
            if (_float.padding < 0 || _float.max_width < 0 || _float.max_height < 0) {
                return Err<void>("Config::_apply: float padding and size caps must not be negative in " + origin);
            }
        }
    } catch (const YAML::Exception& e) {
        return Err<void>("Config::_apply: bad value in " + origin + ": " + std::string(e.what()));
    }

    return Ok();
}

Dict Config::_yaml_to_dict(const YAML::Node& node) {
    Dict result;
    if (!node.IsMap()) {
        return result;
    }

    for (const auto& kv : node) {
        std::string key = kv.first.as<std::string>();
        result[key] = _yaml_to_value(kv.second);
    }

    return result;
}

Value Config::_yaml_to_value(const YAML::Node& node) {
    if (node.IsNull()) {
        return Value{};
    }

    if (node.IsScalar()) {
        // Quoted scalars stay strings ("no", "0")
        if (node.Tag() == "!") {
            return Value(node.as<std::string>());
        }
        bool b;
        if (YAML::convert<bool>::decode(node, b)) {
            return Value(b);
        }
        int i;
        if (YAML::convert<int>::decode(node, i)) {
            return Value(i);
        }
        double d;
        if (YAML::convert<double>::decode(node, d)) {
            return Value(d);
        }
        return Value(node.as<std::string>());
    }

    if (node.IsSequence()) {
        List list;
        for (const auto& item : node) {
            list.push_back(_yaml_to_value(item));
        }
        return Value(list);
    }

    if (node.IsMap()) {
        return Value(_yaml_to_dict(node));
    }

    return Value{};
}

} // namespace arbor
