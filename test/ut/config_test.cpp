// Configuration loading unit tests
#include <boost/ut.hpp>
#include "arbor/config.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace boost::ut;
using namespace arbor;

namespace fs = std::filesystem;

static fs::path write_temp_yaml(const std::string& name, const std::string& content) {
    fs::path path = fs::temp_directory_path() / ("arbor-config-" + std::to_string(::getpid()) + "-" + name);
    std::ofstream out(path);
    out << content;
    return path;
}

suite config_tests = [] {
    "builtin_defaults"_test = [] {
        auto res = Config::create();
        expect(res.has_value()) << "Config::create failed: " << error_msg(res);
        auto config = *res;

        expect(config->adapters().at("arbor://") == "files");
        expect(config->adapters().at("arbor-mem://") == "memory");
        expect(config->adapter_aliases().empty());
        expect(config->columns().empty());
        expect(config->default_file_explorer());
        expect(config->restore_win_options());
        expect(!config->skip_confirm_for_simple_edits());
        expect(!config->silence_scp_warning());
        expect(!config->silence_netrw_warning());

        expect(get_as<bool>(config->win_options(), "wrap") == std::optional<bool>(false));
        // Quoted scalars stay strings
        expect(get_as<std::string>(config->win_options(), "signcolumn") == std::optional<std::string>("no"));
        expect(get_as<int>(config->win_options(), "conceallevel") == std::optional<int>(3));

        const auto& f = config->float_config();
        expect(f.padding == 2_i);
        expect(f.max_width == 0_i);
        expect(f.border == "rounded");
        expect(f.has_border());
        expect(get_as<int>(f.win_options, "winblend") == std::optional<int>(10));
    };

    "inline_yaml_merges_per_key"_test = [] {
        auto res = Config::create_from_string(R"(
adapters:
  "ssh://": files
  "arbor-mem://": ~
adapter-aliases:
  "file://": "arbor://"
columns: [permissions, size]
silence-scp-warning: true
silence-netrw-warning: true
win-options:
  wrap: true
float:
  border: none
  max-width: 80
)");
        expect(res.has_value()) << error_msg(res);
        auto config = *res;

        expect(config->adapters().count("arbor://") == 1_ul) << "builtin scheme kept";
        expect(config->adapters().count("ssh://") == 1_ul);
        expect(config->adapters().count("arbor-mem://") == 0_ul) << "null removes a scheme";
        expect(config->adapter_aliases().at("file://") == "arbor://");
        expect(config->columns().size() == 2_ul);
        expect(config->silence_scp_warning());
        expect(config->silence_netrw_warning());
        expect(get_as<bool>(config->win_options(), "wrap") == std::optional<bool>(true));
        expect(config->win_options().count("spell") == 1_ul) << "untouched options survive";
        expect(!config->float_config().has_border());
        expect(config->float_config().max_width == 80_i);
        expect(config->float_config().padding == 2_i);
    };

    "later_files_win"_test = [] {
        auto first = write_temp_yaml("first.yaml", "columns: [size]\nrestore-win-options: false\n");
        auto second = write_temp_yaml("second.yaml", "columns: [mtime]\n");

        auto res = Config::create({first, second});
        expect(res.has_value()) << error_msg(res);
        auto config = *res;
        expect(config->columns() == std::vector<std::string>{"mtime"});
        expect(!config->restore_win_options()) << "keys absent from the later file are kept";

        fs::remove(first);
        fs::remove(second);
    };

    "inline_yaml_applies_after_files"_test = [] {
        auto file = write_temp_yaml("base.yaml", "default-file-explorer: false\ncolumns: [size]\n");
        auto res = Config::create({file}, "columns: [permissions]\n");
        expect(res.has_value()) << error_msg(res);
        expect(!(*res)->default_file_explorer());
        expect((*res)->columns() == std::vector<std::string>{"permissions"});
        fs::remove(file);
    };

    "malformed_yaml_is_an_error"_test = [] {
        auto res = Config::create_from_string("adapters: [unclosed");
        expect(!res.has_value()) << "malformed YAML must fail";
    };

    "non_map_adapters_is_an_error"_test = [] {
        expect(!Config::create_from_string("adapters: [files]\n").has_value());
        expect(!Config::create_from_string("adapters:\n  \"nocolon\": files\n").has_value())
            << "schemes must end with ://";
    };

    "missing_file_is_an_error"_test = [] {
        auto res = Config::create({"/nonexistent/arbor.yaml"});
        expect(!res.has_value());
    };

    "negative_float_padding_is_an_error"_test = [] {
        expect(!Config::create_from_string("float:\n  padding: -1\n").has_value());
    };
};

int main() {
    return 0;
}
