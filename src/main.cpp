#include "arbor/dispatcher.hpp"
#include "arbor/engine.hpp"
#include "arbor/headless_host.hpp"
#include "arbor/notifications.hpp"
#include <iostream>
#include <filesystem>
#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);

    std::vector<std::filesystem::path> config_paths;
    std::vector<std::filesystem::path> plugin_paths;
    std::vector<std::string> command;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                config_paths.push_back(argv[++i]);
            }
        } else if (arg == "--plugins-path") {
            if (i + 1 < argc) {
                plugin_paths.push_back(argv[++i]);
            }
        } else if (arg == "--log-level") {
            if (i + 1 < argc) {
                spdlog::set_level(spdlog::level::from_str(argv[++i]));
            }
        } else if (arg == "--float") {
            command.push_back(arg);
        } else if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: arbor [options] [dir]\n"
                      << "Options:\n"
                      << "  -c, --config <file>        Add a YAML config file (later files win)\n"
                      << "  --plugins-path <path>      Add adapter plugin search path\n"
                      << "  --log-level <level>        trace, debug, info, warn, err (default: warn)\n"
                      << "  --float                    Open the directory in a floating window\n"
                      << "  -h, --help                 Show this help\n"
                      << "\nExamples:\n"
                      << "  arbor /etc\n"
                      << "  arbor --float -c ~/.config/arbor.yaml arbor-mem:///\n";
            return 0;
        } else {
            command.push_back(arg);
        }
    }

    // Default plugin path - look for plugins directory next to executable
    if (plugin_paths.empty()) {
        std::error_code ec;
        auto exe_path = std::filesystem::canonical("/proc/self/exe", ec).parent_path();
        if (!ec) {
            plugin_paths.push_back(exe_path / "plugins");
        }
    }

    auto disp_res = arbor::Dispatcher::create();
    if (!disp_res) {
        std::cerr << "Failed to create dispatcher: " << arbor::error_msg(disp_res) << std::endl;
        return 1;
    }
    auto dispatcher = *disp_res;

    auto host_res = arbor::HeadlessHost::create(dispatcher);
    if (!host_res) {
        std::cerr << "Failed to create host: " << arbor::error_msg(host_res) << std::endl;
        return 1;
    }
    auto host = *host_res;

    arbor::EngineConfig config;
    config.config_paths = config_paths;
    config.plugin_paths = plugin_paths;

    auto engine_res = arbor::Engine::create(host, dispatcher, config);
    if (!engine_res) {
        std::cerr << "Failed to create engine: " << arbor::error_msg(engine_res) << std::endl;
        return 1;
    }
    auto engine = *engine_res;

    if (auto res = engine->setup(); !res) {
        std::cerr << "Engine setup failed: " << arbor::error_msg(res) << std::endl;
        return 1;
    }

    int status = 0;
    if (auto res = engine->run_command(command); !res) {
        spdlog::debug("Arbor command failed: {}", arbor::error_msg(res));
        status = 2;
    }
    dispatcher->run_pending();

    arbor::BufferId buffer = host->window_buffer(host->current_window());
    std::cout << host->buffer_name(buffer) << "\n";
    for (const auto& line : host->get_lines(buffer)) {
        std::cout << line << "\n";
    }
    for (const auto& entry : engine->notifications()->entries()) {
        std::cerr << "[" << arbor::NotificationBuffer::level_to_string(entry.level) << "] "
                  << entry.message << "\n";
    }

    if (auto res = engine->dispose(); !res) {
        spdlog::warn("Engine dispose failed: {}", arbor::error_msg(res));
    }
    return status;
}
