#pragma once

#include "result.hpp"
#include "types.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace arbor {

class AdapterRegistry;
class Config;
class Dispatcher;
class DirectoryView;
class EntryCache;
class FloatWindowManager;
class Host;
class LifecycleController;
class Mutator;
class Navigator;
class NotificationBuffer;
class ViewStateStore;

// Engine configuration
struct EngineConfig {
    std::vector<std::filesystem::path> config_paths;
    std::string config_yaml;  // applied after the files
    std::vector<std::filesystem::path> plugin_paths;
    std::shared_ptr<Mutator> mutator;
};

// Engine - wires every component against one host and dispatcher.
// Actions registered by setup():
//   Arbor   {args: [--float] [dir]}
//   save    {confirm: bool}
//   discard, close
//   select  {vertical: bool, horizontal: bool, preview: bool, split: string}
class Engine {
public:
    static Result<std::shared_ptr<Engine>> create(
        std::shared_ptr<Host> host,
        std::shared_ptr<Dispatcher> dispatcher,
        const EngineConfig& config
    );

    ~Engine();

    Result<void> setup();
    Result<void> dispose();

    // Runs the user command "Arbor <args>"
    Result<void> run_command(const std::vector<std::string>& args);

    std::shared_ptr<Host> host() const { return _host; }
    std::shared_ptr<Dispatcher> dispatcher() const { return _dispatcher; }
    std::shared_ptr<Config> config() const { return _config; }
    std::shared_ptr<AdapterRegistry> registry() const { return _registry; }
    std::shared_ptr<EntryCache> cache() const { return _cache; }
    std::shared_ptr<ViewStateStore> view_state() const { return _view_state; }
    std::shared_ptr<NotificationBuffer> notifications() const { return _notifications; }
    std::shared_ptr<DirectoryView> view() const { return _view; }
    std::shared_ptr<LifecycleController> lifecycle() const { return _lifecycle; }
    std::shared_ptr<FloatWindowManager> floats() const { return _floats; }
    std::shared_ptr<Navigator> navigator() const { return _navigator; }

private:
    Engine() = default;

    Result<void> _init(const EngineConfig& config);
    Result<void> _register_actions();

    std::shared_ptr<Host> _host;
    std::shared_ptr<Dispatcher> _dispatcher;
    std::shared_ptr<Config> _config;
    std::shared_ptr<AdapterRegistry> _registry;
    std::shared_ptr<EntryCache> _cache;
    std::shared_ptr<ViewStateStore> _view_state;
    std::shared_ptr<NotificationBuffer> _notifications;
    std::shared_ptr<DirectoryView> _view;
    std::shared_ptr<LifecycleController> _lifecycle;
    std::shared_ptr<FloatWindowManager> _floats;
    std::shared_ptr<Navigator> _navigator;
    bool _disposed = false;
};

using EnginePtr = std::shared_ptr<Engine>;

} // namespace arbor
