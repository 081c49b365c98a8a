#include "adapter_registry.hpp"
#include "adapters/files.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include <spdlog/spdlog.h>
#include <ytrace/ytrace.hpp>
#include <dlfcn.h>
#include <filesystem>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace arbor {

// Plugin function types (from .so files)
using PluginNameFn = const char*(*)();
using PluginTypeFn = const char*(*)();
using PluginAdapterCreateFn = Result<AdapterPtr>(*)(std::shared_ptr<Dispatcher>);

Result<std::shared_ptr<AdapterRegistry>> AdapterRegistry::create(
    std::shared_ptr<Dispatcher> dispatcher,
    const std::map<std::string, std::string>& adapters,
    const std::map<std::string, std::string>& aliases,
    const std::string& plugins_path
) {
    auto registry = std::shared_ptr<AdapterRegistry>(new AdapterRegistry());
    registry->_dispatcher = std::move(dispatcher);
    registry->_adapters = adapters;
    registry->_aliases = aliases;
    registry->_plugins_path = plugins_path;

    if (auto res = registry->init(); !res) {
        return Err<std::shared_ptr<AdapterRegistry>>("AdapterRegistry::create: init failed", res);
    }
    return registry;
}

Result<std::shared_ptr<AdapterRegistry>> AdapterRegistry::create(
    std::shared_ptr<Dispatcher> dispatcher,
    const Config& config,
    const std::string& plugins_path
) {
    return create(std::move(dispatcher), config.adapters(), config.adapter_aliases(), plugins_path);
}

AdapterRegistry::~AdapterRegistry() {
    dispose();
}

Result<void> AdapterRegistry::init() {
    if (auto res = _validate_aliases(); !res) {
        return Err<void>("AdapterRegistry::init: invalid adapter aliases", res);
    }

    if (auto res = register_factory("files", [](std::shared_ptr<Dispatcher> d) {
            return adapters::FilesAdapter::create(std::move(d));
        }); !res) {
        return Err<void>("AdapterRegistry::init: cannot register files adapter", res);
    }

    if (auto res = _load_plugins(); !res) {
        return Err<void>("AdapterRegistry::init: plugin loading failed", res);
    }

    for (const auto& [scheme, adapter_name] : _adapters) {
        if (!has_factory(adapter_name)) {
            spdlog::warn("AdapterRegistry: scheme {} is bound to unknown adapter '{}'", scheme, adapter_name);
        }
    }
    return Ok();
}

// dlclose once nothing can run plugin code: the queue is drained and every
// plugin adapter instance is gone. Otherwise the library stays loaded.
static void unload_plugins(std::vector<void*> handles, std::vector<std::weak_ptr<Adapter>> instances) {
    for (const auto& weak : instances) {
        if (!weak.expired()) {
            ywarn("AdapterRegistry: plugin adapter still in use, keeping {} libraries loaded", handles.size());
            return;
        }
    }
    for (auto handle : handles) {
        if (handle) {
            dlclose(handle);
        }
    }
}

Result<void> AdapterRegistry::dispose() {
    std::vector<std::weak_ptr<Adapter>> plugin_instances;
    for (auto& [name, adapter] : _instances) {
        if (!adapter) {
            continue;
        }
        if (auto res = adapter->dispose(); !res) {
            spdlog::warn("AdapterRegistry: dispose of '{}' failed: {}", name, res.error().to_string());
        }
        if (auto it = _factories.find(name); it != _factories.end() && it->second.origin != "builtin") {
            plugin_instances.push_back(adapter);
        }
    }
    // Instances and factories may point into plugin code; drop them before dlclose
    _instances.clear();
    _factories.clear();
    if (_handles.empty()) {
        return Ok();
    }

    auto handles = std::move(_handles);
    _handles.clear();
    if (!_dispatcher) {
        unload_plugins(std::move(handles), std::move(plugin_instances));
        return Ok();
    }
    // Queued adapter tasks still hold plugin code
    _dispatcher->defer_idle([handles = std::move(handles), instances = std::move(plugin_instances)]() mutable {
        unload_plugins(std::move(handles), std::move(instances));
    });
    return Ok();
}

Result<void> AdapterRegistry::_validate_aliases() const {
    for (const auto& [alias, target] : _aliases) {
        if (_adapters.count(alias)) {
            return Err<void>("alias '" + alias + "' shadows a registered scheme");
        }

        // Follow the chain to detect cycles before anything else
        std::set<std::string> seen{alias};
        std::string cur = target;
        while (_aliases.count(cur)) {
            if (!seen.insert(cur).second) {
                return Err<void>("alias cycle through '" + alias + "'");
            }
            cur = _aliases.at(cur);
        }
        if (seen.count(cur)) {
            return Err<void>("alias cycle through '" + alias + "'");
        }

        // Aliases must point straight at a canonical scheme so rewriting happens once
        if (_aliases.count(target)) {
            return Err<void>("alias '" + alias + "' points at another alias '" + target + "'");
        }
        if (!_adapters.count(target)) {
            return Err<void>("alias '" + alias + "' points at unregistered scheme '" + target + "'");
        }
    }
    return Ok();
}

Result<void> AdapterRegistry::register_factory(const std::string& name, AdapterCreateFn create_fn, const std::string& origin) {
    if (!create_fn) {
        return Err<void>("AdapterRegistry::register_factory: empty create function for '" + name + "'");
    }
    if (_factories.count(name)) {
        return Err<void>("AdapterRegistry::register_factory: '" + name + "' already registered by " + _factories[name].origin);
    }
    _factories[name] = AdapterFactory{name, origin, std::move(create_fn)};
    return Ok();
}

bool AdapterRegistry::has_factory(const std::string& name) const {
    return _factories.find(name) != _factories.end();
}

Result<void> AdapterRegistry::_load_plugins() {
    if (_plugins_path.empty()) {
        return Ok();
    }

    spdlog::info("AdapterRegistry: loading plugins from {}", _plugins_path);

    // Parse colon-separated paths
    std::vector<std::string> plugin_dirs;
    std::stringstream ss(_plugins_path);
    std::string path_str;
    while (std::getline(ss, path_str, ':')) {
        if (!path_str.empty()) {
            plugin_dirs.push_back(path_str);
        }
    }

    for (const auto& dir : plugin_dirs) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) {
            spdlog::warn("Plugin directory does not exist: {}", dir);
            continue;
        }

        for (const auto& entry : fs::recursive_directory_iterator(dir, ec)) {
            if (entry.is_regular_file() && entry.path().extension() == ".so") {
                std::string path = entry.path().string();
                if (auto res = _load_plugin(path); !res) {
                    spdlog::warn("Failed to load plugin {}: {}", path, error_msg(res));
                }
            }
        }
    }

    spdlog::info("AdapterRegistry: {} adapter factories available", _factories.size());
    return Ok();
}

Result<void> AdapterRegistry::_load_plugin(const std::string& path) {
    spdlog::debug("Loading plugin: {}", path);

    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        return Err<void>(std::string("dlopen failed: ") + dlerror());
    }

    auto name_fn = reinterpret_cast<PluginNameFn>(dlsym(handle, "name"));
    auto type_fn = reinterpret_cast<PluginTypeFn>(dlsym(handle, "type"));
    auto create_fn = reinterpret_cast<PluginAdapterCreateFn>(dlsym(handle, "create"));
    if (!name_fn || !type_fn || !create_fn) {
        dlclose(handle);
        return Err<void>("Plugin lacks name/type/create exports: " + path);
    }

    std::string plugin_name = name_fn();
    std::string plugin_type = type_fn();
    if (plugin_type != "adapter") {
        dlclose(handle);
        return Err<void>("Unknown plugin type '" + plugin_type + "' for " + plugin_name);
    }

    if (auto res = register_factory(plugin_name, AdapterCreateFn(create_fn), path); !res) {
        dlclose(handle);
        return Err<void>("Plugin " + path + " rejected", res);
    }

    spdlog::info("Loaded adapter plugin: {}", plugin_name);
    _handles.push_back(handle);
    return Ok();
}

AdapterPtr AdapterRegistry::get_adapter(const std::string& scheme) {
    std::string canonical = scheme;
    if (auto alias_it = _aliases.find(scheme); alias_it != _aliases.end()) {
        canonical = alias_it->second;
    }

    auto scheme_it = _adapters.find(canonical);
    if (scheme_it == _adapters.end()) {
        return nullptr;
    }
    const std::string& adapter_name = scheme_it->second;

    if (auto it = _instances.find(adapter_name); it != _instances.end()) {
        return it->second;
    }
    if (_failed.count(adapter_name)) {
        return nullptr;
    }

    auto factory_it = _factories.find(adapter_name);
    if (factory_it == _factories.end()) {
        _failed[adapter_name] = "no factory";
        ywarn("AdapterRegistry: no adapter named '{}' for scheme {}", adapter_name, canonical);
        return nullptr;
    }

    auto res = factory_it->second.create_fn(_dispatcher);
    if (!res) {
        _failed[adapter_name] = res.error().to_string();
        spdlog::error("AdapterRegistry: creating adapter '{}' failed: {}", adapter_name, res.error().to_string());
        return nullptr;
    }
    _instances[adapter_name] = *res;
    return *res;
}

AdapterPtr AdapterRegistry::get_adapter_for_name(const std::string& name) {
    auto url = parse(name);
    if (!url) {
        return nullptr;
    }
    return get_adapter(url->scheme());
}

bool AdapterRegistry::is_known_scheme(const std::string& scheme) const {
    return _adapters.count(scheme) > 0 || _aliases.count(scheme) > 0;
}

std::optional<Url> AdapterRegistry::parse(const std::string& raw) const {
    auto url = parse_url(raw);
    if (!url || !is_known_scheme(url->scheme())) {
        return std::nullopt;
    }
    return url;
}

Url AdapterRegistry::resolve_alias(const Url& url) const {
    auto it = _aliases.find(url.scheme());
    if (it == _aliases.end()) {
        return url;
    }
    return url.with_scheme(it->second);
}

std::optional<std::string> AdapterRegistry::scheme_for_adapter(const std::string& adapter_name) const {
    for (const auto& [scheme, name] : _adapters) {
        if (name == adapter_name) {
            return scheme;
        }
    }
    return std::nullopt;
}

std::optional<std::string> AdapterRegistry::adapter_name(const std::string& scheme) const {
    auto it = _adapters.find(scheme);
    if (it == _adapters.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> AdapterRegistry::schemes() const {
    std::vector<std::string> out;
    for (const auto& [scheme, _] : _adapters) out.push_back(scheme);
    for (const auto& [scheme, _] : _aliases) out.push_back(scheme);
    return out;
}

} // namespace arbor
