#pragma once

#include "adapter.hpp"
#include "result.hpp"
#include "types.hpp"
#include "url.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace arbor {

class Config;
class Dispatcher;

// Factory metadata
struct AdapterFactory {
    std::string registered_name;
    std::string origin;     // "builtin" or the plugin path
    AdapterCreateFn create_fn;
};

// AdapterRegistry - scheme -> adapter lookup table with alias resolution.
// Configured once at startup; adapters are created lazily on first lookup
// and shared for the rest of the session.
class AdapterRegistry : public std::enable_shared_from_this<AdapterRegistry> {
public:
    static Result<std::shared_ptr<AdapterRegistry>> create(
        std::shared_ptr<Dispatcher> dispatcher,
        const std::map<std::string, std::string>& adapters,
        const std::map<std::string, std::string>& aliases,
        const std::string& plugins_path = ""
    );
    static Result<std::shared_ptr<AdapterRegistry>> create(
        std::shared_ptr<Dispatcher> dispatcher,
        const Config& config,
        const std::string& plugins_path = ""
    );

    ~AdapterRegistry();

    // Factories; built-ins are registered by init()
    Result<void> register_factory(const std::string& name, AdapterCreateFn create_fn, const std::string& origin = "builtin");
    bool has_factory(const std::string& name) const;

    // Lookup. Alias schemes resolve to the canonical scheme's adapter.
    // nullptr when the scheme is unknown or its adapter cannot be created.
    AdapterPtr get_adapter(const std::string& scheme);
    AdapterPtr get_adapter(const Url& url) { return get_adapter(url.scheme()); }
    // Adapter for a raw buffer name
    AdapterPtr get_adapter_for_name(const std::string& name);

    // True for canonical schemes and aliases
    bool is_known_scheme(const std::string& scheme) const;
    bool is_adapter_scheme(const std::string& scheme) const { return _adapters.count(scheme) > 0; }
    bool is_alias(const std::string& scheme) const { return _aliases.count(scheme) > 0; }
    // Like parse_url, but only for registered schemes
    std::optional<Url> parse(const std::string& raw) const;
    // Rewrite an alias scheme to its canonical scheme (single step)
    Url resolve_alias(const Url& url) const;

    // First scheme bound to the adapter name
    std::optional<std::string> scheme_for_adapter(const std::string& adapter_name) const;
    // Adapter name a canonical scheme is bound to
    std::optional<std::string> adapter_name(const std::string& scheme) const;
    std::vector<std::string> schemes() const;

    // Lifecycle
    Result<void> init();
    Result<void> dispose();

private:
    AdapterRegistry() = default;

    Result<void> _validate_aliases() const;
    Result<void> _load_plugins();
    Result<void> _load_plugin(const std::string& path);

    std::shared_ptr<Dispatcher> _dispatcher;
    std::map<std::string, std::string> _adapters;  // scheme -> adapter name
    std::map<std::string, std::string> _aliases;   // alias scheme -> canonical scheme
    std::string _plugins_path;

    std::map<std::string, AdapterFactory> _factories;
    std::map<std::string, AdapterPtr> _instances;  // adapter name -> instance
    std::map<std::string, std::string> _failed;    // adapter name -> error, reported once

    // Loaded .so handles
    std::vector<void*> _handles;
};

using AdapterRegistryPtr = std::shared_ptr<AdapterRegistry>;

} // namespace arbor
