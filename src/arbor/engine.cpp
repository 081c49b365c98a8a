#include "engine.hpp"
#include "adapter_registry.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "entry_cache.hpp"
#include "float_window.hpp"
#include "host.hpp"
#include "lifecycle.hpp"
#include "mutator.hpp"
#include "navigation.hpp"
#include "notifications.hpp"
#include "view.hpp"
#include "view_state.hpp"
#include <spdlog/spdlog.h>
#include <ytrace/ytrace.hpp>

namespace arbor {

Result<std::shared_ptr<Engine>> Engine::create(
    std::shared_ptr<Host> host,
    std::shared_ptr<Dispatcher> dispatcher,
    const EngineConfig& config
) {
    if (!host || !dispatcher) {
        return Err<std::shared_ptr<Engine>>("Engine::create: host and dispatcher are required");
    }
    auto engine = std::shared_ptr<Engine>(new Engine());
    engine->_host = std::move(host);
    engine->_dispatcher = std::move(dispatcher);
    if (auto res = engine->_init(config); !res) {
        return Err<std::shared_ptr<Engine>>("Engine::create: init failed", res);
    }
    return engine;
}

Engine::~Engine() {
    dispose();
}

Result<void> Engine::_init(const EngineConfig& config) {
    ydebug("Engine::_init starting");

    auto config_res = Config::create(config.config_paths, config.config_yaml);
    if (!config_res) {
        return Err<void>("Engine::_init: configuration failed", config_res);
    }
    _config = *config_res;

    // Build colon-separated plugin path string
    std::string plugins_path;
    for (const auto& p : config.plugin_paths) {
        if (!plugins_path.empty()) plugins_path += ":";
        plugins_path += p.string();
    }

    ydebug("Creating adapter registry with plugin path: {}", plugins_path);
    auto registry_res = AdapterRegistry::create(_dispatcher, *_config, plugins_path);
    if (!registry_res) {
        return Err<void>("Engine::_init: adapter registry create failed", registry_res);
    }
    _registry = *registry_res;

    _cache = std::make_shared<EntryCache>();
    _view_state = std::make_shared<ViewStateStore>();
    _notifications = std::make_shared<NotificationBuffer>(_host);

    auto view_res = DirectoryView::create(_host, _registry, _cache, _view_state, _config, _notifications);
    if (!view_res) {
        return Err<void>("Engine::_init: view create failed", view_res);
    }
    _view = *view_res;

    auto lifecycle_res = LifecycleController::create(
        _host, _dispatcher, _registry, _config, _view_state, _view, _notifications, config.mutator);
    if (!lifecycle_res) {
        return Err<void>("Engine::_init: lifecycle create failed", lifecycle_res);
    }
    _lifecycle = *lifecycle_res;

    auto floats_res = FloatWindowManager::create(_host, _dispatcher, _config);
    if (!floats_res) {
        return Err<void>("Engine::_init: float manager create failed", floats_res);
    }
    _floats = *floats_res;

    auto nav_res = Navigator::create(_host, _registry, _cache, _view_state, _config, _view,
                                     _lifecycle, _floats, _notifications, config.mutator);
    if (!nav_res) {
        return Err<void>("Engine::_init: navigator create failed", nav_res);
    }
    _navigator = *nav_res;

    ydebug("Engine::_init done");
    return Ok();
}

Result<void> Engine::setup() {
    if (auto res = _lifecycle->setup(); !res) {
        return Err<void>("Engine::setup: lifecycle setup failed", res);
    }
    if (auto res = _register_actions(); !res) {
        return Err<void>("Engine::setup: action registration failed", res);
    }

    // The editor may have been started on a directory
    WindowId window = _host->current_window();
    BufferId buffer = _host->window_buffer(window);
    if (_lifecycle->maybe_hijack_directory_buffer(buffer)) {
        // Renaming does not re-read; load the directory ourselves
        BufferId current = _host->window_buffer(window);
        if (auto res = _lifecycle->load_buffer(current); !res) {
            spdlog::warn("Engine::setup: {}", res.error().to_string());
        }
    }
    return Ok();
}

static std::optional<SplitModifier> split_from_string(const std::string& s) {
    if (s == "aboveleft") return SplitModifier::AboveLeft;
    if (s == "belowright") return SplitModifier::BelowRight;
    if (s == "topleft") return SplitModifier::TopLeft;
    if (s == "botright") return SplitModifier::BotRight;
    return std::nullopt;
}

Result<void> Engine::_register_actions() {
    // Actions may outlive the engine inside the dispatcher
    std::weak_ptr<Navigator> nav = _navigator;
    std::weak_ptr<LifecycleController> lifecycle = _lifecycle;

    auto res = _dispatcher->register_action_handler("Arbor", [nav](const Dict& action) -> Result<void> {
        auto navigator = nav.lock();
        if (!navigator) return Err<void>("Arbor: engine is gone");
        bool floating = false;
        std::string dir;
        for (const auto& arg : get_as<List>(action, "args").value_or(List{})) {
            auto s = get_as<std::string>(arg);
            if (!s) continue;
            if (*s == "--float") {
                floating = true;
            } else if (dir.empty()) {
                dir = *s;
            } else {
                return Err<void>("Arbor: too many arguments");
            }
        }
        if (floating) {
            auto win = navigator->open_float(dir);
            if (!win) return Err<void>("Arbor --float failed", win);
            return Ok();
        }
        return navigator->open(dir);
    });
    if (!res) return res;

    res = _dispatcher->register_action_handler("save", [nav](const Dict& action) -> Result<void> {
        auto navigator = nav.lock();
        if (!navigator) return Err<void>("save: engine is gone");
        navigator->save(get_as<bool>(action, "confirm"), [](Result<void> r) {
            if (!r) spdlog::error("save failed: {}", r.error().to_string());
        });
        return Ok();
    });
    if (!res) return res;

    res = _dispatcher->register_action_handler("discard", [lifecycle](const Dict&) -> Result<void> {
        auto controller = lifecycle.lock();
        if (!controller) return Err<void>("discard: engine is gone");
        controller->discard_all_changes();
        return Ok();
    });
    if (!res) return res;

    res = _dispatcher->register_action_handler("close", [nav](const Dict&) -> Result<void> {
        auto navigator = nav.lock();
        if (!navigator) return Err<void>("close: engine is gone");
        return navigator->close();
    });
    if (!res) return res;

    // set_columns {columns: [names]}: re-renders every directory buffer
    std::weak_ptr<View> view = _view;
    res = _dispatcher->register_action_handler("set_columns", [view](const Dict& action) -> Result<void> {
        auto directory_view = view.lock();
        if (!directory_view) return Err<void>("set_columns: engine is gone");
        auto list = get_as<List>(action, "columns");
        if (!list) return Err<void>("set_columns: 'columns' must be a list");
        std::vector<std::string> names;
        for (const auto& item : *list) {
            auto name = get_as<std::string>(item);
            if (!name) return Err<void>("set_columns: column names must be strings");
            names.push_back(*name);
        }
        directory_view->set_columns(std::move(names));
        return Ok();
    });
    if (!res) return res;

    return _dispatcher->register_action_handler("select", [nav](const Dict& action) -> Result<void> {
        auto navigator = nav.lock();
        if (!navigator) return Err<void>("select: engine is gone");
        SelectOptions opts;
        opts.vertical = get_as<bool>(action, "vertical");
        opts.horizontal = get_as<bool>(action, "horizontal").value_or(false);
        opts.preview = get_as<bool>(action, "preview").value_or(false);
        if (auto split = get_as<std::string>(action, "split")) {
            opts.split = split_from_string(*split);
            if (!opts.split) return Err<void>("select: unknown split modifier '" + *split + "'");
        }
        return navigator->select(opts);
    });
}

Result<void> Engine::run_command(const std::vector<std::string>& args) {
    List list;
    for (const auto& arg : args) list.push_back(arg);
    return _dispatcher->dispatch_action({{"name", std::string("Arbor")}, {"args", list}});
}

Result<void> Engine::dispose() {
    if (_disposed) {
        return Ok();
    }
    _disposed = true;
    if (_lifecycle) {
        if (auto res = _lifecycle->dispose(); !res) {
            spdlog::warn("Engine::dispose: {}", res.error().to_string());
        }
    }
    if (_registry) {
        if (auto res = _registry->dispose(); !res) {
            spdlog::warn("Engine::dispose: {}", res.error().to_string());
        }
    }
    return Ok();
}

} // namespace arbor
