#include "navigation.hpp"
#include "adapter_registry.hpp"
#include "config.hpp"
#include "entry_cache.hpp"
#include "float_window.hpp"
#include "host.hpp"
#include "lifecycle.hpp"
#include "mutator.hpp"
#include "notifications.hpp"
#include "view.hpp"
#include "view_state.hpp"
#include <spdlog/spdlog.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>

namespace arbor {

Result<std::shared_ptr<Navigator>> Navigator::create(
    std::shared_ptr<Host> host,
    std::shared_ptr<AdapterRegistry> registry,
    std::shared_ptr<EntryCache> cache,
    std::shared_ptr<ViewStateStore> view_state,
    std::shared_ptr<Config> config,
    std::shared_ptr<DirectoryView> view,
    std::shared_ptr<LifecycleController> lifecycle,
    std::shared_ptr<FloatWindowManager> floats,
    std::shared_ptr<NotificationBuffer> notifications,
    std::shared_ptr<Mutator> mutator
) {
    if (!host || !registry || !cache || !view_state || !config || !view || !lifecycle || !floats || !notifications) {
        return Err<std::shared_ptr<Navigator>>("Navigator::create: missing collaborator");
    }
    auto navigator = std::shared_ptr<Navigator>(new Navigator());
    navigator->_host = std::move(host);
    navigator->_registry = std::move(registry);
    navigator->_cache = std::move(cache);
    navigator->_view_state = std::move(view_state);
    navigator->_config = std::move(config);
    navigator->_view = std::move(view);
    navigator->_lifecycle = std::move(lifecycle);
    navigator->_floats = std::move(floats);
    navigator->_notifications = std::move(notifications);
    navigator->_mutator = std::move(mutator);
    return navigator;
}

Result<void> Navigator::_refuse(const std::string& message) {
    _notifications->error(message);
    return Err<void>(message);
}

std::optional<Entry> Navigator::get_entry_on_line(BufferId buffer, int line) const {
    return _view->entry_on_line(buffer, line);
}

std::optional<Entry> Navigator::get_cursor_entry() const {
    WindowId window = _host->current_window();
    return get_entry_on_line(_host->window_buffer(window), _host->cursor(window).line);
}

Result<void> Navigator::select(SelectOptions opts) {
    if (opts.horizontal || opts.vertical.has_value() || opts.preview) {
        if (!opts.split) opts.split = SplitModifier::BelowRight;
    }
    if (opts.preview && !opts.horizontal && !opts.vertical.has_value()) {
        opts.vertical = true;
    }
    if (opts.preview && _host->is_floating(_host->current_window())) {
        return _refuse("Preview does not work in a floating window");
    }

    BufferId buffer = _host->window_buffer(_host->current_window());
    std::string bufname = _host->buffer_name(buffer);
    auto dir = _registry->parse(bufname);
    if (!dir || !_registry->get_adapter(*dir)) {
        return _refuse("Not a directory buffer: " + bufname);
    }

    std::vector<Entry> entries;
    if (auto range = _host->visual_range()) {
        auto [first, last] = std::minmax(range->first, range->second);
        for (int line = first; line <= last; ++line) {
            if (auto entry = get_entry_on_line(buffer, line)) {
                entries.push_back(std::move(*entry));
            }
        }
    } else if (auto entry = get_cursor_entry()) {
        entries.push_back(std::move(*entry));
    }
    if (entries.empty()) {
        return _refuse("Could not find entry under cursor");
    }
    if (entries.size() > 1 && opts.preview) {
        _notifications->warn("Cannot preview multiple entries");
        entries.resize(1);
    }

    // A new directory sharing a name with a cached one would show the old
    // contents (MOVE /foo -> /bar + CREATE /foo); refuse before opening anything
    auto cached = _cache->list_url(*dir);
    for (const auto& entry : entries) {
        if (entry.is_directory_like() && !entry.id && cached.count(entry.name)) {
            return _refuse("Please save changes before entering new directory");
        }
    }

    for (WindowId window : _host->tab_windows()) {
        if (_host->window_valid(window) && _host->is_preview(window)) {
            if (auto res = _host->close_window(window); !res) {
                ywarn("Navigator: closing preview window {} failed: {}", window, error_msg(res));
            }
        }
    }

    WindowId prev_win = _host->current_window();
    for (const auto& entry : entries) {
        bool is_dir = entry.is_directory_like();
        std::string url = dir->join(is_dir ? addslash(entry.name) : entry.name).to_string();

        if (!is_dir && _host->is_floating(_host->current_window())) {
            if (auto res = _host->close_window(_host->current_window()); !res) {
                return Err<void>("Navigator::select: cannot close float", res);
            }
        }

        WindowId target = _host->current_window();
        if (opts.split) {
            auto split = _host->split_window(target, opts.vertical.value_or(false), *opts.split);
            if (!split) {
                _notifications->error_from_result("Could not split window", split);
                return Err<void>("Navigator::select: split failed", split);
            }
            target = *split;
        }
        auto edited = _host->edit(target, url, false);
        if (!edited) {
            _notifications->error_from_result("Could not open " + url, edited);
            return Err<void>("Navigator::select: edit failed", edited);
        }
        ydebug("Navigator: opened {} in window {}", url, target);

        if (opts.preview) {
            _host->set_preview(target, true);
            _view_state->ensure(target).preview_entry_id = entry.id;
            _host->set_current_window(prev_win);
        }

        // Every entry after the first gets its own split
        if (!opts.split) opts.split = SplitModifier::BelowRight;
        if (!opts.horizontal && !opts.vertical.has_value()) opts.vertical = true;
    }
    return Ok();
}

std::optional<ParentUrl> Navigator::_target(const std::string& dir) {
    auto target = get_url_for_path(dir);
    if (!target) {
        return std::nullopt;
    }
    if (target->basename) {
        if (auto url = parse_url(target->url)) {
            _view_state->set_last_cursor(*url, *target->basename);
        }
    }
    return target;
}

Result<void> Navigator::open(const std::string& dir) {
    auto target = _target(dir);
    if (!target) {
        return _refuse("Could not determine a directory to open");
    }
    auto res = _host->edit(_host->current_window(), target->url, true);
    if (!res) {
        _notifications->error_from_result("Could not open " + target->url, res);
        return Err<void>("Navigator::open failed", res);
    }
    return Ok();
}

Result<WindowId> Navigator::open_float(const std::string& dir) {
    auto target = _target(dir);
    if (!target) {
        _notifications->error("Could not determine a directory to open");
        return Err<WindowId>("Navigator::open_float: no directory");
    }
    auto res = _floats->open(target->url);
    if (!res) {
        _notifications->error_from_result("Could not open float", res);
        return Err<WindowId>("Navigator::open_float failed", res);
    }
    return res;
}

Result<void> Navigator::close() {
    WindowId window = _host->current_window();
    if (_host->is_floating(window)) {
        return _host->close_window(window);
    }
    const auto* record = _view_state->find(window);
    if (record && _host->buffer_valid(record->original_buffer)) {
        _host->set_window_buffer(window, record->original_buffer);
        return Ok();
    }
    _host->delete_buffer(_host->window_buffer(window));
    return Ok();
}

std::optional<std::string> Navigator::get_current_dir() const {
    auto url = parse_url(_host->buffer_name(_host->window_buffer(_host->current_window())));
    if (!url || _registry->adapter_name(url->scheme()) != "files") {
        return std::nullopt;
    }
    return to_host_path(url->path());
}

std::optional<ParentUrl> Navigator::get_url_for_path(const std::string& dir) const {
    if (dir.empty()) {
        return get_buffer_parent_url(_host->buffer_name(_host->window_buffer(_host->current_window())));
    }
    // Already an address
    if (_registry->parse(dir)) {
        return ParentUrl{dir, std::nullopt};
    }
    auto scheme = _registry->scheme_for_adapter("files");
    if (!scheme) {
        return std::nullopt;
    }
    std::string abspath = _host->absolute_path(dir);
    std::string path = from_host_path(abspath);
    if (_host->is_directory(abspath)) {
        path = addslash(path);
    }
    return ParentUrl{*scheme + path, std::nullopt};
}

std::optional<ParentUrl> Navigator::get_buffer_parent_url(const std::string& bufname) const {
    auto url = parse_url(bufname);
    if (!url) {
        auto scheme = _registry->scheme_for_adapter("files");
        if (!scheme) {
            return std::nullopt;
        }
        if (bufname.empty()) {
            return ParentUrl{addslash(*scheme + from_host_path(_host->cwd())), std::nullopt};
        }
        std::string path = from_host_path(_host->absolute_path(bufname));
        return ParentUrl{addslash(*scheme + parent(path)), basename(path)};
    }

    if (url->scheme() == "term://") {
        // term://<cwd>//<pid>:<cmd>
        auto scheme = _registry->scheme_for_adapter("files");
        if (!scheme) {
            return std::nullopt;
        }
        const std::string& path = url->path();
        auto pos = path.rfind("//");
        std::string cwd = pos == std::string::npos ? from_host_path(_host->cwd()) : path.substr(0, pos);
        return ParentUrl{*scheme + addslash(cwd), std::nullopt};
    }

    std::string parent_url;
    auto adapter = _registry->get_adapter(url->scheme());
    if (adapter && adapter->supports(Capability::GetParent)) {
        auto canonical = _registry->scheme_for_adapter(adapter->name()).value_or(url->scheme());
        auto res = adapter->get_parent(Url(canonical, url->path()));
        if (res) {
            parent_url = res->to_string();
        } else {
            spdlog::warn("Navigator: {}", res.error().to_string());
        }
    }
    if (parent_url.empty()) {
        parent_url = url->scheme() + addslash(parent(url->path()));
    }
    if (parent_url == bufname) {
        return ParentUrl{parent_url, std::nullopt};
    }
    return ParentUrl{addslash(parent_url), basename(url->path())};
}

void Navigator::save(std::optional<bool> confirm, DoneCallback cb) {
    if (!_mutator) {
        _notifications->error("Cannot save: no mutator is configured");
        cb(Err<void>("Navigator::save: no mutator"));
        return;
    }
    _mutator->try_write_changes(confirm, std::move(cb));
}

void Navigator::discard_all_changes() {
    _lifecycle->discard_all_changes();
}

} // namespace arbor
