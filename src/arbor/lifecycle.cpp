#include "lifecycle.hpp"
#include "adapter.hpp"
#include "adapter_registry.hpp"
#include "config.hpp"
#include "host.hpp"
#include "mutator.hpp"
#include "notifications.hpp"
#include "view.hpp"
#include "view_state.hpp"
#include <spdlog/spdlog.h>
#include <ytrace/ytrace.hpp>

namespace arbor {

const char* to_string(BufferState state) {
    switch (state) {
        case BufferState::Unbound: return "unbound";
        case BufferState::Resolving: return "resolving";
        case BufferState::LoadedDirectory: return "loaded-directory";
        case BufferState::LoadedFile: return "loaded-file";
        case BufferState::Modified: return "modified";
        case BufferState::Closed: return "closed";
    }
    return "unbound";
}

Result<std::shared_ptr<LifecycleController>> LifecycleController::create(
    std::shared_ptr<Host> host,
    std::shared_ptr<Dispatcher> dispatcher,
    std::shared_ptr<AdapterRegistry> registry,
    std::shared_ptr<Config> config,
    std::shared_ptr<ViewStateStore> view_state,
    std::shared_ptr<View> view,
    std::shared_ptr<NotificationBuffer> notifications,
    std::shared_ptr<Mutator> mutator
) {
    if (!host || !dispatcher || !registry || !config || !view_state || !view || !notifications) {
        return Err<std::shared_ptr<LifecycleController>>("LifecycleController::create: missing collaborator");
    }
    auto controller = std::shared_ptr<LifecycleController>(new LifecycleController());
    controller->_host = std::move(host);
    controller->_dispatcher = std::move(dispatcher);
    controller->_registry = std::move(registry);
    controller->_config = std::move(config);
    controller->_view_state = std::move(view_state);
    controller->_view = std::move(view);
    controller->_notifications = std::move(notifications);
    controller->_mutator = std::move(mutator);
    return controller;
}

LifecycleController::~LifecycleController() {
    dispose();
}

static BufferId event_buffer(const Dict& event) {
    return get_as<BufferId>(event, "buffer").value_or(NO_BUFFER);
}

static WindowId event_window(const Dict& event) {
    return get_as<WindowId>(event, "window").value_or(NO_WINDOW);
}

Result<void> LifecycleController::_register(const std::string& key, EventHandler handler) {
    auto res = _dispatcher->register_event_handler(key, std::move(handler));
    if (!res) {
        return Err<void>("LifecycleController: cannot register " + key, res);
    }
    _handlers.push_back(*res);
    return Ok();
}

Result<void> LifecycleController::setup() {
    std::weak_ptr<LifecycleController> weak = shared_from_this();

    auto with_self = [weak](auto fn) {
        return [weak, fn](const Dict& event) -> Result<void> {
            if (auto self = weak.lock()) {
                return fn(*self, event);
            }
            return Ok();
        };
    };

    std::vector<std::pair<std::string, EventHandler>> handlers = {
        {events::BUFFER_ADD, with_self([](LifecycleController& self, const Dict& e) -> Result<void> {
            self.maybe_hijack_directory_buffer(event_buffer(e));
            return Ok();
        })},
        {events::BUFFER_READ_CMD, with_self([](LifecycleController& self, const Dict& e) -> Result<void> {
            BufferId buffer = event_buffer(e);
            if (!self._registry->parse(self._host->buffer_name(buffer))) {
                return Ok();
            }
            return self.load_buffer(buffer);
        })},
        {events::BUFFER_WRITE_CMD, with_self([](LifecycleController& self, const Dict& e) -> Result<void> {
            BufferId buffer = event_buffer(e);
            if (!self._registry->parse(self._host->buffer_name(buffer))) {
                return Ok();
            }
            return self.write_buffer(buffer);
        })},
        {events::BUFFER_WIN_LEAVE, with_self([](LifecycleController& self, const Dict& e) -> Result<void> {
            self.on_win_leave(event_buffer(e), event_window(e));
            return Ok();
        })},
        {events::BUFFER_WIN_ENTER, with_self([](LifecycleController& self, const Dict& e) -> Result<void> {
            self.on_win_enter(event_buffer(e), event_window(e));
            return Ok();
        })},
        {events::WINDOW_NEW, with_self([](LifecycleController& self, const Dict& e) -> Result<void> {
            self.on_window_new(event_window(e));
            return Ok();
        })},
        {events::WINDOW_CLOSED, with_self([](LifecycleController& self, const Dict& e) -> Result<void> {
            self.on_window_closed(event_window(e));
            return Ok();
        })},
        {events::BUFFER_WIPEOUT, with_self([](LifecycleController& self, const Dict& e) -> Result<void> {
            self.on_wipeout(event_buffer(e));
            return Ok();
        })},
        {events::SESSION_LOAD_POST, with_self([](LifecycleController& self, const Dict&) -> Result<void> {
            self.on_session_load();
            return Ok();
        })},
    };
    for (auto& [key, handler] : handlers) {
        if (auto res = _register(key, std::move(handler)); !res) {
            return res;
        }
    }

    if (!_config->silence_scp_warning()) {
        auto res = _dispatcher->register_event_handler(events::BUFFER_NEW, with_self(
            [](LifecycleController& self, const Dict& e) -> Result<void> {
                auto name = get_as<std::string>(e, "file").value_or("");
                if (name.rfind("scp://", 0) != 0 || self._scp_handler == 0) {
                    return Ok();
                }
                std::string schemes;
                for (const auto& s : self._registry->schemes()) {
                    if (!schemes.empty()) schemes += ", ";
                    schemes += s;
                }
                self._notifications->warn(
                    "If you are trying to browse with arbor, use one of its schemes (" + schemes +
                    ") instead of scp://. Set silence-scp-warning: true to disable this message.");
                // Once per session
                HandlerId id = self._scp_handler;
                self._scp_handler = 0;
                return self._dispatcher->unregister_event_handler(id);
            }));
        if (!res) {
            return Err<void>("LifecycleController: cannot register scp warning", res);
        }
        _scp_handler = *res;
    }

    if (!_config->silence_netrw_warning()) {
        auto res = _dispatcher->register_event_handler(events::BUFFER_FILETYPE, with_self(
            [](LifecycleController& self, const Dict& e) -> Result<void> {
                if (get_as<std::string>(e, "filetype").value_or("") != "netrw" || self._netrw_handler == 0) {
                    return Ok();
                }
                self._notifications->warn(
                    "If you expected an arbor buffer here, you may want to disable netrw. "
                    "Set silence-netrw-warning: true to disable this message.");
                HandlerId id = self._netrw_handler;
                self._netrw_handler = 0;
                return self._dispatcher->unregister_event_handler(id);
            }));
        if (!res) {
            return Err<void>("LifecycleController: cannot register netrw warning", res);
        }
        _netrw_handler = *res;
    }

    ydebug("LifecycleController: {} event handlers registered", _handlers.size());
    return Ok();
}

Result<void> LifecycleController::dispose() {
    if (!_dispatcher) {
        return Ok();
    }
    for (HandlerId id : _handlers) {
        if (_dispatcher->has_event_handler(id)) {
            if (auto res = _dispatcher->unregister_event_handler(id); !res) {
                spdlog::warn("LifecycleController: {}", res.error().to_string());
            }
        }
    }
    _handlers.clear();
    if (_scp_handler && _dispatcher->has_event_handler(_scp_handler)) {
        if (auto res = _dispatcher->unregister_event_handler(_scp_handler); !res) {
            spdlog::warn("LifecycleController: {}", res.error().to_string());
        }
    }
    _scp_handler = 0;
    if (_netrw_handler && _dispatcher->has_event_handler(_netrw_handler)) {
        if (auto res = _dispatcher->unregister_event_handler(_netrw_handler); !res) {
            spdlog::warn("LifecycleController: {}", res.error().to_string());
        }
    }
    _netrw_handler = 0;
    return Ok();
}

// ---------------------------------------------------------------------------
// State
// ---------------------------------------------------------------------------

BufferState LifecycleController::state(BufferId buffer) const {
    auto it = _slots.find(buffer);
    if (it == _slots.end()) {
        return _host->buffer_valid(buffer) ? BufferState::Unbound : BufferState::Closed;
    }
    BufferState s = it->second.state;
    if ((s == BufferState::LoadedDirectory || s == BufferState::LoadedFile) && _host->modified(buffer)) {
        return BufferState::Modified;
    }
    return s;
}

std::uint64_t LifecycleController::generation(BufferId buffer) const {
    auto it = _slots.find(buffer);
    return it == _slots.end() ? 0 : it->second.generation;
}

bool LifecycleController::is_engine_buffer(BufferId buffer) const {
    if (!_host->buffer_valid(buffer)) {
        return false;
    }
    if (_host->filetype(buffer) == FILETYPE) {
        return true;
    }
    auto url = parse_url(_host->buffer_name(buffer));
    return url && _registry->is_known_scheme(url->scheme());
}

bool LifecycleController::_is_current(BufferId buffer, std::uint64_t generation) const {
    if (!_host->buffer_valid(buffer)) {
        return false;
    }
    auto it = _slots.find(buffer);
    if (it == _slots.end() || it->second.state == BufferState::Closed || it->second.generation != generation) {
        return false;
    }
    return _registry->parse(_host->buffer_name(buffer)).has_value();
}

void LifecycleController::_close_slot(BufferId buffer) {
    auto& slot = _slots[buffer];
    slot.state = BufferState::Closed;
    slot.generation = ++_next_generation;
}

WindowId LifecycleController::_window_for(BufferId buffer) const {
    WindowId current = _host->current_window();
    if (_host->window_buffer(current) == buffer) {
        return current;
    }
    for (WindowId window : _host->tab_windows()) {
        if (_host->window_buffer(window) == buffer) return window;
    }
    return NO_WINDOW;
}

void LifecycleController::_fire(const std::string& key, BufferId buffer) {
    Dict payload{{"buffer", buffer}, {"file", _host->buffer_name(buffer)}};
    if (auto res = _dispatcher->dispatch_event(make_event(key, std::move(payload))); !res) {
        spdlog::warn("LifecycleController: {} failed: {}", key, res.error().to_string());
    }
}

// ---------------------------------------------------------------------------
// Transitions
// ---------------------------------------------------------------------------

Result<bool> LifecycleController::rename_buffer(BufferId buffer, const std::string& name) {
    BufferId existing = _host->find_buffer(name);
    if (existing == NO_BUFFER || existing == buffer) {
        if (auto res = _host->set_buffer_name(buffer, name); !res) {
            return Err<bool>("LifecycleController::rename_buffer failed", res);
        }
        return Ok(false);
    }

    // Someone already has this name: show that buffer instead and drop this one
    ydebug("LifecycleController: {} replaced by existing buffer {}", buffer, existing);
    for (WindowId window : _host->all_windows()) {
        if (_host->window_buffer(window) == buffer) {
            _host->set_window_buffer(window, existing);
        }
    }
    _close_slot(buffer);
    _host->delete_buffer(buffer);
    return Ok(true);
}

bool LifecycleController::maybe_hijack_directory_buffer(BufferId buffer) {
    if (!_config->default_file_explorer()) {
        return false;
    }
    std::string name = _host->buffer_name(buffer);
    if (name.empty() || parse_url(name) || !_host->is_directory(name)) {
        return false;
    }
    auto scheme = _registry->scheme_for_adapter("files");
    if (!scheme) {
        return false;
    }
    std::string url = addslash(*scheme + from_host_path(_host->absolute_path(name)));
    if (auto res = rename_buffer(buffer, url); !res) {
        _notifications->error_from_result("Could not open directory " + name, res);
        return false;
    }
    return true;
}

Result<void> LifecycleController::load_buffer(BufferId buffer) {
    std::string name = _host->buffer_name(buffer);
    auto url = _registry->parse(name);
    if (!url) {
        return Err<void>("LifecycleController::load_buffer: not an engine url: " + name);
    }

    // Aliases are rewritten once, before anything else
    if (_registry->is_alias(url->scheme())) {
        url = _registry->resolve_alias(*url);
        name = url->to_string();
        auto renamed = rename_buffer(buffer, name);
        if (!renamed) {
            _notifications->error_from_result("Could not open " + name, renamed);
            return Err<void>("LifecycleController::load_buffer: alias rename failed", renamed);
        }
        if (*renamed) {
            return Ok();
        }
    }

    auto adapter = _registry->get_adapter(*url);
    if (!adapter) {
        _notifications->error("No adapter for " + url->scheme());
        return Err<void>("LifecycleController::load_buffer: no adapter for " + name);
    }

    // Known directories get their filetype before the slow part
    if (url->is_directory()) {
        _host->set_filetype(buffer, FILETYPE);
    }

    auto& slot = _slots[buffer];
    slot.state = BufferState::Resolving;
    slot.generation = ++_next_generation;
    std::uint64_t gen = slot.generation;

    std::weak_ptr<LifecycleController> weak = shared_from_this();
    adapter->normalize_url(*url, [weak, buffer, gen, adapter, name](Result<Url> res) {
        auto self = weak.lock();
        if (!self || !self->_is_current(buffer, gen)) {
            ydebug("LifecycleController: dropping stale normalize for {}", name);
            return;
        }
        if (!res) {
            self->_slots[buffer].state = BufferState::Unbound;
            self->_notifications->error_from_result("Could not resolve " + name, res);
            return;
        }
        self->_finish_load(buffer, gen, adapter, *res, name);
    });
    return Ok();
}

void LifecycleController::_finish_load(BufferId buffer, std::uint64_t gen, std::shared_ptr<Adapter> adapter,
                                       const Url& url, const std::string& requested) {
    std::string name = url.to_string();
    if (name != requested) {
        auto renamed = rename_buffer(buffer, name);
        if (!renamed) {
            _slots[buffer].state = BufferState::Unbound;
            _notifications->error_from_result("Could not open " + name, renamed);
            return;
        }
        // The buffer that already had this name carries on; this one is gone
        if (*renamed) {
            if (WindowId window = _window_for(_host->find_buffer(name)); window != NO_WINDOW) {
                restore_alt_buf(window);
            }
            return;
        }
    }

    if (url.is_directory()) {
        _fire(events::BUFFER_READ_PRE, buffer);
        if (!_is_current(buffer, gen)) {
            return;
        }
        _slots[buffer].state = BufferState::LoadedDirectory;
        _view->initialize(buffer);
        _fire(events::BUFFER_READ_POST, buffer);
    } else {
        _host->set_buftype(buffer, "acwrite");
        _slots[buffer].state = BufferState::LoadedFile;
        std::weak_ptr<LifecycleController> weak = shared_from_this();
        adapter->read_file(url, [weak, buffer, gen, name](Result<std::vector<std::string>> res) {
            auto self = weak.lock();
            if (!self || !self->_is_current(buffer, gen)) {
                ydebug("LifecycleController: dropping stale read for {}", name);
                return;
            }
            if (!res) {
                self->_notifications->error_from_result("Could not read " + name, res);
                return;
            }
            self->_host->set_lines(buffer, std::move(*res));
            self->_host->set_modified(buffer, false);
        });
    }

    if (WindowId window = _window_for(buffer); window != NO_WINDOW) {
        restore_alt_buf(window);
    }
}

Result<void> LifecycleController::write_buffer(BufferId buffer) {
    std::string name = _host->buffer_name(buffer);
    auto url = _registry->parse(name);
    if (!url) {
        return Err<void>("LifecycleController::write_buffer: not an engine url: " + name);
    }
    std::weak_ptr<LifecycleController> weak = shared_from_this();
    std::uint64_t gen = generation(buffer);

    if (url->is_directory()) {
        _fire(events::BUFFER_WRITE_PRE, buffer);
        if (!_mutator) {
            _notifications->error("Cannot save " + name + ": no mutator is configured");
            return Err<void>("LifecycleController::write_buffer: no mutator");
        }
        // Unmodified only once the mutator reports success
        _mutator->try_write_changes(std::nullopt, [weak, buffer, gen, name](Result<void> res) {
            auto self = weak.lock();
            if (!self) {
                return;
            }
            if (!res) {
                self->_notifications->error_from_result("Error saving " + name, res);
                return;
            }
            if (!self->_is_current(buffer, gen)) {
                return;
            }
            self->_host->set_modified(buffer, false);
            self->_fire(events::BUFFER_WRITE_POST, buffer);
        });
        return Ok();
    }

    auto adapter = _registry->get_adapter(*url);
    if (!adapter) {
        _notifications->error("No adapter for " + url->scheme());
        return Err<void>("LifecycleController::write_buffer: no adapter for " + name);
    }
    adapter->write_file(*url, _host->get_lines(buffer), [weak, buffer, gen, name](Result<void> res) {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        if (!res) {
            self->_notifications->error_from_result("Error writing " + name, res);
            return;
        }
        if (self->_is_current(buffer, gen)) {
            self->_host->set_modified(buffer, false);
        }
    });
    return Ok();
}

void LifecycleController::discard_all_changes() {
    for (BufferId buffer : _view->get_all_buffers()) {
        if (!_host->modified(buffer)) {
            continue;
        }
        std::string name = _host->buffer_name(buffer);
        auto notifications = _notifications;
        _view->render_buffer_async(buffer, [notifications, name](Result<void> res) {
            if (!res) {
                notifications->error_from_result("Error rendering " + name, res);
            }
        });
    }
}

// ---------------------------------------------------------------------------
// Window bookkeeping
// ---------------------------------------------------------------------------

void LifecycleController::on_win_leave(BufferId buffer, WindowId window) {
    if (window == NO_WINDOW || is_engine_buffer(buffer)) {
        return;
    }
    auto& record = _view_state->ensure(window);
    record.original_buffer = buffer;
    record.original_alternate = _host->alternate_buffer(window);
}

void LifecycleController::on_win_enter(BufferId buffer, WindowId window) {
    if (window == NO_WINDOW) {
        return;
    }
    std::string name = _host->buffer_name(buffer);
    auto url = parse_url(name);
    if (url && _registry->is_adapter_scheme(url->scheme())) {
        _view->maybe_set_cursor(window);
    } else if (!_host->is_directory(name)) {
        // Engine buffers run this once they know whether they are a directory
        restore_alt_buf(window);
    }
}

void LifecycleController::restore_alt_buf(WindowId window) {
    BufferId buffer = _host->window_buffer(window);
    if (_host->filetype(buffer) == FILETYPE) {
        _view->set_win_options(window);
        _view_state->ensure(window).did_enter = true;
        return;
    }

    auto* record = _view_state->find(window);
    if (!record || !record->did_enter) {
        return;
    }
    // Leaving the engine for a regular buffer
    record->did_enter = false;
    BufferId original = record->original_buffer;
    if (_host->buffer_valid(original)) {
        if (buffer != original) {
            _host->set_alternate_buffer(window, original);
        } else if (_host->buffer_valid(record->original_alternate)) {
            _host->set_alternate_buffer(window, record->original_alternate);
        }
    }
    if (_config->restore_win_options()) {
        _view->restore_win_options(window);
    }
}

void LifecycleController::on_window_new(WindowId window) {
    BufferId buffer = _host->window_buffer(window);
    if (!is_engine_buffer(buffer)) {
        return;
    }
    if (const auto* own = _view_state->find(window); own && own->did_enter) {
        return;
    }

    // Split off an engine window: find the parent, this tab first
    std::vector<WindowId> candidates = _host->tab_windows();
    for (WindowId w : _host->all_windows()) candidates.push_back(w);
    std::optional<ViewRecord> parent;
    WindowId parent_window = NO_WINDOW;
    for (WindowId w : candidates) {
        if (w == window || !_host->window_valid(w)) continue;
        if (const auto* record = _view_state->find(w); record && record->did_enter) {
            parent = *record;
            parent_window = w;
            break;
        }
    }
    if (!parent) {
        _notifications->warn("Split window " + std::to_string(window) +
                              " could not find its parent window; directory view state was not inherited");
        return;
    }

    auto& record = _view_state->ensure(window);
    record.did_enter = true;
    if (_host->buffer_valid(parent->original_buffer)) {
        record.original_buffer = parent->original_buffer;
    }
    if (_host->buffer_valid(parent->original_alternate)) {
        record.original_alternate = parent->original_alternate;
    }
    record.saved_win_options = parent->saved_win_options;
    for (const auto& [name, _] : _config->win_options()) {
        Value value = _host->window_option(parent_window, name);
        if (value.has_value()) {
            _host->set_window_option(window, name, value);
        }
    }
}

void LifecycleController::on_window_closed(WindowId window) {
    _view_state->erase(window);
}

void LifecycleController::on_session_load() {
    for (BufferId buffer : _host->list_buffers()) {
        auto url = parse_url(_host->buffer_name(buffer));
        if (!url || !_registry->is_adapter_scheme(url->scheme()) || _host->line_count(buffer) != 1) {
            continue;
        }
        if (auto res = load_buffer(buffer); !res) {
            spdlog::warn("LifecycleController: session restore of {} failed: {}",
                         url->to_string(), res.error().to_string());
        }
    }
}

// Generations are unique across slots, so dropping the slot cannot revive a stale callback
void LifecycleController::on_wipeout(BufferId buffer) {
    _slots.erase(buffer);
    _view->forget_buffer(buffer);
}

} // namespace arbor
