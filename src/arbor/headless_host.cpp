#include "headless_host.hpp"
#include "dispatcher.hpp"
#include <spdlog/spdlog.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <fstream>

namespace fs = std::filesystem;

namespace arbor {

Result<std::shared_ptr<HeadlessHost>> HeadlessHost::create(
    std::shared_ptr<Dispatcher> dispatcher,
    int width,
    int height
) {
    if (!dispatcher) {
        return Err<std::shared_ptr<HeadlessHost>>("HeadlessHost::create: dispatcher is required");
    }
    auto host = std::shared_ptr<HeadlessHost>(new HeadlessHost());
    host->_dispatcher = std::move(dispatcher);
    host->_width = width;
    host->_height = height;
    if (auto res = host->init(); !res) {
        return Err<std::shared_ptr<HeadlessHost>>("HeadlessHost::create: init failed", res);
    }
    return host;
}

Result<void> HeadlessHost::init() {
    std::error_code ec;
    _cwd = fs::current_path(ec);
    if (ec) {
        _cwd = "/";
    }
    BufferId buffer = _new_buffer("", true, false);
    _buffers[buffer].loaded = true;
    WindowId window = _next_window++;
    _windows[window].buffer = buffer;
    _window_order.push_back(window);
    _current = window;
    return Ok();
}

void HeadlessHost::_fire(const std::string& key, Dict payload) {
    if (auto res = _dispatcher->dispatch_event(make_event(key, std::move(payload))); !res) {
        spdlog::error("HeadlessHost: dispatching {} failed: {}", key, res.error().to_string());
    }
}

// ---------------------------------------------------------------------------
// Buffers
// ---------------------------------------------------------------------------

BufferId HeadlessHost::_new_buffer(const std::string& name, bool listed, bool fire_events) {
    BufferId id = _next_buffer++;
    BufferData data;
    data.name = name;
    data.listed = listed;
    _buffers[id] = std::move(data);
    if (fire_events) {
        _fire(events::BUFFER_NEW, {{"buffer", id}, {"file", name}});
        if (listed && buffer_valid(id)) {
            _fire(events::BUFFER_ADD, {{"buffer", id}, {"file", buffer_name(id)}});
        }
    }
    return id;
}

BufferId HeadlessHost::create_buffer(const std::string& name, bool listed) {
    if (!name.empty() && find_buffer(name) != NO_BUFFER) {
        return NO_BUFFER;
    }
    return _new_buffer(name, listed, true);
}

BufferId HeadlessHost::find_buffer(const std::string& name) const {
    if (name.empty()) {
        return NO_BUFFER;
    }
    for (const auto& [id, data] : _buffers) {
        if (data.name == name) return id;
    }
    return NO_BUFFER;
}

bool HeadlessHost::buffer_valid(BufferId buffer) const {
    return _buffers.count(buffer) > 0;
}

std::string HeadlessHost::buffer_name(BufferId buffer) const {
    auto it = _buffers.find(buffer);
    return it == _buffers.end() ? std::string() : it->second.name;
}

Result<void> HeadlessHost::set_buffer_name(BufferId buffer, const std::string& name) {
    auto it = _buffers.find(buffer);
    if (it == _buffers.end()) {
        return Err<void>("HeadlessHost::set_buffer_name: invalid buffer " + std::to_string(buffer));
    }
    if (BufferId other = find_buffer(name); other != NO_BUFFER && other != buffer) {
        return Err<void>("HeadlessHost::set_buffer_name: buffer with this name already exists: " + name);
    }
    it->second.name = name;
    return Ok();
}

std::vector<std::string> HeadlessHost::get_lines(BufferId buffer) const {
    auto it = _buffers.find(buffer);
    return it == _buffers.end() ? std::vector<std::string>{} : it->second.lines;
}

void HeadlessHost::set_lines(BufferId buffer, std::vector<std::string> lines) {
    auto it = _buffers.find(buffer);
    if (it == _buffers.end()) {
        return;
    }
    if (lines.empty()) lines.emplace_back("");
    it->second.lines = std::move(lines);
    for (auto& [id, win] : _windows) {
        if (win.buffer == buffer) {
            win.cursor.line = std::min(win.cursor.line, static_cast<int>(it->second.lines.size()));
        }
    }
}

void HeadlessHost::edit_lines(BufferId buffer, std::vector<std::string> lines) {
    if (!buffer_valid(buffer)) {
        return;
    }
    set_lines(buffer, std::move(lines));
    _buffers[buffer].modified = true;
}

int HeadlessHost::line_count(BufferId buffer) const {
    auto it = _buffers.find(buffer);
    return it == _buffers.end() ? 0 : static_cast<int>(it->second.lines.size());
}

bool HeadlessHost::modified(BufferId buffer) const {
    auto it = _buffers.find(buffer);
    return it != _buffers.end() && it->second.modified;
}

void HeadlessHost::set_modified(BufferId buffer, bool modified) {
    if (auto it = _buffers.find(buffer); it != _buffers.end()) {
        it->second.modified = modified;
    }
}

std::string HeadlessHost::filetype(BufferId buffer) const {
    auto it = _buffers.find(buffer);
    return it == _buffers.end() ? std::string() : it->second.filetype;
}

void HeadlessHost::set_filetype(BufferId buffer, const std::string& filetype) {
    auto it = _buffers.find(buffer);
    if (it == _buffers.end() || it->second.filetype == filetype) {
        return;
    }
    it->second.filetype = filetype;
    _fire(events::BUFFER_FILETYPE, {{"buffer", buffer}, {"file", it->second.name}, {"filetype", filetype}});
}

std::string HeadlessHost::buftype(BufferId buffer) const {
    auto it = _buffers.find(buffer);
    return it == _buffers.end() ? std::string() : it->second.buftype;
}

void HeadlessHost::set_buftype(BufferId buffer, const std::string& buftype) {
    if (auto it = _buffers.find(buffer); it != _buffers.end()) {
        it->second.buftype = buftype;
    }
}

std::string HeadlessHost::bufhidden(BufferId buffer) const {
    auto it = _buffers.find(buffer);
    return it == _buffers.end() ? std::string() : it->second.bufhidden;
}

void HeadlessHost::set_bufhidden(BufferId buffer, const std::string& bufhidden) {
    if (auto it = _buffers.find(buffer); it != _buffers.end()) {
        it->second.bufhidden = bufhidden;
    }
}

void HeadlessHost::delete_buffer(BufferId buffer) {
    if (!buffer_valid(buffer)) {
        return;
    }

    // Windows showing the buffer fall back to their alternate, or a fresh empty buffer
    std::vector<WindowId> showing;
    for (WindowId w : _window_order) {
        if (_windows[w].buffer == buffer) showing.push_back(w);
    }
    for (WindowId w : showing) {
        if (!window_valid(w)) continue;
        BufferId replacement = _windows[w].alternate;
        if (replacement == buffer || !buffer_valid(replacement)) {
            replacement = _new_buffer("", true, false);
            _buffers[replacement].loaded = true;
        }
        if (!_displayed(buffer, w)) {
            _fire(events::BUFFER_WIN_LEAVE, {{"buffer", buffer}, {"window", w}});
        }
        if (!window_valid(w) || !buffer_valid(replacement)) continue;
        _windows[w].buffer = replacement;
        _fire(events::BUFFER_WIN_ENTER, {{"buffer", replacement}, {"window", w}});
    }

    if (!buffer_valid(buffer)) {
        return;
    }
    std::string name = buffer_name(buffer);
    _fire(events::BUFFER_WIPEOUT, {{"buffer", buffer}, {"file", name}});
    _buffers.erase(buffer);
    for (auto& [id, win] : _windows) {
        if (win.alternate == buffer) win.alternate = NO_BUFFER;
    }
}

std::vector<BufferId> HeadlessHost::list_buffers() const {
    std::vector<BufferId> out;
    for (const auto& [id, data] : _buffers) {
        out.push_back(id);
    }
    return out;
}

// ---------------------------------------------------------------------------
// Windows
// ---------------------------------------------------------------------------

void HeadlessHost::set_current_window(WindowId window) {
    if (!window_valid(window) || window == _current) {
        return;
    }
    WindowId old = _current;
    _fire(events::WINDOW_LEAVE, {{"window", old}, {"buffer", window_buffer(old)}});
    if (!window_valid(window)) {
        return;
    }
    _previous = old;
    _current = window;
}

std::vector<WindowId> HeadlessHost::tab_windows() const {
    return _window_order;
}

std::vector<WindowId> HeadlessHost::all_windows() const {
    return _window_order;
}

bool HeadlessHost::window_valid(WindowId window) const {
    return _windows.count(window) > 0;
}

BufferId HeadlessHost::window_buffer(WindowId window) const {
    auto it = _windows.find(window);
    return it == _windows.end() ? NO_BUFFER : it->second.buffer;
}

bool HeadlessHost::_displayed(BufferId buffer, WindowId except) const {
    for (const auto& [id, win] : _windows) {
        if (id != except && win.buffer == buffer) return true;
    }
    return false;
}

void HeadlessHost::_maybe_wipe(BufferId buffer) {
    if (buffer_valid(buffer) && bufhidden(buffer) == "wipe" && !_displayed(buffer)) {
        delete_buffer(buffer);
    }
}

void HeadlessHost::_load(BufferId buffer) {
    auto& data = _buffers[buffer];
    data.loaded = true;
    std::string name = data.name;
    if (name.find("://") != std::string::npos) {
        _fire(events::BUFFER_READ_CMD, {{"buffer", buffer}, {"file", name}});
        return;
    }
    if (name.empty()) {
        return;
    }
    std::error_code ec;
    if (!fs::is_regular_file(absolute_path(name), ec)) {
        return;
    }
    std::ifstream in(absolute_path(name));
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    set_lines(buffer, std::move(lines));
}

void HeadlessHost::_show(WindowId window, BufferId buffer, bool load) {
    BufferId old = _windows[window].buffer;
    if (old != buffer && buffer_valid(old) && !_displayed(old, window)) {
        _fire(events::BUFFER_WIN_LEAVE, {{"buffer", old}, {"window", window}});
    }
    if (!window_valid(window) || !buffer_valid(buffer)) {
        return;
    }
    _windows[window].buffer = buffer;
    _windows[window].cursor = Cursor{};
    if (load) {
        _load(buffer);
    }
    if (old != buffer) {
        _maybe_wipe(old);
    }
    if (buffer_valid(buffer) && window_valid(window) && _windows[window].buffer == buffer) {
        _fire(events::BUFFER_WIN_ENTER, {{"buffer", buffer}, {"window", window}});
    }
}

void HeadlessHost::set_window_buffer(WindowId window, BufferId buffer) {
    if (!window_valid(window) || !buffer_valid(buffer) || window_buffer(window) == buffer) {
        return;
    }
    _show(window, buffer, !_buffers[buffer].loaded);
}

Result<WindowId> HeadlessHost::split_window(WindowId window, bool vertical, SplitModifier modifier) {
    if (!window_valid(window)) {
        return Err<WindowId>("HeadlessHost::split_window: invalid window " + std::to_string(window));
    }
    WindowId id = _next_window++;
    WindowData data;
    data.buffer = _windows[window].buffer;
    data.alternate = _windows[window].alternate;
    data.cursor = _windows[window].cursor;
    data.options = _windows[window].options;
    _windows[id] = std::move(data);

    auto pos = std::find(_window_order.begin(), _window_order.end(), window);
    switch (modifier) {
        case SplitModifier::AboveLeft:
            _window_order.insert(pos, id);
            break;
        case SplitModifier::BelowRight:
            _window_order.insert(pos == _window_order.end() ? pos : pos + 1, id);
            break;
        case SplitModifier::TopLeft:
            _window_order.insert(_window_order.begin(), id);
            break;
        case SplitModifier::BotRight:
            _window_order.push_back(id);
            break;
    }
    ydebug("HeadlessHost: split {} into {} ({})", window, id, vertical ? "vertical" : "horizontal");

    WindowId old = _current;
    _fire(events::WINDOW_LEAVE, {{"window", old}, {"buffer", window_buffer(old)}});
    _previous = old;
    _current = id;
    _fire(events::WINDOW_NEW, {{"window", id}, {"buffer", window_buffer(id)}});
    return Ok(id);
}

WindowId HeadlessHost::_fallback_window() const {
    if (window_valid(_previous)) {
        return _previous;
    }
    for (WindowId w : _window_order) {
        if (!is_floating(w)) return w;
    }
    return _window_order.empty() ? NO_WINDOW : _window_order.front();
}

Result<void> HeadlessHost::close_window(WindowId window) {
    if (!window_valid(window)) {
        return Err<void>("HeadlessHost::close_window: invalid window " + std::to_string(window));
    }
    std::size_t normal = 0;
    for (WindowId w : _window_order) {
        if (!is_floating(w)) ++normal;
    }
    if (!is_floating(window) && normal <= 1) {
        return Err<void>("HeadlessHost::close_window: cannot close last window");
    }

    BufferId buffer = _windows[window].buffer;
    if (window == _current) {
        _fire(events::WINDOW_LEAVE, {{"window", window}, {"buffer", buffer}});
    }
    if (!window_valid(window)) {
        return Ok();
    }
    if (buffer_valid(buffer) && !_displayed(buffer, window)) {
        _fire(events::BUFFER_WIN_LEAVE, {{"buffer", buffer}, {"window", window}});
    }
    if (!window_valid(window)) {
        return Ok();
    }

    _windows.erase(window);
    _window_order.erase(std::find(_window_order.begin(), _window_order.end(), window));
    if (_current == window) {
        _current = _fallback_window();
    }
    if (_previous == window || _previous == _current) {
        _previous = NO_WINDOW;
    }
    _fire(events::WINDOW_CLOSED, {{"window", window}});
    _maybe_wipe(buffer);
    return Ok();
}

bool HeadlessHost::is_floating(WindowId window) const {
    auto it = _windows.find(window);
    return it != _windows.end() && it->second.float_geometry.has_value();
}

Result<WindowId> HeadlessHost::open_float(BufferId buffer, const WindowGeometry& geometry, const std::string& border) {
    if (!buffer_valid(buffer)) {
        return Err<WindowId>("HeadlessHost::open_float: invalid buffer " + std::to_string(buffer));
    }
    if (geometry.width <= 0 || geometry.height <= 0) {
        return Err<WindowId>("HeadlessHost::open_float: window must be at least 1x1");
    }
    WindowId id = _next_window++;
    WindowData data;
    data.buffer = buffer;
    data.float_geometry = geometry;
    data.border = border;
    _windows[id] = std::move(data);
    _window_order.push_back(id);

    WindowId old = _current;
    _fire(events::WINDOW_LEAVE, {{"window", old}, {"buffer", window_buffer(old)}});
    _previous = old;
    _current = id;
    _fire(events::WINDOW_NEW, {{"window", id}, {"buffer", buffer}});
    if (window_valid(id) && buffer_valid(buffer)) {
        _fire(events::BUFFER_WIN_ENTER, {{"buffer", buffer}, {"window", id}});
    }
    return Ok(id);
}

Cursor HeadlessHost::cursor(WindowId window) const {
    auto it = _windows.find(window);
    return it == _windows.end() ? Cursor{} : it->second.cursor;
}

void HeadlessHost::set_cursor(WindowId window, Cursor cursor) {
    auto it = _windows.find(window);
    if (it == _windows.end()) {
        return;
    }
    int count = line_count(it->second.buffer);
    cursor.line = std::clamp(cursor.line, 1, std::max(count, 1));
    cursor.col = std::max(cursor.col, 0);
    it->second.cursor = cursor;
}

Value HeadlessHost::window_option(WindowId window, const std::string& name) const {
    auto it = _windows.find(window);
    if (it == _windows.end()) {
        return Value{};
    }
    auto opt = it->second.options.find(name);
    return opt == it->second.options.end() ? Value{} : opt->second;
}

void HeadlessHost::set_window_option(WindowId window, const std::string& name, const Value& value) {
    if (auto it = _windows.find(window); it != _windows.end()) {
        if (value.has_value()) {
            it->second.options[name] = value;
        } else {
            it->second.options.erase(name);
        }
    }
}

bool HeadlessHost::is_preview(WindowId window) const {
    auto it = _windows.find(window);
    return it != _windows.end() && it->second.preview;
}

void HeadlessHost::set_preview(WindowId window, bool preview) {
    if (auto it = _windows.find(window); it != _windows.end()) {
        it->second.preview = preview;
    }
}

void HeadlessHost::set_window_title(WindowId window, const std::string& title) {
    if (auto it = _windows.find(window); it != _windows.end()) {
        it->second.title = title;
    }
}

std::optional<WindowGeometry> HeadlessHost::window_geometry(WindowId window) const {
    auto it = _windows.find(window);
    return it == _windows.end() ? std::nullopt : it->second.float_geometry;
}

std::string HeadlessHost::window_title(WindowId window) const {
    auto it = _windows.find(window);
    return it == _windows.end() ? std::string() : it->second.title;
}

std::string HeadlessHost::window_border(WindowId window) const {
    auto it = _windows.find(window);
    return it == _windows.end() ? std::string() : it->second.border;
}

BufferId HeadlessHost::alternate_buffer(WindowId window) const {
    auto it = _windows.find(window);
    return it == _windows.end() ? NO_BUFFER : it->second.alternate;
}

void HeadlessHost::set_alternate_buffer(WindowId window, BufferId buffer) {
    if (auto it = _windows.find(window); it != _windows.end()) {
        it->second.alternate = buffer;
    }
}

// ---------------------------------------------------------------------------
// Filesystem
// ---------------------------------------------------------------------------

bool HeadlessHost::is_directory(const std::string& path) const {
    if (path.empty()) {
        return false;
    }
    std::error_code ec;
    return fs::is_directory(absolute_path(path), ec);
}

std::string HeadlessHost::absolute_path(const std::string& path) const {
    fs::path p(path);
    if (p.is_relative()) {
        p = _cwd / p;
    }
    return p.lexically_normal().string();
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

Result<BufferId> HeadlessHost::edit(WindowId window, const std::string& name, bool keepalt) {
    if (!window_valid(window)) {
        return Err<BufferId>("HeadlessHost::edit: invalid window " + std::to_string(window));
    }
    if (name.empty()) {
        return Err<BufferId>("HeadlessHost::edit: no file name");
    }

    BufferId buffer = find_buffer(name);
    if (buffer == NO_BUFFER) {
        buffer = _new_buffer(name, true, true);
    }
    if (!buffer_valid(buffer) || !window_valid(window)) {
        return Err<BufferId>("HeadlessHost::edit: buffer for " + name + " went away");
    }

    BufferId old = window_buffer(window);
    if (old == buffer) {
        if (!_buffers[buffer].loaded) _load(buffer);
        return Ok(buffer);
    }
    if (!keepalt && buffer_valid(old)) {
        _windows[window].alternate = old;
    }
    _show(window, buffer, !_buffers[buffer].loaded);
    return Ok(buffer);
}

Result<void> HeadlessHost::write(BufferId buffer) {
    if (!buffer_valid(buffer)) {
        return Err<void>("HeadlessHost::write: invalid buffer " + std::to_string(buffer));
    }
    std::string name = buffer_name(buffer);
    if (name.empty()) {
        return Err<void>("HeadlessHost::write: no file name");
    }
    if (name.find("://") != std::string::npos) {
        _fire(events::BUFFER_WRITE_CMD, {{"buffer", buffer}, {"file", name}});
        return Ok();
    }
    std::ofstream out(absolute_path(name), std::ios::trunc);
    if (!out) {
        return Err<void>("HeadlessHost::write: cannot open " + name);
    }
    for (const auto& line : get_lines(buffer)) {
        out << line << '\n';
    }
    set_modified(buffer, false);
    return Ok();
}

Result<void> HeadlessHost::load_session(const std::vector<std::string>& names) {
    // Sessions restore buffers with autocommands disabled
    BufferId first = NO_BUFFER;
    for (const auto& name : names) {
        BufferId buffer = find_buffer(name);
        if (buffer == NO_BUFFER) {
            buffer = _new_buffer(name, true, false);
        }
        _buffers[buffer].loaded = true;
        if (first == NO_BUFFER) first = buffer;
    }
    if (first != NO_BUFFER && window_valid(_current)) {
        _windows[_current].buffer = first;
        _windows[_current].cursor = Cursor{};
    }
    _fire(events::SESSION_LOAD_POST, {});
    return Ok();
}

void HeadlessHost::notify(spdlog::level::level_enum level, const std::string& message) {
    _notifications.push_back({level, message});
}

} // namespace arbor
