#include "float_window.hpp"
#include <spdlog/spdlog.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>

namespace arbor {

WindowGeometry compute_float_geometry(const FloatConfig& config, int total_width, int total_height) {
    int border = config.has_border() ? 2 : 0;

    int width = total_width - 2 * config.padding - border;
    if (config.max_width > 0) {
        width = std::min(width, config.max_width);
    }
    int height = total_height - 2 * config.padding - border;
    if (config.max_height > 0) {
        height = std::min(height, config.max_height);
    }
    width = std::max(width, 0);
    height = std::max(height, 0);

    WindowGeometry geometry;
    geometry.width = width;
    geometry.height = height;
    geometry.row = std::max((total_height - height) / 2, 0);
    geometry.col = std::max((total_width - width) / 2 - (border ? 1 : 0), 0);
    return geometry;
}

Result<std::shared_ptr<FloatWindowManager>> FloatWindowManager::create(
    std::shared_ptr<Host> host,
    std::shared_ptr<Dispatcher> dispatcher,
    std::shared_ptr<Config> config
) {
    if (!host || !dispatcher || !config) {
        return Err<std::shared_ptr<FloatWindowManager>>("FloatWindowManager::create: missing collaborator");
    }
    auto manager = std::shared_ptr<FloatWindowManager>(new FloatWindowManager());
    manager->_host = std::move(host);
    manager->_dispatcher = std::move(dispatcher);
    manager->_config = std::move(config);
    return manager;
}

Result<WindowId> FloatWindowManager::open(const std::string& url) {
    const auto& float_config = _config->float_config();
    auto geometry = compute_float_geometry(float_config, _host->editor_width(), _host->editor_height());
    if (geometry.width == 0 || geometry.height == 0) {
        return Err<WindowId>("FloatWindowManager::open: editor too small for a float (" +
                             std::to_string(_host->editor_width()) + "x" +
                             std::to_string(_host->editor_height()) + ")");
    }

    BufferId scratch = _host->create_buffer("", false);
    _host->set_bufhidden(scratch, "wipe");

    auto win_res = _host->open_float(scratch, geometry, float_config.border);
    if (!win_res) {
        _host->delete_buffer(scratch);
        return Err<WindowId>("FloatWindowManager::open: cannot open float", win_res);
    }
    WindowId window = *win_res;

    auto teardown = std::make_shared<Teardown>();
    teardown->window = window;
    std::weak_ptr<FloatWindowManager> weak = shared_from_this();
    auto handler_res = _dispatcher->register_event_handler(events::WINDOW_LEAVE,
        [weak, teardown](const Dict&) -> Result<void> {
            if (auto self = weak.lock()) {
                self->_on_leave(teardown);
            }
            return Ok();
        });
    if (!handler_res) {
        _close(teardown);
        return Err<WindowId>("FloatWindowManager::open: cannot register teardown", handler_res);
    }
    teardown->handler = *handler_res;
    _teardowns.push_back(teardown);

    for (const auto& [name, value] : float_config.win_options) {
        _host->set_window_option(window, name, value);
    }

    auto edit_res = _host->edit(window, url, true);
    if (!edit_res) {
        _close(teardown);
        return Err<WindowId>("FloatWindowManager::open: cannot edit " + url, edit_res);
    }
    _host->set_window_title(window, _host->buffer_name(_host->window_buffer(window)));
    ydebug("FloatWindowManager: float {} shows {}", window, url);
    return Ok(window);
}

void FloatWindowManager::_on_leave(const std::shared_ptr<Teardown>& teardown) {
    if (teardown->done) {
        return;
    }
    // Focus has not settled yet when window/leave fires; look one tick later
    std::weak_ptr<FloatWindowManager> weak = shared_from_this();
    _dispatcher->defer([weak, teardown]() {
        auto self = weak.lock();
        if (!self || teardown->done) {
            return;
        }
        if (self->_host->is_floating(self->_host->current_window())) {
            return;
        }
        self->_close(teardown);
    });
}

void FloatWindowManager::_close(const std::shared_ptr<Teardown>& teardown) {
    teardown->done = true;
    if (teardown->handler && _dispatcher->has_event_handler(teardown->handler)) {
        if (auto res = _dispatcher->unregister_event_handler(teardown->handler); !res) {
            spdlog::warn("FloatWindowManager: {}", res.error().to_string());
        }
    }
    if (_host->window_valid(teardown->window)) {
        if (auto res = _host->close_window(teardown->window); !res) {
            spdlog::warn("FloatWindowManager: closing float {} failed: {}",
                         teardown->window, res.error().to_string());
        }
    }
    _teardowns.erase(std::remove(_teardowns.begin(), _teardowns.end(), teardown), _teardowns.end());
}

std::size_t FloatWindowManager::active_teardowns() const {
    return _teardowns.size();
}

} // namespace arbor
