#pragma once

#include "config.hpp"
#include "dispatcher.hpp"
#include "host.hpp"
#include "result.hpp"
#include "types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace arbor {

// Centered float inside a total_width x total_height editor.
// The border takes one cell on every side; sizes never go below zero.
WindowGeometry compute_float_geometry(const FloatConfig& config, int total_width, int total_height);

// FloatWindowManager - opens directory views in a floating window that
// closes itself once focus moves to a non-floating window.
class FloatWindowManager : public std::enable_shared_from_this<FloatWindowManager> {
public:
    static Result<std::shared_ptr<FloatWindowManager>> create(
        std::shared_ptr<Host> host,
        std::shared_ptr<Dispatcher> dispatcher,
        std::shared_ptr<Config> config
    );

    // Show `url` in a new float; returns the float's window id
    Result<WindowId> open(const std::string& url);

    // Floats whose teardown handler is still registered
    std::size_t active_teardowns() const;

private:
    FloatWindowManager() = default;

    // Shared between a float's window/leave handler and its deferred task
    struct Teardown {
        WindowId window = NO_WINDOW;
        HandlerId handler = 0;
        bool done = false;
    };

    void _on_leave(const std::shared_ptr<Teardown>& teardown);
    void _close(const std::shared_ptr<Teardown>& teardown);

    std::shared_ptr<Host> _host;
    std::shared_ptr<Dispatcher> _dispatcher;
    std::shared_ptr<Config> _config;
    std::vector<std::shared_ptr<Teardown>> _teardowns;
};

using FloatWindowManagerPtr = std::shared_ptr<FloatWindowManager>;

} // namespace arbor
