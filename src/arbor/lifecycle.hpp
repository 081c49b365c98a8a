#pragma once

#include "dispatcher.hpp"
#include "result.hpp"
#include "types.hpp"
#include "url.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace arbor {

class Adapter;
class AdapterRegistry;
class Config;
class Host;
class Mutator;
class NotificationBuffer;
class View;
class ViewStateStore;

enum class BufferState {
    Unbound,          // no engine address yet
    Resolving,        // normalize_url in flight
    LoadedDirectory,
    LoadedFile,
    Modified,         // loaded, with unsaved edits
    Closed,           // wiped out or replaced; terminal
};

const char* to_string(BufferState state);

// LifecycleController - drives engine buffers through load, save and discard
// in reaction to host events, and keeps the per-window alternate buffer
// bookkeeping straight.
//
// Each buffer has a slot {state, generation}. Every asynchronous adapter call
// captures the generation; its callback only acts when the buffer is still
// valid, still bound to an engine url and still at that generation.
// Generations come from one counter; wiped buffers lose their slot and
// report Closed.
class LifecycleController : public std::enable_shared_from_this<LifecycleController> {
public:
    static Result<std::shared_ptr<LifecycleController>> create(
        std::shared_ptr<Host> host,
        std::shared_ptr<Dispatcher> dispatcher,
        std::shared_ptr<AdapterRegistry> registry,
        std::shared_ptr<Config> config,
        std::shared_ptr<ViewStateStore> view_state,
        std::shared_ptr<View> view,
        std::shared_ptr<NotificationBuffer> notifications,
        std::shared_ptr<Mutator> mutator
    );

    ~LifecycleController();

    // Registers the host event handlers
    Result<void> setup();
    Result<void> dispose();

    BufferState state(BufferId buffer) const;
    std::uint64_t generation(BufferId buffer) const;
    // Rendered directory, or a buffer named with an engine scheme
    bool is_engine_buffer(BufferId buffer) const;

    // Transitions
    // Plain host path of an existing directory -> files url, in place
    bool maybe_hijack_directory_buffer(BufferId buffer);
    Result<void> load_buffer(BufferId buffer);
    Result<void> write_buffer(BufferId buffer);
    void discard_all_changes();

    // Window bookkeeping
    void on_win_leave(BufferId buffer, WindowId window);
    void on_win_enter(BufferId buffer, WindowId window);
    void on_window_new(WindowId window);
    void on_window_closed(WindowId window);
    void on_session_load();
    void on_wipeout(BufferId buffer);
    void restore_alt_buf(WindowId window);

    // Rename, or switch to the buffer that already has the name.
    // Returns true when `buffer` was replaced and deleted.
    Result<bool> rename_buffer(BufferId buffer, const std::string& name);

private:
    LifecycleController() = default;

    struct Slot {
        BufferState state = BufferState::Unbound;
        std::uint64_t generation = 0;
    };

    bool _is_current(BufferId buffer, std::uint64_t generation) const;
    void _finish_load(BufferId buffer, std::uint64_t generation, std::shared_ptr<Adapter> adapter,
                      const Url& url, const std::string& requested);
    void _close_slot(BufferId buffer);
    WindowId _window_for(BufferId buffer) const;
    void _fire(const std::string& key, BufferId buffer);
    Result<void> _register(const std::string& key, EventHandler handler);

    std::shared_ptr<Host> _host;
    std::shared_ptr<Dispatcher> _dispatcher;
    std::shared_ptr<AdapterRegistry> _registry;
    std::shared_ptr<Config> _config;
    std::shared_ptr<ViewStateStore> _view_state;
    std::shared_ptr<View> _view;
    std::shared_ptr<NotificationBuffer> _notifications;
    std::shared_ptr<Mutator> _mutator;

    std::map<BufferId, Slot> _slots;
    std::uint64_t _next_generation = 0;
    std::vector<HandlerId> _handlers;
    HandlerId _scp_handler = 0;
    HandlerId _netrw_handler = 0;
};

using LifecycleControllerPtr = std::shared_ptr<LifecycleController>;

} // namespace arbor
