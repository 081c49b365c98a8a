#pragma once

#include "result.hpp"
#include "types.hpp"
#include "object.hpp"
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace arbor {

// Event handler callback type
using EventHandler = std::function<Result<void>(const Dict&)>;
using HandlerId = std::uint64_t;
using Task = std::function<void()>;

// Host lifecycle event keys ("source/name")
namespace events {
inline constexpr const char* BUFFER_NEW = "buffer/new";
inline constexpr const char* BUFFER_ADD = "buffer/add";
inline constexpr const char* BUFFER_READ_CMD = "buffer/read-cmd";
inline constexpr const char* BUFFER_READ_PRE = "buffer/read-pre";
inline constexpr const char* BUFFER_READ_POST = "buffer/read-post";
inline constexpr const char* BUFFER_WRITE_CMD = "buffer/write-cmd";
inline constexpr const char* BUFFER_WRITE_PRE = "buffer/write-pre";
inline constexpr const char* BUFFER_WRITE_POST = "buffer/write-post";
inline constexpr const char* BUFFER_WIN_LEAVE = "buffer/win-leave";
inline constexpr const char* BUFFER_WIN_ENTER = "buffer/win-enter";
inline constexpr const char* BUFFER_WIPEOUT = "buffer/wipeout";
inline constexpr const char* BUFFER_FILETYPE = "buffer/filetype";
inline constexpr const char* WINDOW_NEW = "window/new";
inline constexpr const char* WINDOW_LEAVE = "window/leave";
inline constexpr const char* WINDOW_CLOSED = "window/closed";
inline constexpr const char* SESSION_LOAD_POST = "session/load-post";
} // namespace events

// Build an event Dict from a "source/name" key plus payload
Dict make_event(const std::string& key, Dict payload = {});

// Dispatcher - pub/sub for host events and user actions, plus the
// cooperative task queue every asynchronous adapter callback goes through.
// Everything runs on one thread; handlers may dispatch or defer reentrantly.
class Dispatcher : public Object {
public:
    static Result<std::shared_ptr<Dispatcher>> create();

    // Event handlers (fire-and-forget, key = "source/name", "*/name" for any source)
    Result<HandlerId> register_event_handler(const std::string& key, EventHandler handler);
    Result<void> unregister_event_handler(HandlerId id);
    bool has_event_handler(HandlerId id) const;
    Result<void> dispatch_event(const Dict& event);

    // Action handlers (user commands), keyed by the action's "name"
    using ActionHandler = std::function<Result<void>(const Dict&)>;
    Result<void> register_action_handler(const std::string& name, ActionHandler handler);
    bool has_action_handler(const std::string& name) const;
    Result<void> dispatch_action(const Dict& action);

    // Cooperative scheduling
    void defer(Task task);
    // Runs once the regular queue is empty, behind every task queued meanwhile
    void defer_idle(Task task);
    // Runs queued tasks, including ones queued while running, until the queue
    // is empty or `max_tasks` ran. Returns the number of tasks run.
    std::size_t run_pending(std::size_t max_tasks = SIZE_MAX);
    // Runs only the tasks queued before the call
    std::size_t run_once();
    bool has_pending() const { return !_tasks.empty() || !_idle_tasks.empty(); }

private:
    Dispatcher() = default;

    struct Registration {
        HandlerId id;
        EventHandler handler;
    };

    void _call_handlers(const std::string& key, const Dict& event);

    std::map<std::string, std::vector<Registration>> _event_handlers;
    std::map<std::string, ActionHandler> _action_handlers;
    std::deque<Task> _tasks;
    std::deque<Task> _idle_tasks;
    HandlerId _next_handler_id = 1;
};

using DispatcherPtr = std::shared_ptr<Dispatcher>;

} // namespace arbor
