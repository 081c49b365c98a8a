#include "dispatcher.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace arbor {

Dict make_event(const std::string& key, Dict payload) {
    auto slash = key.find('/');
    payload["source"] = key.substr(0, slash);
    payload["name"] = slash == std::string::npos ? std::string() : key.substr(slash + 1);
    return payload;
}

Result<std::shared_ptr<Dispatcher>> Dispatcher::create() {
    auto dispatcher = std::shared_ptr<Dispatcher>(new Dispatcher());
    if (auto res = dispatcher->init(); !res) {
        return Err<std::shared_ptr<Dispatcher>>("Dispatcher::create: init failed", res);
    }
    return dispatcher;
}

Result<HandlerId> Dispatcher::register_event_handler(const std::string& key, EventHandler handler) {
    if (!handler) {
        return Err<HandlerId>("Dispatcher::register_event_handler: empty handler for " + key);
    }
    HandlerId id = _next_handler_id++;
    _event_handlers[key].push_back({id, std::move(handler)});
    return Ok(id);
}

Result<void> Dispatcher::unregister_event_handler(HandlerId id) {
    for (auto& [key, regs] : _event_handlers) {
        for (auto it = regs.begin(); it != regs.end(); ++it) {
            if (it->id == id) {
                regs.erase(it);
                return Ok();
            }
        }
    }
    return Err<void>("Dispatcher::unregister_event_handler: unknown handler " + std::to_string(id));
}

bool Dispatcher::has_event_handler(HandlerId id) const {
    for (const auto& [key, regs] : _event_handlers) {
        for (const auto& reg : regs) {
            if (reg.id == id) return true;
        }
    }
    return false;
}

void Dispatcher::_call_handlers(const std::string& key, const Dict& event) {
    auto it = _event_handlers.find(key);
    if (it == _event_handlers.end()) {
        return;
    }
    // Handlers may register or unregister while we iterate
    auto regs = it->second;
    for (auto& reg : regs) {
        if (!has_event_handler(reg.id)) {
            continue;
        }
        if (auto res = reg.handler(event); !res) {
            spdlog::error("Dispatcher: handler for '{}' failed: {}", key, res.error().to_string());
        }
    }
}

Result<void> Dispatcher::dispatch_event(const Dict& event) {
    auto source = get_as<std::string>(event, "source").value_or("");
    auto name = get_as<std::string>(event, "name").value_or("");
    if (name.empty()) {
        return Err<void>("Dispatcher::dispatch_event: event has no name");
    }

    _call_handlers(source + "/" + name, event);
    _call_handlers("*/" + name, event);
    return Ok();
}

Result<void> Dispatcher::register_action_handler(const std::string& name, ActionHandler handler) {
    if (_action_handlers.count(name)) {
        return Err<void>("Dispatcher::register_action_handler: '" + name + "' already registered");
    }
    _action_handlers[name] = std::move(handler);
    return Ok();
}

bool Dispatcher::has_action_handler(const std::string& name) const {
    return _action_handlers.count(name) > 0;
}

Result<void> Dispatcher::dispatch_action(const Dict& action) {
    auto name = get_as<std::string>(action, "name").value_or("");
    auto it = _action_handlers.find(name);
    if (it == _action_handlers.end()) {
        return Err<void>("Dispatcher::dispatch_action: no handler for '" + name + "'");
    }
    // Copy: the handler may register further actions
    auto handler = it->second;
    return handler(action);
}

void Dispatcher::defer(Task task) {
    _tasks.push_back(std::move(task));
}

void Dispatcher::defer_idle(Task task) {
    _idle_tasks.push_back(std::move(task));
}

std::size_t Dispatcher::run_pending(std::size_t max_tasks) {
    std::size_t ran = 0;
    while (ran < max_tasks) {
        if (_tasks.empty()) {
            if (_idle_tasks.empty()) {
                break;
            }
            _tasks.push_back(std::move(_idle_tasks.front()));
            _idle_tasks.pop_front();
        }
        Task task = std::move(_tasks.front());
        _tasks.pop_front();
        task();
        ++ran;
    }
    return ran;
}

std::size_t Dispatcher::run_once() {
    // With an empty queue, one idle task counts as queued
    return run_pending(std::max<std::size_t>(_tasks.size(), 1));
}

} // namespace arbor
