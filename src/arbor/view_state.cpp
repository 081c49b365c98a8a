#include "view_state.hpp"

namespace arbor {

ViewRecord* ViewStateStore::find(WindowId window) {
    auto it = _records.find(window);
    return it == _records.end() ? nullptr : &it->second;
}

const ViewRecord* ViewStateStore::find(WindowId window) const {
    auto it = _records.find(window);
    return it == _records.end() ? nullptr : &it->second;
}

ViewRecord& ViewStateStore::ensure(WindowId window) {
    return _records[window];
}

void ViewStateStore::erase(WindowId window) {
    _records.erase(window);
}

bool ViewStateStore::copy(WindowId from, WindowId to) {
    auto it = _records.find(from);
    if (it == _records.end()) {
        return false;
    }
    ViewRecord record = it->second;
    _records[to] = std::move(record);
    return true;
}

void ViewStateStore::set_last_cursor(const Url& url, std::string name, int line) {
    _last_cursor[addslash(url).to_string()] = LastCursor{std::move(name), line};
}

std::optional<LastCursor> ViewStateStore::last_cursor(const Url& url) const {
    auto it = _last_cursor.find(addslash(url).to_string());
    if (it == _last_cursor.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<LastCursor> ViewStateStore::take_last_cursor(const Url& url) {
    auto it = _last_cursor.find(addslash(url).to_string());
    if (it == _last_cursor.end()) {
        return std::nullopt;
    }
    LastCursor out = std::move(it->second);
    _last_cursor.erase(it);
    return out;
}

void ViewStateStore::clear() {
    _records.clear();
    _last_cursor.clear();
}

} // namespace arbor
