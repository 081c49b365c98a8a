#pragma once

#include "types.hpp"
#include "url.hpp"
#include <map>
#include <optional>
#include <string>

namespace arbor {

// Per-window bookkeeping of where the user came from before entering a
// directory buffer, so the alternate buffer can be put back afterwards.
struct ViewRecord {
    bool did_enter = false;
    BufferId original_buffer = NO_BUFFER;
    BufferId original_alternate = NO_BUFFER;
    Dict saved_win_options;  // values the window had before engine options were applied
    std::optional<EntryId> preview_entry_id;
};

// Child to put the cursor on when a directory is shown next
struct LastCursor {
    std::string name;
    int line = 0;  // 0 = unknown, search by name
};

// ViewStateStore - session-wide presentation state, owned by the engine.
// Window records are erased when the window closes; cursor hints are
// consumed by the first render or enter of their directory.
class ViewStateStore {
public:
    ViewRecord* find(WindowId window);
    const ViewRecord* find(WindowId window) const;
    ViewRecord& ensure(WindowId window);
    void erase(WindowId window);
    // Copy `from`'s record onto `to`; false when `from` has none
    bool copy(WindowId from, WindowId to);
    std::size_t size() const { return _records.size(); }

    void set_last_cursor(const Url& url, std::string name, int line = 0);
    std::optional<LastCursor> last_cursor(const Url& url) const;
    std::optional<LastCursor> take_last_cursor(const Url& url);

    void clear();

private:
    std::map<WindowId, ViewRecord> _records;
    std::map<std::string, LastCursor> _last_cursor;  // directory url string -> child
};

} // namespace arbor
