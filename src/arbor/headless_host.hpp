#pragma once

#include "host.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace arbor {

class Dispatcher;

// HeadlessHost - an in-memory editor for the CLI and the tests.
// Starts with one window showing an empty unnamed buffer. Lifecycle events
// follow vim's ordering:
//   edit:   buffer/new, buffer/add, buffer/win-leave, buffer/read-cmd, buffer/win-enter
//   split:  window/leave, window/new
//   close:  window/leave, buffer/win-leave, window/closed, buffer/wipeout (bufhidden=wipe)
// buffer/win-leave only fires when the buffer stops being visible anywhere.
class HeadlessHost : public Host {
public:
    struct Notification {
        spdlog::level::level_enum level;
        std::string message;
    };

    static Result<std::shared_ptr<HeadlessHost>> create(
        std::shared_ptr<Dispatcher> dispatcher,
        int width = 120,
        int height = 40
    );

    // Buffers
    BufferId create_buffer(const std::string& name, bool listed) override;
    BufferId find_buffer(const std::string& name) const override;
    bool buffer_valid(BufferId buffer) const override;
    std::string buffer_name(BufferId buffer) const override;
    Result<void> set_buffer_name(BufferId buffer, const std::string& name) override;
    std::vector<std::string> get_lines(BufferId buffer) const override;
    void set_lines(BufferId buffer, std::vector<std::string> lines) override;
    int line_count(BufferId buffer) const override;
    bool modified(BufferId buffer) const override;
    void set_modified(BufferId buffer, bool modified) override;
    std::string filetype(BufferId buffer) const override;
    void set_filetype(BufferId buffer, const std::string& filetype) override;
    std::string buftype(BufferId buffer) const override;
    void set_buftype(BufferId buffer, const std::string& buftype) override;
    std::string bufhidden(BufferId buffer) const override;
    void set_bufhidden(BufferId buffer, const std::string& bufhidden) override;
    void delete_buffer(BufferId buffer) override;
    std::vector<BufferId> list_buffers() const override;

    // Windows
    WindowId current_window() const override { return _current; }
    void set_current_window(WindowId window) override;
    std::vector<WindowId> tab_windows() const override;
    std::vector<WindowId> all_windows() const override;
    bool window_valid(WindowId window) const override;
    BufferId window_buffer(WindowId window) const override;
    void set_window_buffer(WindowId window, BufferId buffer) override;
    Result<WindowId> split_window(WindowId window, bool vertical, SplitModifier modifier) override;
    Result<void> close_window(WindowId window) override;
    bool is_floating(WindowId window) const override;
    Result<WindowId> open_float(BufferId buffer, const WindowGeometry& geometry, const std::string& border) override;
    Cursor cursor(WindowId window) const override;
    void set_cursor(WindowId window, Cursor cursor) override;
    Value window_option(WindowId window, const std::string& name) const override;
    void set_window_option(WindowId window, const std::string& name, const Value& value) override;
    bool is_preview(WindowId window) const override;
    void set_preview(WindowId window, bool preview) override;
    void set_window_title(WindowId window, const std::string& title) override;

    BufferId alternate_buffer(WindowId window) const override;
    void set_alternate_buffer(WindowId window, BufferId buffer) override;

    std::optional<std::pair<int, int>> visual_range() const override { return _visual; }

    bool is_directory(const std::string& path) const override;
    std::string cwd() const override { return _cwd.string(); }
    std::string absolute_path(const std::string& path) const override;

    int editor_width() const override { return _width; }
    int editor_height() const override { return _height; }

    Result<BufferId> edit(WindowId window, const std::string& name, bool keepalt) override;

    void notify(spdlog::level::level_enum level, const std::string& message) override;

    // Drivers for user activity
    // :write - buffers with a scheme go through buffer/write-cmd, others to disk
    Result<void> write(BufferId buffer);
    // Typing into a buffer: replaces the lines and marks it modified
    void edit_lines(BufferId buffer, std::vector<std::string> lines);
    void set_visual_range(std::optional<std::pair<int, int>> range) { _visual = range; }
    void set_cwd(const std::filesystem::path& cwd) { _cwd = cwd; }
    // Recreates buffers from a session without reading them, then fires session/load-post
    Result<void> load_session(const std::vector<std::string>& names);

    const std::vector<Notification>& notifications() const { return _notifications; }
    void clear_notifications() { _notifications.clear(); }

    std::optional<WindowGeometry> window_geometry(WindowId window) const;
    std::string window_title(WindowId window) const;
    std::string window_border(WindowId window) const;

    Result<void> init();

private:
    HeadlessHost() = default;

    struct BufferData {
        std::string name;
        std::vector<std::string> lines{""};
        bool modified = false;
        bool listed = true;
        bool loaded = false;
        std::string filetype;
        std::string buftype;
        std::string bufhidden;
    };

    struct WindowData {
        BufferId buffer = NO_BUFFER;
        BufferId alternate = NO_BUFFER;
        Cursor cursor;
        Dict options;
        bool preview = false;
        std::optional<WindowGeometry> float_geometry;
        std::string border;
        std::string title;
    };

    void _fire(const std::string& key, Dict payload);
    BufferId _new_buffer(const std::string& name, bool listed, bool fire_events);
    // Put `buffer` in `window`, reading it first when `load` is set
    void _show(WindowId window, BufferId buffer, bool load);
    void _load(BufferId buffer);
    bool _displayed(BufferId buffer, WindowId except = NO_WINDOW) const;
    void _maybe_wipe(BufferId buffer);
    WindowId _fallback_window() const;

    std::shared_ptr<Dispatcher> _dispatcher;
    std::map<BufferId, BufferData> _buffers;
    std::map<WindowId, WindowData> _windows;
    std::vector<WindowId> _window_order;
    WindowId _current = NO_WINDOW;
    WindowId _previous = NO_WINDOW;
    BufferId _next_buffer = 1;
    WindowId _next_window = 1000;
    std::optional<std::pair<int, int>> _visual;
    std::filesystem::path _cwd;
    int _width = 120;
    int _height = 40;
    std::vector<Notification> _notifications;
};

using HeadlessHostPtr = std::shared_ptr<HeadlessHost>;

} // namespace arbor
