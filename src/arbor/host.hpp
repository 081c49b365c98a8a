#pragma once

#include "result.hpp"
#include "types.hpp"
#include <spdlog/common.h>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace arbor {

// Placement of a floating window, in editor cells
struct WindowGeometry {
    int row = 0;
    int col = 0;
    int width = 0;
    int height = 0;
};

// Host - the editor's buffer and window primitives.
// Buffer and window ids stay unique for the whole session; operations on a
// dead id are no-ops returning defaults. The host reports lifecycle changes
// through the dispatcher (see events:: in dispatcher.hpp).
class Host {
public:
    virtual ~Host() = default;

    // Buffers
    virtual BufferId create_buffer(const std::string& name, bool listed) = 0;
    virtual BufferId find_buffer(const std::string& name) const = 0;
    virtual bool buffer_valid(BufferId buffer) const = 0;
    virtual std::string buffer_name(BufferId buffer) const = 0;
    // Fails when another buffer already has the name
    virtual Result<void> set_buffer_name(BufferId buffer, const std::string& name) = 0;
    virtual std::vector<std::string> get_lines(BufferId buffer) const = 0;
    // Replaces the content; the modified flag is left alone
    virtual void set_lines(BufferId buffer, std::vector<std::string> lines) = 0;
    virtual int line_count(BufferId buffer) const = 0;
    virtual bool modified(BufferId buffer) const = 0;
    virtual void set_modified(BufferId buffer, bool modified) = 0;
    virtual std::string filetype(BufferId buffer) const = 0;
    // buffer/filetype when the value changes
    virtual void set_filetype(BufferId buffer, const std::string& filetype) = 0;
    virtual std::string buftype(BufferId buffer) const = 0;
    virtual void set_buftype(BufferId buffer, const std::string& buftype) = 0;
    virtual std::string bufhidden(BufferId buffer) const = 0;
    virtual void set_bufhidden(BufferId buffer, const std::string& bufhidden) = 0;
    virtual void delete_buffer(BufferId buffer) = 0;
    virtual std::vector<BufferId> list_buffers() const = 0;

    // Windows
    virtual WindowId current_window() const = 0;
    virtual void set_current_window(WindowId window) = 0;
    virtual std::vector<WindowId> tab_windows() const = 0;
    virtual std::vector<WindowId> all_windows() const = 0;
    virtual bool window_valid(WindowId window) const = 0;
    virtual BufferId window_buffer(WindowId window) const = 0;
    virtual void set_window_buffer(WindowId window, BufferId buffer) = 0;
    // New window showing the same buffer; it becomes the current window
    virtual Result<WindowId> split_window(WindowId window, bool vertical, SplitModifier modifier) = 0;
    virtual Result<void> close_window(WindowId window) = 0;
    virtual bool is_floating(WindowId window) const = 0;
    virtual Result<WindowId> open_float(BufferId buffer, const WindowGeometry& geometry, const std::string& border) = 0;
    virtual Cursor cursor(WindowId window) const = 0;
    virtual void set_cursor(WindowId window, Cursor cursor) = 0;
    // Empty value when the option was never set on the window
    virtual Value window_option(WindowId window, const std::string& name) const = 0;
    virtual void set_window_option(WindowId window, const std::string& name, const Value& value) = 0;
    virtual bool is_preview(WindowId window) const = 0;
    virtual void set_preview(WindowId window, bool preview) = 0;
    virtual void set_window_title(WindowId window, const std::string& title) = 0;

    // Alternate buffer ('#') of a window
    virtual BufferId alternate_buffer(WindowId window) const = 0;
    virtual void set_alternate_buffer(WindowId window, BufferId buffer) = 0;

    // Line range of an active visual selection in the current window, as (anchor, cursor)
    virtual std::optional<std::pair<int, int>> visual_range() const = 0;

    // Filesystem queries, in host path syntax
    virtual bool is_directory(const std::string& path) const = 0;
    virtual std::string cwd() const = 0;
    virtual std::string absolute_path(const std::string& path) const = 0;

    virtual int editor_width() const = 0;
    virtual int editor_height() const = 0;

    // Show `name` in `window`, creating and reading the buffer when needed.
    // With keepalt the window's alternate buffer is left untouched.
    virtual Result<BufferId> edit(WindowId window, const std::string& name, bool keepalt) = 0;

    virtual void notify(spdlog::level::level_enum level, const std::string& message) = 0;
};

using HostPtr = std::shared_ptr<Host>;

} // namespace arbor
