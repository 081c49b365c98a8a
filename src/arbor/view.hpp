#pragma once

#include "adapter.hpp"
#include "result.hpp"
#include "types.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace arbor {

class AdapterRegistry;
class Config;
class EntryCache;
class Host;
class NotificationBuffer;
class ViewStateStore;

// Filetype of every rendered directory buffer
inline constexpr const char* FILETYPE = "arbor";

// View - renders directory listings into buffers and owns the window
// options of windows showing them
class View {
public:
    virtual ~View() = default;

    // First render of a directory buffer; errors are reported, not returned
    virtual void initialize(BufferId buffer) = 0;
    // List the buffer's url and replace its lines; the buffer ends unmodified
    virtual void render_buffer_async(BufferId buffer, DoneCallback cb) = 0;
    virtual void set_columns(std::vector<std::string> columns) = 0;
    virtual std::vector<ColumnPtr> columns_for(const Adapter& adapter) const = 0;
    // Place the cursor on the remembered child of the window's directory
    virtual void maybe_set_cursor(WindowId window) = 0;
    virtual void set_win_options(WindowId window) = 0;
    virtual void restore_win_options(WindowId window) = 0;
    virtual std::vector<BufferId> get_all_buffers() const = 0;
    // Drop per-buffer render bookkeeping of a wiped buffer
    virtual void forget_buffer(BufferId buffer) = 0;
};

using ViewPtr = std::shared_ptr<View>;

// DirectoryView - the default View: one "/<id> <columns> <name>" line per entry,
// directories first, then by name.
class DirectoryView : public View, public std::enable_shared_from_this<DirectoryView> {
public:
    static Result<std::shared_ptr<DirectoryView>> create(
        std::shared_ptr<Host> host,
        std::shared_ptr<AdapterRegistry> registry,
        std::shared_ptr<EntryCache> cache,
        std::shared_ptr<ViewStateStore> view_state,
        std::shared_ptr<Config> config,
        std::shared_ptr<NotificationBuffer> notifications
    );

    void initialize(BufferId buffer) override;
    void render_buffer_async(BufferId buffer, DoneCallback cb) override;
    void set_columns(std::vector<std::string> columns) override;
    std::vector<ColumnPtr> columns_for(const Adapter& adapter) const override;
    void maybe_set_cursor(WindowId window) override;
    void set_win_options(WindowId window) override;
    void restore_win_options(WindowId window) override;
    std::vector<BufferId> get_all_buffers() const override;
    void forget_buffer(BufferId buffer) override { _render_seq.erase(buffer); }

    // Parsed entry on a 1-based line of a rendered buffer
    std::optional<Entry> entry_on_line(BufferId buffer, int line) const;

private:
    DirectoryView() = default;

    Result<void> _apply_listing(BufferId buffer, const Url& url, const Adapter& adapter, std::vector<Entry> entries);

    std::shared_ptr<Host> _host;
    std::shared_ptr<AdapterRegistry> _registry;
    std::shared_ptr<EntryCache> _cache;
    std::shared_ptr<ViewStateStore> _view_state;
    std::shared_ptr<Config> _config;
    std::shared_ptr<NotificationBuffer> _notifications;
    std::map<BufferId, std::uint64_t> _render_seq;  // latest render request per buffer
};

using DirectoryViewPtr = std::shared_ptr<DirectoryView>;

} // namespace arbor
