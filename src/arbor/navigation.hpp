#pragma once

#include "adapter.hpp"
#include "result.hpp"
#include "types.hpp"
#include "url.hpp"
#include <memory>
#include <optional>
#include <string>

namespace arbor {

class AdapterRegistry;
class Config;
class DirectoryView;
class EntryCache;
class FloatWindowManager;
class Host;
class LifecycleController;
class Mutator;
class NotificationBuffer;
class ViewStateStore;

struct SelectOptions {
    std::optional<bool> vertical;
    bool horizontal = false;
    std::optional<SplitModifier> split;
    bool preview = false;
};

// Directory to show, plus the child the cursor should land on
struct ParentUrl {
    std::string url;
    std::optional<std::string> basename;
};

// Navigator - turns cursor positions in directory buffers into addresses
// and opens them in the current window, splits, previews or a float.
// Refusals are notified to the user and returned as errors.
class Navigator {
public:
    static Result<std::shared_ptr<Navigator>> create(
        std::shared_ptr<Host> host,
        std::shared_ptr<AdapterRegistry> registry,
        std::shared_ptr<EntryCache> cache,
        std::shared_ptr<ViewStateStore> view_state,
        std::shared_ptr<Config> config,
        std::shared_ptr<DirectoryView> view,
        std::shared_ptr<LifecycleController> lifecycle,
        std::shared_ptr<FloatWindowManager> floats,
        std::shared_ptr<NotificationBuffer> notifications,
        std::shared_ptr<Mutator> mutator
    );

    std::optional<Entry> get_entry_on_line(BufferId buffer, int line) const;
    std::optional<Entry> get_cursor_entry() const;

    Result<void> select(SelectOptions opts = {});

    // dir empty: parent of the current buffer, or the cwd
    Result<void> open(const std::string& dir = "");
    Result<WindowId> open_float(const std::string& dir = "");
    Result<void> close();

    // Host path of the current buffer's directory; files adapter only
    std::optional<std::string> get_current_dir() const;
    std::optional<ParentUrl> get_url_for_path(const std::string& dir = "") const;
    std::optional<ParentUrl> get_buffer_parent_url(const std::string& bufname) const;

    void save(std::optional<bool> confirm, DoneCallback cb);
    void discard_all_changes();

private:
    Navigator() = default;

    std::optional<ParentUrl> _target(const std::string& dir);
    Result<void> _refuse(const std::string& message);

    std::shared_ptr<Host> _host;
    std::shared_ptr<AdapterRegistry> _registry;
    std::shared_ptr<EntryCache> _cache;
    std::shared_ptr<ViewStateStore> _view_state;
    std::shared_ptr<Config> _config;
    std::shared_ptr<DirectoryView> _view;
    std::shared_ptr<LifecycleController> _lifecycle;
    std::shared_ptr<FloatWindowManager> _floats;
    std::shared_ptr<NotificationBuffer> _notifications;
    std::shared_ptr<Mutator> _mutator;
};

using NavigatorPtr = std::shared_ptr<Navigator>;

} // namespace arbor
