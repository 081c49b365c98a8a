#include "view.hpp"
#include "adapter_registry.hpp"
#include "columns.hpp"
#include "config.hpp"
#include "entry_cache.hpp"
#include "entry_parser.hpp"
#include "host.hpp"
#include "notifications.hpp"
#include "view_state.hpp"
#include <spdlog/spdlog.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>

namespace arbor {

Result<std::shared_ptr<DirectoryView>> DirectoryView::create(
    std::shared_ptr<Host> host,
    std::shared_ptr<AdapterRegistry> registry,
    std::shared_ptr<EntryCache> cache,
    std::shared_ptr<ViewStateStore> view_state,
    std::shared_ptr<Config> config,
    std::shared_ptr<NotificationBuffer> notifications
) {
    if (!host || !registry || !cache || !view_state || !config || !notifications) {
        return Err<std::shared_ptr<DirectoryView>>("DirectoryView::create: missing collaborator");
    }
    auto view = std::shared_ptr<DirectoryView>(new DirectoryView());
    view->_host = std::move(host);
    view->_registry = std::move(registry);
    view->_cache = std::move(cache);
    view->_view_state = std::move(view_state);
    view->_config = std::move(config);
    view->_notifications = std::move(notifications);
    return view;
}

void DirectoryView::initialize(BufferId buffer) {
    _host->set_filetype(buffer, FILETYPE);
    _host->set_buftype(buffer, "acwrite");
    _host->set_bufhidden(buffer, "hide");

    std::string name = _host->buffer_name(buffer);
    auto notifications = _notifications;
    render_buffer_async(buffer, [notifications, name](Result<void> res) {
        if (!res) {
            notifications->error_from_result("Error rendering " + name, res);
        }
    });
}

void DirectoryView::render_buffer_async(BufferId buffer, DoneCallback cb) {
    std::string name = _host->buffer_name(buffer);
    auto url = _registry->parse(name);
    if (!url) {
        cb(Err<void>("DirectoryView: not a directory buffer: " + name));
        return;
    }
    auto adapter = _registry->get_adapter(*url);
    if (!adapter) {
        cb(Err<void>("DirectoryView: no adapter for " + url->scheme()));
        return;
    }

    std::uint64_t seq = ++_render_seq[buffer];
    std::weak_ptr<DirectoryView> weak = shared_from_this();
    adapter->list(*url, [weak, buffer, name, seq, target = *url, adapter, cb = std::move(cb)](Result<std::vector<Entry>> res) {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        // The buffer may be gone, renamed, or re-rendered since the request
        auto latest = self->_render_seq.find(buffer);
        if (!self->_host->buffer_valid(buffer) || self->_host->buffer_name(buffer) != name ||
            latest == self->_render_seq.end() || latest->second != seq) {
            ydebug("DirectoryView: dropping stale listing for {}", name);
            return;
        }
        if (!res) {
            cb(Err<void>("could not list " + target.to_string(), res));
            return;
        }
        cb(self->_apply_listing(buffer, target, *adapter, std::move(*res)));
    });
}

Result<void> DirectoryView::_apply_listing(BufferId buffer, const Url& url, const Adapter& adapter, std::vector<Entry> entries) {
    entries = _cache->store_entries(url, std::move(entries));
    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        bool a_dir = a.is_directory_like();
        bool b_dir = b.is_directory_like();
        if (a_dir != b_dir) return a_dir;
        return a.name < b.name;
    });

    auto columns = columns_for(adapter);
    std::vector<std::string> lines;
    lines.reserve(entries.size());
    for (const auto& entry : entries) {
        lines.push_back(render_entry_line(entry, columns));
    }
    _host->set_lines(buffer, std::move(lines));
    _host->set_modified(buffer, false);

    for (WindowId window : _host->all_windows()) {
        if (_host->window_buffer(window) == buffer) {
            maybe_set_cursor(window);
        }
    }
    return Ok();
}

void DirectoryView::set_columns(std::vector<std::string> columns) {
    _config->set_columns(std::move(columns));
    for (BufferId buffer : get_all_buffers()) {
        std::string name = _host->buffer_name(buffer);
        auto notifications = _notifications;
        render_buffer_async(buffer, [notifications, name](Result<void> res) {
            if (!res) {
                notifications->error_from_result("Error rendering " + name, res);
            }
        });
    }
}

std::vector<ColumnPtr> DirectoryView::columns_for(const Adapter& adapter) const {
    return get_supported_columns(adapter, _config->columns());
}

std::optional<Entry> DirectoryView::entry_on_line(BufferId buffer, int line) const {
    if (_host->filetype(buffer) != FILETYPE) {
        return std::nullopt;
    }
    auto url = _registry->parse(_host->buffer_name(buffer));
    if (!url) {
        return std::nullopt;
    }
    auto adapter = _registry->get_adapter(*url);
    if (!adapter) {
        return std::nullopt;
    }
    auto lines = _host->get_lines(buffer);
    if (line < 1 || line > static_cast<int>(lines.size())) {
        return std::nullopt;
    }
    return parse_entry(lines[line - 1], columns_for(*adapter), *_cache);
}

void DirectoryView::maybe_set_cursor(WindowId window) {
    BufferId buffer = _host->window_buffer(window);
    auto url = _registry->parse(_host->buffer_name(buffer));
    if (!url) {
        return;
    }
    auto hint = _view_state->last_cursor(*url);
    if (!hint) {
        return;
    }

    int count = _host->line_count(buffer);
    if (hint->name.empty()) {
        if (hint->line > 0 && hint->line <= count) {
            _host->set_cursor(window, Cursor{hint->line, 0});
            _view_state->take_last_cursor(*url);
        }
        return;
    }

    auto lines = _host->get_lines(buffer);
    for (int lnum = 1; lnum <= count; ++lnum) {
        auto entry = entry_on_line(buffer, lnum);
        if (entry && entry->name == hint->name) {
            const std::string& text = lines[lnum - 1];
            auto col = text.rfind(" " + entry->name);
            _host->set_cursor(window, Cursor{lnum, col == std::string::npos ? 0 : static_cast<int>(col) + 1});
            _view_state->take_last_cursor(*url);
            return;
        }
    }
}

void DirectoryView::set_win_options(WindowId window) {
    auto& record = _view_state->ensure(window);
    for (const auto& [name, value] : _config->win_options()) {
        if (!record.saved_win_options.count(name)) {
            record.saved_win_options[name] = _host->window_option(window, name);
        }
        _host->set_window_option(window, name, value);
    }
}

void DirectoryView::restore_win_options(WindowId window) {
    auto* record = _view_state->find(window);
    if (!record) {
        return;
    }
    for (const auto& [name, value] : record->saved_win_options) {
        _host->set_window_option(window, name, value);
    }
    record->saved_win_options.clear();
}

std::vector<BufferId> DirectoryView::get_all_buffers() const {
    std::vector<BufferId> out;
    for (BufferId buffer : _host->list_buffers()) {
        if (_host->filetype(buffer) == FILETYPE) {
            out.push_back(buffer);
        }
    }
    return out;
}

} // namespace arbor
