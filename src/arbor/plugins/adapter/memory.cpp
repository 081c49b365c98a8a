// memory adapter plugin - a scratch tree that lives in process memory
// Paths are kept without trailing slash ("/" is the root directory):
// - directories have children
// - files carry their lines
// Every operation completes as a deferred dispatcher task.
#include "../../adapter.hpp"
#include "../../columns.hpp"
#include "../../dispatcher.hpp"
#include "../../result.hpp"
#include <ytrace/ytrace.hpp>
#include <map>
#include <sstream>

namespace arbor::plugins {

class MemoryAdapter : public Adapter {
public:
    static Result<AdapterPtr> create(std::shared_ptr<Dispatcher> dispatcher) {
        if (!dispatcher) {
            return Err<AdapterPtr>("MemoryAdapter::create: dispatcher is required");
        }
        auto adapter = std::make_shared<MemoryAdapter>();
        adapter->_dispatcher = std::move(dispatcher);
        if (auto res = adapter->init(); !res) {
            return Err<AdapterPtr>("MemoryAdapter::create failed", res);
        }
        return adapter;
    }

    Result<void> init() override {
        _nodes["/"] = Node{EntryType::Directory, {}};
        _size_column = std::make_shared<TokenColumn>("size", 1, [](const Entry& e) {
            auto size = get_as<std::uint64_t>(e.meta, "size");
            if (!size || e.type == EntryType::Directory) return std::string("-");
            return format_size(*size);
        });
        return Ok();
    }

    const std::string& name() const override { return _name; }

    void list(const Url& url, ListCallback cb) override {
        _dispatcher->defer([weak = weak_from_this(), url, cb = std::move(cb)]() {
            auto self = _lock(weak);
            if (!self) {
                cb(Err<std::vector<Entry>>("MemoryAdapter: disposed before listing " + url.to_string()));
                return;
            }
            cb(self->_list(_key(url.path())));
        });
    }

    bool is_modifiable(const Url& /*url*/) const override { return true; }

    ColumnPtr get_column(const std::string& name) const override {
        return name == "size" ? _size_column : nullptr;
    }

    void normalize_url(const Url& url, NormalizeCallback cb) override {
        _dispatcher->defer([weak = weak_from_this(), url, cb = std::move(cb)]() {
            auto self = _lock(weak);
            if (!self) {
                cb(Err<Url>("MemoryAdapter: disposed before normalizing " + url.to_string()));
                return;
            }
            cb(self->_normalize(url));
        });
    }

    void read_file(const Url& url, ReadFileCallback cb) override {
        _dispatcher->defer([weak = weak_from_this(), url, cb = std::move(cb)]() {
            auto self = _lock(weak);
            if (!self) {
                cb(Err<std::vector<std::string>>("MemoryAdapter: disposed before reading " + url.to_string()));
                return;
            }
            auto it = self->_nodes.find(_key(url.path()));
            if (it == self->_nodes.end()) {
                // New file: empty content
                cb(Ok(std::vector<std::string>{""}));
                return;
            }
            if (it->second.type == EntryType::Directory) {
                cb(Err<std::vector<std::string>>("MemoryAdapter: " + url.path() + " is a directory"));
                return;
            }
            cb(Ok(it->second.lines));
        });
    }

    void write_file(const Url& url, const std::vector<std::string>& lines, DoneCallback cb) override {
        _dispatcher->defer([weak = weak_from_this(), url, lines, cb = std::move(cb)]() {
            auto self = _lock(weak);
            if (!self) {
                cb(Err<void>("MemoryAdapter: disposed before writing " + url.to_string()));
                return;
            }
            std::string key = _key(url.path());
            if (!self->_is_directory(_parent_key(key))) {
                cb(Err<void>("MemoryAdapter: no parent directory for " + url.path()));
                return;
            }
            if (self->_is_directory(key)) {
                cb(Err<void>("MemoryAdapter: " + url.path() + " is a directory"));
                return;
            }
            self->_nodes[key] = Node{EntryType::File, lines};
            cb(Ok());
        });
    }

    bool supports(Capability cap) const override {
        return cap == Capability::GetParent || cap == Capability::Actions;
    }

    Result<Url> get_parent(const Url& url) const override {
        return Ok(url.with_path(parent(url.path())));
    }

    Result<std::string> render_action(const Action& action) const override {
        switch (action.type) {
            case ActionType::Create:
                return Ok("CREATE " + action.url.to_string());
            case ActionType::Delete:
                return Ok("DELETE " + action.url.to_string());
            case ActionType::Move:
                return Ok("MOVE " + action.src_url.to_string() + " -> " + action.dest_url.to_string());
            case ActionType::Copy:
                return Ok("COPY " + action.src_url.to_string() + " -> " + action.dest_url.to_string());
            case ActionType::Change:
                break;
        }
        return Err<std::string>("MemoryAdapter: unsupported action " + std::string(to_string(action.type)));
    }

    void perform_action(const Action& action, DoneCallback cb) override {
        _dispatcher->defer([weak = weak_from_this(), action, cb = std::move(cb)]() {
            auto self = _lock(weak);
            if (!self) {
                cb(Err<void>("MemoryAdapter: disposed before " + std::string(to_string(action.type))));
                return;
            }
            cb(self->_apply(action));
        });
    }

private:
    struct Node {
        EntryType type = EntryType::File;
        std::vector<std::string> lines;
    };

    static std::shared_ptr<MemoryAdapter> _lock(const std::weak_ptr<Adapter>& weak) {
        return std::static_pointer_cast<MemoryAdapter>(weak.lock());
    }

    // "/a/b/" -> "/a/b", resolving "." and ".." components
    static std::string _key(const std::string& path) {
        std::vector<std::string> parts;
        std::stringstream ss(path);
        std::string part;
        while (std::getline(ss, part, '/')) {
            if (part.empty() || part == ".") continue;
            if (part == "..") {
                if (!parts.empty()) parts.pop_back();
                continue;
            }
            parts.push_back(part);
        }
        std::string out;
        for (const auto& p : parts) out += "/" + p;
        return out.empty() ? "/" : out;
    }

    static std::string _parent_key(const std::string& key) {
        return _key(parent(key));
    }

    bool _is_directory(const std::string& key) const {
        auto it = _nodes.find(key);
        return it != _nodes.end() && it->second.type == EntryType::Directory;
    }

    std::vector<std::string> _children(const std::string& key) const {
        std::vector<std::string> out;
        std::string prefix = key == "/" ? "/" : key + "/";
        for (auto it = _nodes.lower_bound(prefix); it != _nodes.end(); ++it) {
            const std::string& k = it->first;
            if (k.compare(0, prefix.size(), prefix) != 0) break;
            if (k.size() > prefix.size() && k.find('/', prefix.size()) == std::string::npos) {
                out.push_back(k);
            }
        }
        return out;
    }

    Result<std::vector<Entry>> _list(const std::string& key) const {
        if (!_is_directory(key)) {
            return Err<std::vector<Entry>>("MemoryAdapter: not a directory: " + key);
        }
        std::vector<Entry> entries;
        for (const auto& child : _children(key)) {
            const Node& node = _nodes.at(child);
            Entry entry;
            entry.name = basename(child);
            entry.type = node.type;
            std::uint64_t size = 0;
            for (const auto& line : node.lines) size += line.size() + 1;
            entry.meta["size"] = size;
            entries.push_back(std::move(entry));
        }
        return Ok(entries);
    }

    Result<Url> _normalize(const Url& url) const {
        std::string key = _key(url.path());
        bool is_dir;
        if (auto it = _nodes.find(key); it != _nodes.end()) {
            is_dir = it->second.type == EntryType::Directory;
        } else {
            is_dir = url.is_directory();
        }
        return Ok(url.with_path(is_dir ? addslash(key) : key));
    }

    Result<void> _apply(const Action& action) {
        switch (action.type) {
            case ActionType::Create: {
                std::string key = _key(action.url.path());
                if (_nodes.count(key)) {
                    return Err<void>("MemoryAdapter: already exists: " + key);
                }
                if (!_is_directory(_parent_key(key))) {
                    return Err<void>("MemoryAdapter: no parent directory for " + key);
                }
                if (action.entry_type != EntryType::File && action.entry_type != EntryType::Directory) {
                    return Err<void>(std::string("MemoryAdapter: cannot create ") + to_string(action.entry_type));
                }
                _nodes[key] = Node{action.entry_type, {}};
                ydebug("MemoryAdapter: created {}", key);
                return Ok();
            }
            case ActionType::Delete: {
                std::string key = _key(action.url.path());
                if (key == "/") {
                    return Err<void>("MemoryAdapter: cannot delete the root");
                }
                _erase_subtree(key);
                return Ok();
            }
            case ActionType::Move:
            case ActionType::Copy: {
                std::string src = _key(action.src_url.path());
                std::string dest = _key(action.dest_url.path());
                if (!_nodes.count(src)) {
                    return Err<void>("MemoryAdapter: no such entry: " + src);
                }
                if (_nodes.count(dest)) {
                    return Err<void>("MemoryAdapter: target exists: " + dest);
                }
                if (!_is_directory(_parent_key(dest))) {
                    return Err<void>("MemoryAdapter: no parent directory for " + dest);
                }
                if (dest.compare(0, src.size() + 1, src + "/") == 0) {
                    return Err<void>("MemoryAdapter: cannot move " + src + " into itself");
                }
                std::map<std::string, Node> moved;
                moved[dest] = _nodes[src];
                std::string prefix = src + "/";
                for (auto it = _nodes.lower_bound(prefix); it != _nodes.end() && it->first.compare(0, prefix.size(), prefix) == 0; ++it) {
                    moved[dest + it->first.substr(src.size())] = it->second;
                }
                if (action.type == ActionType::Move) {
                    _erase_subtree(src);
                }
                _nodes.insert(moved.begin(), moved.end());
                return Ok();
            }
            case ActionType::Change:
                break;
        }
        return Err<void>("MemoryAdapter: unsupported action " + std::string(to_string(action.type)));
    }

    void _erase_subtree(const std::string& key) {
        _nodes.erase(key);
        std::string prefix = key + "/";
        auto it = _nodes.lower_bound(prefix);
        while (it != _nodes.end() && it->first.compare(0, prefix.size(), prefix) == 0) {
            it = _nodes.erase(it);
        }
    }

    std::string _name = "memory";
    std::shared_ptr<Dispatcher> _dispatcher;
    std::map<std::string, Node> _nodes;
    ColumnPtr _size_column;
};

} // namespace arbor::plugins

extern "C" const char* name() { return "memory"; }
extern "C" const char* type() { return "adapter"; }
extern "C" arbor::Result<arbor::AdapterPtr> create(std::shared_ptr<arbor::Dispatcher> dispatcher) {
    return arbor::plugins::MemoryAdapter::create(std::move(dispatcher));
}
