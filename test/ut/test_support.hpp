// Shared fakes for the engine tests
#pragma once

#include "arbor/adapter.hpp"
#include "arbor/adapter_registry.hpp"
#include "arbor/dispatcher.hpp"
#include "arbor/engine.hpp"
#include "arbor/headless_host.hpp"
#include "arbor/mutator.hpp"
#include "arbor/url.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace arbor::test {

// In-memory adapter whose completions can be held back and failed on demand.
// Directories are keyed by path with trailing slash, files without.
class FakeAdapter : public Adapter {
public:
    explicit FakeAdapter(std::shared_ptr<Dispatcher> dispatcher) : _dispatcher(std::move(dispatcher)) {}

    const std::string& name() const override { return _name; }

    void list(const Url& url, ListCallback cb) override {
        ++list_calls;
        if (fail_list) {
            _complete([cb]() { cb(Err<std::vector<Entry>>("listing refused")); });
            return;
        }
        auto it = dirs.find(addslash(url.path()));
        if (it == dirs.end()) {
            _complete([cb, path = url.path()]() { cb(Err<std::vector<Entry>>("no such directory " + path)); });
            return;
        }
        _complete([cb, entries = it->second]() { cb(Ok(entries)); });
    }

    bool is_modifiable(const Url&) const override { return true; }
    ColumnPtr get_column(const std::string&) const override { return nullptr; }

    void normalize_url(const Url& url, NormalizeCallback cb) override {
        ++normalize_calls;
        if (fail_normalize) {
            _complete([cb]() { cb(Err<Url>("normalize refused")); });
            return;
        }
        Url out = url;
        std::string bare = url.path();
        if (bare.size() > 1 && bare.back() == '/') bare.pop_back();
        if (dirs.count(addslash(bare))) {
            out = url.with_path(addslash(bare));
        } else if (files.count(bare)) {
            out = url.with_path(bare);
        }
        _complete([cb, out]() { cb(Ok(out)); });
    }

    void read_file(const Url& url, ReadFileCallback cb) override {
        auto it = files.find(url.path());
        std::vector<std::string> lines = it == files.end() ? std::vector<std::string>{""} : it->second;
        _complete([cb, lines]() { cb(Ok(lines)); });
    }

    void write_file(const Url& url, const std::vector<std::string>& lines, DoneCallback cb) override {
        ++write_calls;
        if (fail_write) {
            _complete([cb]() { cb(Err<void>("disk full")); });
            return;
        }
        files[url.path()] = lines;
        _complete([cb]() { cb(Ok()); });
    }

    // Held completions run when released
    void release() {
        auto held = std::move(_held);
        _held.clear();
        for (auto& task : held) _dispatcher->defer(std::move(task));
    }

    bool hold = false;
    bool fail_list = false;
    bool fail_normalize = false;
    bool fail_write = false;
    int list_calls = 0;
    int normalize_calls = 0;
    int write_calls = 0;
    std::map<std::string, std::vector<Entry>> dirs;
    std::map<std::string, std::vector<std::string>> files;

private:
    void _complete(Task task) {
        if (hold) {
            _held.push_back(std::move(task));
        } else {
            _dispatcher->defer(std::move(task));
        }
    }

    std::string _name = "fake";
    std::shared_ptr<Dispatcher> _dispatcher;
    std::vector<Task> _held;
};

class FakeMutator : public Mutator {
public:
    explicit FakeMutator(std::shared_ptr<Dispatcher> dispatcher) : _dispatcher(std::move(dispatcher)) {}

    void try_write_changes(std::optional<bool> confirm, DoneCallback cb) override {
        ++calls;
        last_confirm = confirm;
        bool failing = fail;
        _dispatcher->defer([cb, failing]() {
            cb(failing ? Result<void>(Err<void>("mutation rejected")) : Ok());
        });
    }

    bool fail = false;
    int calls = 0;
    std::optional<bool> last_confirm;

private:
    std::shared_ptr<Dispatcher> _dispatcher;
};

inline Entry make_entry(std::string name, EntryType type = EntryType::File) {
    Entry entry;
    entry.name = std::move(name);
    entry.type = type;
    return entry;
}

inline const char* FAKE_YAML = R"(
adapters:
  "fake://": fake
adapter-aliases:
  "alias://": "fake://"
win-options:
  wrap: false
  number: false
)";

// One engine over a headless host, with a FakeAdapter behind fake://.
//   fake:///         a/  b.txt  c/
//   fake:///a/       inner.txt
//   fake:///c/       (empty)
struct Harness {
    std::shared_ptr<Dispatcher> dispatcher;
    std::shared_ptr<HeadlessHost> host;
    std::shared_ptr<FakeAdapter> fake;
    std::shared_ptr<FakeMutator> mutator;
    std::shared_ptr<Engine> engine;

    void drain() { dispatcher->run_pending(); }

    BufferId current_buffer() const { return host->window_buffer(host->current_window()); }

    // :edit name in the current window, then let every callback land
    BufferId open(const std::string& name) {
        auto res = host->edit(host->current_window(), name, false);
        drain();
        return res ? host->window_buffer(host->current_window()) : NO_BUFFER;
    }

    // 1-based line whose text ends with `suffix`; 0 when absent
    int line_of(BufferId buffer, const std::string& suffix) const {
        auto lines = host->get_lines(buffer);
        for (std::size_t i = 0; i < lines.size(); ++i) {
            const auto& l = lines[i];
            if (l.size() >= suffix.size() && l.compare(l.size() - suffix.size(), suffix.size(), suffix) == 0) {
                return static_cast<int>(i) + 1;
            }
        }
        return 0;
    }
};

inline Harness make_harness(const std::string& yaml = FAKE_YAML, bool with_mutator = true) {
    Harness h;
    h.dispatcher = *Dispatcher::create();
    h.host = *HeadlessHost::create(h.dispatcher, 120, 40);
    h.fake = std::make_shared<FakeAdapter>(h.dispatcher);
    h.fake->dirs["/"] = {make_entry("a", EntryType::Directory), make_entry("b.txt"), make_entry("c", EntryType::Directory)};
    h.fake->dirs["/a/"] = {make_entry("inner.txt")};
    h.fake->dirs["/c/"] = {};
    h.fake->files["/b.txt"] = {"hello", "world"};
    h.fake->files["/a/inner.txt"] = {"inner"};
    if (with_mutator) {
        h.mutator = std::make_shared<FakeMutator>(h.dispatcher);
    }

    EngineConfig config;
    config.config_yaml = yaml;
    config.mutator = h.mutator;
    auto engine_res = Engine::create(h.host, h.dispatcher, config);
    if (!engine_res) {
        return h;
    }
    h.engine = *engine_res;
    auto fake = h.fake;
    if (auto res = h.engine->registry()->register_factory("fake", [fake](std::shared_ptr<Dispatcher>) -> Result<AdapterPtr> {
            return fake;
        }); !res) {
        h.engine.reset();
        return h;
    }
    if (auto res = h.engine->setup(); !res) {
        h.engine.reset();
    }
    return h;
}

} // namespace arbor::test
