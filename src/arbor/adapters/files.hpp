// Local filesystem adapter
#pragma once

#include "../adapter.hpp"
#include "../result.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <string>

namespace arbor {
class Dispatcher;
}

namespace arbor::adapters {

/**
 * FilesAdapter - the local filesystem as an adapter.
 * Urls carry normalized posix paths ("arbor:///home/user/"); every operation
 * runs as a deferred task on the dispatcher so callers always see an
 * asynchronous completion, like with a remote backend.
 * Columns: permissions, size, mtime.
 */
class FilesAdapter : public Adapter {
public:
    static Result<AdapterPtr> create(std::shared_ptr<Dispatcher> dispatcher);

    const std::string& name() const override { return _name; }

    void list(const Url& url, ListCallback cb) override;
    bool is_modifiable(const Url& url) const override;
    ColumnPtr get_column(const std::string& name) const override;
    void normalize_url(const Url& url, NormalizeCallback cb) override;
    void read_file(const Url& url, ReadFileCallback cb) override;
    void write_file(const Url& url, const std::vector<std::string>& lines, DoneCallback cb) override;

    bool supports(Capability cap) const override { return cap == Capability::Actions; }
    Result<std::string> render_action(const Action& action) const override;
    void perform_action(const Action& action, DoneCallback cb) override;

    Result<void> init() override;

    // Synchronous cores, exposed for the deferred tasks and for tests
    static Result<std::vector<Entry>> list_directory(const std::filesystem::path& dir);
    static Result<Url> normalize(const Url& url);
    static Result<std::vector<std::string>> read_lines(const std::filesystem::path& path);
    static Result<void> write_lines(const std::filesystem::path& path, const std::vector<std::string>& lines);
    static Result<void> apply(const Action& action);

private:
    std::string _name = "files";
    std::shared_ptr<Dispatcher> _dispatcher;
    std::map<std::string, ColumnPtr> _columns;
};

} // namespace arbor::adapters
