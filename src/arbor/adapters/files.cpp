// Local filesystem adapter - Implementation
#include "files.hpp"
#include "../columns.hpp"
#include "../dispatcher.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <fstream>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace arbor::adapters {

namespace {

// Closes the descriptor on every exit path
class UniqueFd {
public:
    explicit UniqueFd(int fd) : _fd(fd) {}
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    ~UniqueFd() { reset(); }
    int get() const { return _fd; }
    bool valid() const { return _fd >= 0; }
    void reset() {
        if (_fd >= 0) {
            ::close(_fd);
            _fd = -1;
        }
    }

private:
    int _fd;
};

std::string errno_msg() {
    return std::strerror(errno);
}

fs::path host_path(const Url& url) {
    std::string p = to_host_path(url.path());
    if (p.size() > 1 && p.back() == '/') p.pop_back();
    return fs::path(p);
}

std::string format_mtime(std::int64_t secs) {
    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    char out[32];
    std::strftime(out, sizeof(out), "%Y-%m-%d %H:%M", &tm_buf);
    return out;
}

} // namespace

Result<AdapterPtr> FilesAdapter::create(std::shared_ptr<Dispatcher> dispatcher) {
    if (!dispatcher) {
        return Err<AdapterPtr>("FilesAdapter::create: dispatcher is required");
    }
    auto adapter = std::make_shared<FilesAdapter>();
    adapter->_dispatcher = std::move(dispatcher);
    if (auto res = adapter->init(); !res) {
        return Err<AdapterPtr>("FilesAdapter::create failed", res);
    }
    return adapter;
}

Result<void> FilesAdapter::init() {
    _columns["permissions"] = std::make_shared<TokenColumn>("permissions", 1, [](const Entry& e) {
        auto mode = get_as<unsigned>(e.meta, "mode");
        return mode ? format_permissions(*mode) : std::string("---------");
    });
    _columns["size"] = std::make_shared<TokenColumn>("size", 1, [](const Entry& e) {
        auto size = get_as<std::uint64_t>(e.meta, "size");
        if (!size || e.type == EntryType::Directory) return std::string("-");
        return format_size(*size);
    });
    _columns["mtime"] = std::make_shared<TokenColumn>("mtime", 2, [](const Entry& e) {
        auto mtime = get_as<std::int64_t>(e.meta, "mtime");
        return mtime ? format_mtime(*mtime) : std::string("- -");
    });
    return Ok();
}

void FilesAdapter::list(const Url& url, ListCallback cb) {
    _dispatcher->defer([url, cb = std::move(cb)]() {
        cb(list_directory(host_path(url)));
    });
}

bool FilesAdapter::is_modifiable(const Url& url) const {
    auto dir = url.is_directory() ? host_path(url) : host_path(url).parent_path();
    return ::access(dir.c_str(), W_OK) == 0;
}

ColumnPtr FilesAdapter::get_column(const std::string& name) const {
    auto it = _columns.find(name);
    return it == _columns.end() ? nullptr : it->second;
}

void FilesAdapter::normalize_url(const Url& url, NormalizeCallback cb) {
    _dispatcher->defer([url, cb = std::move(cb)]() {
        cb(normalize(url));
    });
}

void FilesAdapter::read_file(const Url& url, ReadFileCallback cb) {
    _dispatcher->defer([url, cb = std::move(cb)]() {
        cb(read_lines(host_path(url)));
    });
}

void FilesAdapter::write_file(const Url& url, const std::vector<std::string>& lines, DoneCallback cb) {
    _dispatcher->defer([url, lines, cb = std::move(cb)]() {
        cb(write_lines(host_path(url), lines));
    });
}

Result<std::string> FilesAdapter::render_action(const Action& action) const {
    switch (action.type) {
        case ActionType::Create:
            return Ok("CREATE " + action.url.path() + (action.entry_type == EntryType::Directory ? "/" : ""));
        case ActionType::Delete:
            return Ok("DELETE " + action.url.path());
        case ActionType::Move:
            return Ok("MOVE " + action.src_url.path() + " -> " + action.dest_url.path());
        case ActionType::Copy:
            return Ok("COPY " + action.src_url.path() + " -> " + action.dest_url.path());
        case ActionType::Change: {
            auto value = get_as<std::string>(action.value).value_or("?");
            return Ok("CHANGE " + action.url.path() + " " + action.column + "=" + value);
        }
    }
    return Err<std::string>("FilesAdapter::render_action: unknown action");
}

void FilesAdapter::perform_action(const Action& action, DoneCallback cb) {
    _dispatcher->defer([action, cb = std::move(cb)]() {
        cb(apply(action));
    });
}

Result<std::vector<Entry>> FilesAdapter::list_directory(const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Err<std::vector<Entry>>("FilesAdapter: not a directory: " + dir.string());
    }

    std::vector<Entry> entries;
    for (const auto& de : fs::directory_iterator(dir, ec)) {
        Entry entry;
        entry.name = de.path().filename().string();

        struct stat st{};
        if (::lstat(de.path().c_str(), &st) != 0) {
            spdlog::debug("FilesAdapter: lstat {} failed: {}", de.path().string(), errno_msg());
            continue;
        }
        if (S_ISDIR(st.st_mode)) {
            entry.type = EntryType::Directory;
        } else if (S_ISLNK(st.st_mode)) {
            entry.type = EntryType::Link;
            std::error_code lec;
            auto target = fs::read_symlink(de.path(), lec);
            entry.meta["link"] = lec ? std::string() : target.string();
            struct stat target_st{};
            if (::stat(de.path().c_str(), &target_st) == 0) {
                entry.meta["link_type"] = std::string(S_ISDIR(target_st.st_mode) ? "directory" : "file");
            }
        } else if (S_ISSOCK(st.st_mode)) {
            entry.type = EntryType::Socket;
        } else {
            entry.type = EntryType::File;
        }
        entry.meta["mode"] = static_cast<unsigned>(st.st_mode & 0777);
        entry.meta["size"] = static_cast<std::uint64_t>(st.st_size);
        entry.meta["mtime"] = static_cast<std::int64_t>(st.st_mtime);
        entries.push_back(std::move(entry));
    }
    if (ec) {
        return Err<std::vector<Entry>>("FilesAdapter: cannot list " + dir.string() + ": " + ec.message());
    }
    return Ok(entries);
}

Result<Url> FilesAdapter::normalize(const Url& url) {
    std::string raw = to_host_path(url.path());
    bool had_slash = !raw.empty() && raw.back() == '/';
    if (raw.empty()) raw = "/";

    std::error_code ec;
    fs::path p = fs::absolute(fs::path(raw), ec);
    if (ec) {
        return Err<Url>("FilesAdapter::normalize: cannot make absolute: " + raw);
    }
    fs::path real = fs::weakly_canonical(p, ec);
    if (ec) real = p.lexically_normal();

    std::string norm = from_host_path(real.string());
    if (norm.size() > 1 && norm.back() == '/') norm.pop_back();

    bool is_directory;
    if (fs::exists(real, ec)) {
        is_directory = fs::is_directory(real, ec);
    } else if (had_slash) {
        is_directory = true;
    } else {
        // Unknown path: names with an extension are taken as files
        is_directory = !real.has_extension();
    }
    return Ok(Url(url.scheme(), is_directory ? addslash(norm) : norm));
}

Result<std::vector<std::string>> FilesAdapter::read_lines(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Err<std::vector<std::string>>("FilesAdapter: cannot open " + path.string());
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    if (lines.empty()) lines.emplace_back("");
    return Ok(lines);
}

// Write to a sibling temp file, flush to disk, then rename over the target
Result<void> FilesAdapter::write_lines(const fs::path& path, const std::vector<std::string>& lines) {
    fs::path tmp = path;
    tmp += ".arbor-tmp";

    UniqueFd fd(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
    if (!fd.valid()) {
        return Err<void>("FilesAdapter: cannot create " + tmp.string() + ": " + errno_msg());
    }

    std::string data;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        data += lines[i];
        data += '\n';
    }
    const char* p = data.data();
    std::size_t remain = data.size();
    while (remain > 0) {
        ssize_t w = ::write(fd.get(), p, remain);
        if (w < 0) {
            if (errno == EINTR) continue;
            std::string msg = errno_msg();
            fd.reset();
            fs::remove(tmp);
            return Err<void>("FilesAdapter: write failed for " + tmp.string() + ": " + msg);
        }
        p += w;
        remain -= static_cast<std::size_t>(w);
    }
#if defined(__APPLE__)
    int synced = ::fsync(fd.get());
#else
    int synced = ::fdatasync(fd.get());
#endif
    if (synced != 0) {
        std::string msg = errno_msg();
        fd.reset();
        fs::remove(tmp);
        return Err<void>("FilesAdapter: sync failed for " + tmp.string() + ": " + msg);
    }
    fd.reset();

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return Err<void>("FilesAdapter: cannot replace " + path.string());
    }
    return Ok();
}

static Result<fs::perms> parse_permissions(const std::string& text) {
    if (text.size() != 9) {
        return Err<fs::perms>("bad permission string '" + text + "'");
    }
    const char* flags = "rwxrwxrwx";
    unsigned mode = 0;
    for (int i = 0; i < 9; ++i) {
        if (text[i] == flags[i]) {
            mode |= 1u << (8 - i);
        } else if (text[i] != '-') {
            return Err<fs::perms>("bad permission string '" + text + "'");
        }
    }
    return Ok(static_cast<fs::perms>(mode));
}

Result<void> FilesAdapter::apply(const Action& action) {
    std::error_code ec;
    switch (action.type) {
        case ActionType::Create: {
            auto path = host_path(action.url);
            if (fs::exists(fs::symlink_status(path, ec))) {
                return Err<void>("FilesAdapter: already exists: " + path.string());
            }
            if (action.entry_type == EntryType::Directory) {
                fs::create_directories(path, ec);
            } else if (action.entry_type == EntryType::File) {
                std::ofstream out(path);
                if (!out) return Err<void>("FilesAdapter: cannot create " + path.string());
            } else {
                return Err<void>(std::string("FilesAdapter: cannot create entries of type ") + to_string(action.entry_type));
            }
            break;
        }
        case ActionType::Delete:
            fs::remove_all(host_path(action.url), ec);
            break;
        case ActionType::Move: {
            auto dest = host_path(action.dest_url);
            if (fs::exists(fs::symlink_status(dest, ec))) {
                return Err<void>("FilesAdapter: move target exists: " + dest.string());
            }
            fs::create_directories(dest.parent_path(), ec);
            fs::rename(host_path(action.src_url), dest, ec);
            break;
        }
        case ActionType::Copy: {
            auto dest = host_path(action.dest_url);
            if (fs::exists(fs::symlink_status(dest, ec))) {
                return Err<void>("FilesAdapter: copy target exists: " + dest.string());
            }
            fs::copy(host_path(action.src_url), dest,
                     fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
            break;
        }
        case ActionType::Change: {
            if (action.column != "permissions") {
                return Err<void>("FilesAdapter: column '" + action.column + "' cannot be changed");
            }
            auto perms = parse_permissions(get_as<std::string>(action.value).value_or(""));
            if (!perms) {
                return Err<void>("FilesAdapter: change failed", perms);
            }
            fs::permissions(host_path(action.url), *perms, ec);
            break;
        }
    }
    if (ec) {
        return Err<void>(std::string("FilesAdapter: ") + to_string(action.type) + " failed: " + ec.message());
    }
    return Ok();
}

} // namespace arbor::adapters
