#pragma once

#include <optional>
#include <string>

namespace arbor {

// Url - scheme-qualified address of a node in some storage tree.
// The scheme keeps its "://" suffix, the path is always slash separated.
// Directory urls end with '/', file urls never do.
class Url {
public:
    Url() = default;
    Url(std::string scheme, std::string path)
        : _scheme(std::move(scheme)), _path(std::move(path)) {}

    const std::string& scheme() const { return _scheme; }
    const std::string& path() const { return _path; }

    bool is_directory() const { return !_path.empty() && _path.back() == '/'; }
    std::string to_string() const { return _scheme + _path; }

    // Child address; a directory child is given with its trailing slash
    Url join(const std::string& name) const;
    Url with_scheme(std::string scheme) const { return Url(std::move(scheme), _path); }
    Url with_path(std::string path) const { return Url(_scheme, std::move(path)); }

    bool operator==(const Url& other) const {
        return _scheme == other._scheme && _path == other._path;
    }
    bool operator!=(const Url& other) const { return !(*this == other); }

private:
    std::string _scheme;
    std::string _path;
};

// Split at the first "://". No scheme -> nullopt (plain host path).
std::optional<Url> parse_url(const std::string& raw);

// Idempotent: addslash(addslash(x)) == addslash(x)
std::string addslash(const std::string& path);
Url addslash(const Url& url);

// Parent directory of a normalized path, with trailing slash. "/" is its own parent.
std::string parent(const std::string& path);
// Last component without trailing slash
std::string basename(const std::string& path);

// Platform path <-> normalized slash path
std::string windows_to_posix(const std::string& path);
std::string posix_to_windows(const std::string& path);
std::string to_host_path(const std::string& path);
std::string from_host_path(const std::string& path);

} // namespace arbor
