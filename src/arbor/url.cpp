#include "url.hpp"
#include <algorithm>
#include <cctype>

namespace arbor {

Url Url::join(const std::string& name) const {
    return Url(_scheme, addslash(_path) + name);
}

std::optional<Url> parse_url(const std::string& raw) {
    auto pos = raw.find("://");
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    return Url(raw.substr(0, pos + 3), raw.substr(pos + 3));
}

std::string addslash(const std::string& path) {
    if (!path.empty() && path.back() == '/') {
        return path;
    }
    return path + "/";
}

Url addslash(const Url& url) {
    return url.with_path(addslash(url.path()));
}

std::string parent(const std::string& path) {
    if (path == "/" || path.empty()) {
        return "/";
    }
    std::string p = path;
    if (p.back() == '/') p.pop_back();
    auto pos = p.rfind('/');
    if (pos == std::string::npos) {
        // Relative single component
        return "";
    }
    return p.substr(0, pos + 1);
}

std::string basename(const std::string& path) {
    std::string p = path;
    if (!p.empty() && p.back() == '/') p.pop_back();
    auto pos = p.rfind('/');
    return pos == std::string::npos ? p : p.substr(pos + 1);
}

// "C:\foo\bar" -> "/C/foo/bar"
std::string windows_to_posix(const std::string& path) {
    std::string out = path;
    std::replace(out.begin(), out.end(), '\\', '/');
    if (out.size() >= 2 && std::isalpha(static_cast<unsigned char>(out[0])) && out[1] == ':') {
        std::string rest = out.substr(2);
        if (!rest.empty() && rest.front() == '/') rest.erase(0, 1);
        out = std::string("/") + out[0] + (rest.empty() ? std::string("/") : "/" + rest);
    }
    return out;
}

// "/C/foo/bar" -> "C:\foo\bar"
std::string posix_to_windows(const std::string& path) {
    if (path.size() >= 2 && path[0] == '/' && std::isalpha(static_cast<unsigned char>(path[1])) &&
        (path.size() == 2 || path[2] == '/')) {
        std::string rest = path.size() > 3 ? path.substr(3) : "";
        std::replace(rest.begin(), rest.end(), '/', '\\');
        return std::string(1, static_cast<char>(std::toupper(static_cast<unsigned char>(path[1])))) + ":\\" + rest;
    }
    std::string out = path;
    std::replace(out.begin(), out.end(), '/', '\\');
    return out;
}

std::string to_host_path(const std::string& path) {
#ifdef _WIN32
    return posix_to_windows(path);
#else
    return path;
#endif
}

std::string from_host_path(const std::string& path) {
#ifdef _WIN32
    return windows_to_posix(path);
#else
    return path;
#endif
}

} // namespace arbor
