#pragma once
#include <string>
#include <vector>

namespace Burrow {
namespace Utils {

/// A url split once into the pieces a scan works with. `path` always starts with '/'.
struct UrlParts {
    std::string scheme;
    std::string host;  // IPv6 literals keep their brackets
    std::string port;
    std::string path = "/";
    std::string query;
    std::string fragment;

    /// scheme://host[:port], without a trailing slash.
    std::string origin() const;
    /// Origin plus the path up to and including its last '/'.
    std::string directory() const;
    /// Last path segment; empty when the path ends in '/'.
    std::string filename() const;
};

class Url {
public:
    static UrlParts    parse(const std::string& url);
    /// Absolute form of `relative` against `base`; empty for non-http schemes (mailto:, javascript:).
    static std::string resolve(const std::string& base, const std::string& relative);

    static std::string origin(const std::string& url);
    /// The url with exactly one trailing slash and no query or fragment.
    static std::string as_directory(const std::string& url);
    static std::string directory_of(const std::string& url);
    /// Appends a wordlist entry to a directory url.
    static std::string join(const std::string& directory, const std::string& word);
    /// True when the last path segment carries a dot, e.g. "index.html".
    static bool        has_extension(const std::string& url);
    /// "app.min.js" -> "js". Dot files such as ".htaccess" have none.
    static std::string extension(const std::string& url);
    /// "/a/b/c.js" -> ["/a/", "/a/b/", "/a/b/c.js"], as absolute urls.
    static std::vector<std::string> sub_paths(const std::string& url);
};

}  // namespace Utils
}  // namespace Burrow
