#include "url.hpp"
#include <algorithm>
#include <string_view>

namespace Burrow {
namespace Utils {

namespace {

constexpr auto npos = std::string_view::npos;

void split_authority(std::string_view authority, UrlParts& parts) {
    size_t at = authority.rfind('@');
    if (at != npos)
        authority.remove_prefix(at + 1);

    size_t colon   = authority.rfind(':');
    size_t bracket = authority.rfind(']');
    if (colon != npos && (bracket == npos || colon > bracket)) {
        parts.host = std::string(authority.substr(0, colon));
        parts.port = std::string(authority.substr(colon + 1));
    } else {
        parts.host = std::string(authority);
    }
}

// Drops "." and empty segments and applies "..". A trailing slash survives.
std::string normalize_path(std::string_view path) {
    std::vector<std::string_view> kept;
    bool                          trailing = false;

    size_t start = 0;
    while (start <= path.size()) {
        size_t           end     = std::min(path.find('/', start), path.size());
        std::string_view segment = path.substr(start, end - start);

        trailing = segment.empty() || segment == "." || segment == "..";
        if (segment == "..") {
            if (!kept.empty())
                kept.pop_back();
        } else if (!segment.empty() && segment != ".") {
            kept.push_back(segment);
        }
        start = end + 1;
    }

    std::string out;
    for (auto segment : kept) {
        out += '/';
        out += segment;
    }
    if (out.empty() || trailing)
        out += '/';
    return out;
}

}  // namespace

std::string UrlParts::origin() const {
    std::string result = scheme + "://" + host;
    if (!port.empty())
        result += ":" + port;
    return result;
}

std::string UrlParts::directory() const {
    return origin() + path.substr(0, path.rfind('/') + 1);
}

std::string UrlParts::filename() const {
    return path.substr(path.rfind('/') + 1);
}

UrlParts Url::parse(const std::string& url) {
    UrlParts         parts;
    std::string_view rest = url;

    size_t hash = rest.find('#');
    if (hash != npos) {
        parts.fragment = std::string(rest.substr(hash + 1));
        rest           = rest.substr(0, hash);
    }
    size_t question = rest.find('?');
    if (question != npos) {
        parts.query = std::string(rest.substr(question + 1));
        rest        = rest.substr(0, question);
    }

    size_t colon = rest.find(':');
    if (colon != npos && colon < rest.find('/')) {
        parts.scheme = std::string(rest.substr(0, colon));
        rest.remove_prefix(colon + 1);
    }

    if (rest.substr(0, 2) == "//") {
        rest.remove_prefix(2);
        size_t slash = rest.find('/');
        split_authority(rest.substr(0, slash), parts);
        rest = slash == npos ? std::string_view() : rest.substr(slash);
    }

    if (!rest.empty())
        parts.path = std::string(rest);
    if (parts.path.front() != '/')
        parts.path.insert(parts.path.begin(), '/');
    return parts;
}

std::string Url::resolve(const std::string& base, const std::string& relative) {
    if (relative.empty())
        return base;

    if (relative[0] == '#')
        return base.substr(0, base.find('#')) + relative;
    if (relative[0] == '?')
        return base.substr(0, base.find_first_of("?#")) + relative;

    if (relative.find("://") != std::string::npos)
        return relative;

    size_t colon = relative.find(':');
    if (colon != std::string::npos && colon < relative.find_first_of("/?#"))
        return "";

    UrlParts b = parse(base);
    if (relative.compare(0, 2, "//") == 0)
        return b.scheme + ":" + relative;

    size_t      split  = relative.find_first_of("?#");
    std::string path   = relative.substr(0, split);
    std::string suffix = split == std::string::npos ? "" : relative.substr(split);

    if (path.empty() || path[0] != '/')
        path = b.path.substr(0, b.path.rfind('/') + 1) + path;
    return b.origin() + normalize_path(path) + suffix;
}

std::string Url::origin(const std::string& url) {
    return parse(url).origin();
}

std::string Url::as_directory(const std::string& url) {
    UrlParts    p    = parse(url);
    std::string path = p.path;
    while (path.size() > 1 && path.back() == '/')
        path.pop_back();
    if (path.back() != '/')
        path += '/';
    return p.origin() + path;
}

std::string Url::directory_of(const std::string& url) {
    return parse(url).directory();
}

std::string Url::join(const std::string& directory, const std::string& word) {
    std::string base = directory;
    if (base.empty() || base.back() != '/')
        base += "/";
    size_t skip = word.find_first_not_of('/');
    return skip == std::string::npos ? base : base + word.substr(skip);
}

bool Url::has_extension(const std::string& url) {
    std::string name = parse(url).filename();
    size_t      dot  = name.rfind('.');
    return dot != std::string::npos && dot + 1 < name.size();
}

std::string Url::extension(const std::string& url) {
    std::string name  = parse(url).filename();
    size_t      first = name.find_first_not_of('.');
    size_t      dot   = name.rfind('.');
    if (first == std::string::npos || dot == std::string::npos || dot < first
        || dot + 1 == name.size())
        return "";
    return name.substr(dot + 1);
}

std::vector<std::string> Url::sub_paths(const std::string& url) {
    std::vector<std::string> result;
    UrlParts                 p = parse(url);
    if (p.host.empty())
        return result;

    std::string base = p.origin();
    for (size_t slash = p.path.find('/', 1); slash != std::string::npos;
         slash        = p.path.find('/', slash + 1))
        result.push_back(base + p.path.substr(0, slash + 1));
    if (p.path.back() != '/')
        result.push_back(base + p.path);
    return result;
}

}  // namespace Utils
}  // namespace Burrow
