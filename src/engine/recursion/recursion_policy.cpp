#include "recursion_policy.hpp"
#include "../../core/logger/logger.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"

namespace Burrow {
namespace Engine {

using namespace Burrow::Core;
using namespace Burrow::Utils;

namespace {

std::string host_of(const std::string& entry) {
    if (entry.find("://") != std::string::npos)
        return Text::to_lower(Url::parse(entry).host);
    return Text::to_lower(entry);
}

}  // namespace

RecursionPolicy::RecursionPolicy(std::shared_ptr<const RunConfig> config)
    : config_(std::move(config)) {
    for (const auto& entry : config_->dont_scan) {
        if (entry.find("://") != std::string::npos)
            denied_prefixes_.push_back(Url::as_directory(entry));
        else
            denied_patterns_.emplace_back(entry);
    }
    for (const auto& target : config_->targets)
        scope_hosts_.insert(host_of(target));
    for (const auto& entry : config_->scope)
        scope_hosts_.insert(host_of(entry));
}

bool RecursionPolicy::is_denied(const std::string& url) const {
    std::string as_dir = Url::as_directory(url);
    for (const auto& prefix : denied_prefixes_) {
        if (Text::starts_with(as_dir, prefix))
            return true;
    }
    for (const auto& pattern : denied_patterns_) {
        if (std::regex_search(url, pattern))
            return true;
    }
    return false;
}

bool RecursionPolicy::in_scope(const std::string& url) const {
    std::string host = Text::to_lower(Url::parse(url).host);
    if (!host.empty() && host.back() == '.')
        host.pop_back();
    return scope_hosts_.count(host) > 0;
}

bool RecursionPolicy::looks_like_directory(const Response& response) const {
    int status = response.status_code;

    if (is_redirect(status)) {
        std::string location = response.header("location");
        if (location.empty())
            return false;
        std::string target = Url::resolve(response.url, location);
        return target == response.url + "/"
               || (Text::ends_with(response.url, "/") && target == response.url);
    }

    if (!is_success(status) && status != 401 && status != 403)
        return false;

    if (Text::ends_with(Url::parse(response.url).path, "/"))
        return true;

    return config_->extensionless_dirs && !Url::has_extension(response.url);
}

std::optional<std::string> RecursionPolicy::candidate(const Response& response,
                                                      const Scan&     parent) const {
    if (config_->no_recursion)
        return std::nullopt;
    if (!config_->force_recursion && !looks_like_directory(response))
        return std::nullopt;

    std::string child = Url::as_directory(response.url);
    if (child == parent.base_url)
        return std::nullopt;
    if (is_denied(child) || !in_scope(child)) {
        Logger::debug("Not recursing into " + child + ": excluded or out of scope");
        return std::nullopt;
    }
    if (config_->depth > 0 && parent.depth + 1 > config_->depth)
        return std::nullopt;
    return child;
}

std::optional<ScanId> RecursionPolicy::consider(const Response& response,
                                                const Scan&     parent,
                                                ScanRegistry&   registry) const {
    auto child = candidate(response, parent);
    if (!child)
        return std::nullopt;

    auto id = registry.register_scan(*child, ScanType::Directory, parent.id, parent.depth + 1);
    if (id)
        Logger::info("Queued recursive scan of " + *child + " (depth "
                     + std::to_string(parent.depth + 1) + ")");
    return id;
}

}  // namespace Engine
}  // namespace Burrow
