#pragma once
#include <memory>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <vector>

#include "../../core/config/run_config.hpp"
#include "../../core/types/response.hpp"
#include "../registry/scan_registry.hpp"

namespace Burrow {
namespace Engine {

using Burrow::Core::Response;

/**
 * @brief Decides which accepted responses become new directory scans.
 */
class RecursionPolicy {
public:
    explicit RecursionPolicy(std::shared_ptr<const Burrow::Core::RunConfig> config);

    /// Matches the dont-scan list (url prefixes or regexes).
    bool is_denied(const std::string& url) const;

    /// Target hosts plus hosts added with --scope.
    bool in_scope(const std::string& url) const;

    /// Shape heuristics only; configuration switches are applied by candidate().
    bool looks_like_directory(const Response& response) const;

    /// The directory url to scan next, if `response` found under `parent` qualifies.
    std::optional<std::string> candidate(const Response& response, const Scan& parent) const;

    /// Registers the candidate, if any, as a child Directory scan.
    std::optional<ScanId> consider(const Response& response,
                                   const Scan&     parent,
                                   ScanRegistry&   registry) const;

private:
    std::shared_ptr<const Burrow::Core::RunConfig> config_;
    std::vector<std::string>                       denied_prefixes_;
    std::vector<std::regex>                        denied_patterns_;
    std::set<std::string>                          scope_hosts_;
};

}  // namespace Engine
}  // namespace Burrow
