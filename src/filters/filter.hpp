#pragma once
#include <cstdint>
#include <map>
#include <regex>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "../core/config/run_config.hpp"
#include "../core/types/response.hpp"

namespace Burrow {
namespace Filters {

using Burrow::Core::Response;

/// Pipeline stages, in evaluation order.
enum class Stage { None, StatusDeny, StatusAllow, Wildcard, Size, Words, Lines, Regex, Similarity };

const char* to_string(Stage stage);

struct StatusDeny {
    std::set<int> codes;
};

struct StatusAllow {
    std::set<int> codes;
};

struct SizeFilter {
    std::set<std::uint64_t> values;
};

struct WordFilter {
    std::set<std::uint64_t> values;
};

struct LineFilter {
    std::set<std::uint64_t> values;
};

struct RegexFilter {
    std::string pattern;
    std::regex  compiled;
};

struct SimilarityFilter {
    std::string   url;
    std::uint64_t fingerprint = 0;
    double        threshold   = 0.95;
};

using Filter = std::variant<StatusDeny,
                            StatusAllow,
                            SizeFilter,
                            WordFilter,
                            LineFilter,
                            RegexFilter,
                            SimilarityFilter>;

Stage stage_of(const Filter& filter);

/// Drop decision for a single filter; true means the response is filtered out.
bool should_drop(const Filter& filter, const Response& response);

enum class WildcardKind { Static, Reflected, Band };

/**
 * Shape of the catch-all page a server returns for a directory.
 *
 * Static matches the exact length, Reflected matches the length once the
 * requested path is subtracted, Band matches any length in [min_length, max_length].
 */
struct WildcardSignature {
    WildcardKind  kind        = WildcardKind::Static;
    int           status_code = 0;
    std::uint64_t length      = 0;
    std::uint64_t min_length  = 0;
    std::uint64_t max_length  = 0;

    bool matches(const Response& response) const;
};

const char* to_string(WildcardKind kind);

struct FilterSet {
    std::vector<Filter>                      filters;  // sorted by stage
    std::map<std::string, WildcardSignature> wildcard_signatures;
    bool                                     wildcard_filtering = true;

    void add(Filter filter);

    /// Static filters from configuration. Similarity targets are added once fetched.
    static FilterSet from_config(const Burrow::Core::RunConfig& config);
};

struct Verdict {
    bool  keep    = true;
    bool  recurse = false;
    Stage stage   = Stage::None;  // the stage that dropped the response
};

/// Pure function of its inputs: the same response and set always yield the same verdict.
Verdict classify(const Response& response, const FilterSet& filters);

}  // namespace Filters
}  // namespace Burrow
