#include "filter.hpp"
#include <algorithm>
#include <type_traits>
#include "../core/types/constants.hpp"
#include "../utils/crypto/simhash.hpp"

namespace Burrow {
namespace Filters {

using Burrow::Core::ConfigError;

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

// Searches line by line, in chunks short enough for the recursive regex executor.
bool search_bounded(const std::string& text, const std::regex& regex) {
    const std::size_t limit = Burrow::Core::Constants::MAX_REGEX_INPUT_BYTES;
    std::size_t       start = 0;
    while (start < text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string::npos)
            end = text.size();
        for (std::size_t pos = start; pos < end; pos += limit) {
            auto first = text.begin() + static_cast<std::ptrdiff_t>(pos);
            auto last  = text.begin() + static_cast<std::ptrdiff_t>(std::min(end, pos + limit));
            if (std::regex_search(first, last, regex))
                return true;
        }
        start = end + 1;
    }
    return false;
}

bool is_recursable_status(int status) {
    return Burrow::Core::is_success(status) || Burrow::Core::is_redirect(status) || status == 401
           || status == 403;
}

}  // namespace

const char* to_string(Stage stage) {
    switch (stage) {
        case Stage::None:
            return "none";
        case Stage::StatusDeny:
            return "status-deny";
        case Stage::StatusAllow:
            return "status-allow";
        case Stage::Wildcard:
            return "wildcard";
        case Stage::Size:
            return "size";
        case Stage::Words:
            return "words";
        case Stage::Lines:
            return "lines";
        case Stage::Regex:
            return "regex";
        case Stage::Similarity:
            return "similarity";
    }
    return "none";
}

const char* to_string(WildcardKind kind) {
    switch (kind) {
        case WildcardKind::Static:
            return "static";
        case WildcardKind::Reflected:
            return "reflected";
        case WildcardKind::Band:
            return "band";
    }
    return "static";
}

Stage stage_of(const Filter& filter) {
    return std::visit(overloaded{[](const StatusDeny&) { return Stage::StatusDeny; },
                                 [](const StatusAllow&) { return Stage::StatusAllow; },
                                 [](const SizeFilter&) { return Stage::Size; },
                                 [](const WordFilter&) { return Stage::Words; },
                                 [](const LineFilter&) { return Stage::Lines; },
                                 [](const RegexFilter&) { return Stage::Regex; },
                                 [](const SimilarityFilter&) { return Stage::Similarity; }},
                      filter);
}

bool should_drop(const Filter& filter, const Response& response) {
    return std::visit(
        overloaded{
            [&](const StatusDeny& f) { return f.codes.count(response.status_code) > 0; },
            [&](const StatusAllow& f) { return f.codes.count(response.status_code) == 0; },
            [&](const SizeFilter& f) { return f.values.count(response.content_length) > 0; },
            [&](const WordFilter& f) { return f.values.count(response.word_count) > 0; },
            [&](const LineFilter& f) { return f.values.count(response.line_count) > 0; },
            [&](const RegexFilter& f) {
                if (search_bounded(response.body, f.compiled))
                    return true;
                for (const auto& [name, value] : response.headers) {
                    if (search_bounded(name + ": " + value, f.compiled))
                        return true;
                }
                return false;
            },
            [&](const SimilarityFilter& f) {
                return Burrow::Utils::Crypto::SimHash::similarity(f.fingerprint,
                                                                  response.fingerprint)
                       >= f.threshold;
            }},
        filter);
}

bool WildcardSignature::matches(const Response& response) const {
    if (response.status_code != status_code)
        return false;

    switch (kind) {
        case WildcardKind::Static:
            return response.content_length == length;
        case WildcardKind::Reflected: {
            std::uint64_t path_length = response.path.size();
            return response.content_length >= path_length
                   && response.content_length - path_length == length;
        }
        case WildcardKind::Band:
            return response.content_length >= min_length && response.content_length <= max_length;
    }
    return false;
}

void FilterSet::add(Filter filter) {
    Stage stage = stage_of(filter);
    auto  pos   = std::upper_bound(
        filters.begin(), filters.end(), stage, [](Stage s, const Filter& existing) {
            return s < stage_of(existing);
        });
    filters.insert(pos, std::move(filter));
}

FilterSet FilterSet::from_config(const Burrow::Core::RunConfig& config) {
    FilterSet set;
    set.wildcard_filtering = !config.dont_filter;

    if (!config.status_deny.empty())
        set.add(StatusDeny{config.status_deny});
    set.add(StatusAllow{config.status_allow});

    auto as_unsigned = [](const std::set<long long>& values) {
        std::set<std::uint64_t> result;
        for (long long v : values) {
            if (v >= 0)
                result.insert(static_cast<std::uint64_t>(v));
        }
        return result;
    };
    if (!config.filter_size.empty())
        set.add(SizeFilter{as_unsigned(config.filter_size)});
    if (!config.filter_words.empty())
        set.add(WordFilter{as_unsigned(config.filter_words)});
    if (!config.filter_lines.empty())
        set.add(LineFilter{as_unsigned(config.filter_lines)});

    for (const auto& pattern : config.filter_regex) {
        try {
            set.add(RegexFilter{pattern, std::regex(pattern)});
        } catch (const std::regex_error& e) {
            throw ConfigError("Invalid filter regex '" + pattern + "': " + e.what());
        }
    }
    return set;
}

Verdict classify(const Response& response, const FilterSet& set) {
    Verdict verdict;
    bool    wildcard_checked = false;

    auto check_wildcard = [&]() -> bool {
        wildcard_checked = true;
        if (!set.wildcard_filtering)
            return false;
        if (response.is_wildcard)
            return true;
        auto it = set.wildcard_signatures.find(response.base_url);
        return it != set.wildcard_signatures.end() && it->second.matches(response);
    };

    for (const auto& filter : set.filters) {
        Stage stage = stage_of(filter);
        if (!wildcard_checked && stage > Stage::Wildcard && check_wildcard()) {
            verdict.keep  = false;
            verdict.stage = Stage::Wildcard;
            return verdict;
        }
        if (should_drop(filter, response)) {
            verdict.keep  = false;
            verdict.stage = stage;
            return verdict;
        }
    }

    if (!wildcard_checked && check_wildcard()) {
        verdict.keep  = false;
        verdict.stage = Stage::Wildcard;
        return verdict;
    }

    verdict.recurse = is_recursable_status(response.status_code);
    return verdict;
}

}  // namespace Filters
}  // namespace Burrow
