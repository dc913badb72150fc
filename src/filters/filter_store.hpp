#pragma once
#include <memory>
#include <mutex>
#include <string>

#include "filter.hpp"

namespace Burrow {
namespace Filters {

/**
 * @brief Owner of the current FilterSet.
 *
 * Readers take an immutable snapshot; writers publish a modified copy.
 * Wildcard signatures are only ever added, never retracted.
 */
class FilterStore {
public:
    explicit FilterStore(FilterSet initial = {});

    std::shared_ptr<const FilterSet> snapshot() const;

    /// Returns false if the directory already has a signature.
    bool add_wildcard(const std::string& base_url, const WildcardSignature& signature);
    void add_filter(Filter filter);

    bool has_wildcard(const std::string& base_url) const;

private:
    mutable std::mutex               mutex_;
    std::shared_ptr<const FilterSet> current_;
};

}  // namespace Filters
}  // namespace Burrow
