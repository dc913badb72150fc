#include "filter_store.hpp"

namespace Burrow {
namespace Filters {

FilterStore::FilterStore(FilterSet initial)
    : current_(std::make_shared<const FilterSet>(std::move(initial))) {
}

std::shared_ptr<const FilterSet> FilterStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

bool FilterStore::add_wildcard(const std::string& base_url, const WildcardSignature& signature) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_->wildcard_signatures.count(base_url))
        return false;

    auto next = std::make_shared<FilterSet>(*current_);
    next->wildcard_signatures.emplace(base_url, signature);
    current_ = std::move(next);
    return true;
}

void FilterStore::add_filter(Filter filter) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        next = std::make_shared<FilterSet>(*current_);
    next->add(std::move(filter));
    current_ = std::move(next);
}

bool FilterStore::has_wildcard(const std::string& base_url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_->wildcard_signatures.count(base_url) > 0;
}

}  // namespace Filters
}  // namespace Burrow
