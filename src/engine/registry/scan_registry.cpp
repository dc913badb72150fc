#include "scan_registry.hpp"
#include <algorithm>
#include "../../core/logger/logger.hpp"
#include "../../utils/url/url.hpp"

namespace Burrow {
namespace Engine {

using namespace Burrow::Core;

ScanRegistry::ScanRegistry(std::shared_ptr<const RunConfig> config) : config_(std::move(config)) {
}

std::string ScanRegistry::key_for(const std::string& url, ScanType type) {
    return type == ScanType::File ? url : Burrow::Utils::Url::as_directory(url);
}

std::optional<ScanId> ScanRegistry::register_scan(const std::string&    base_url,
                                                  ScanType              type,
                                                  std::optional<ScanId> parent_id,
                                                  int                   depth) {
    return add(base_url, type, parent_id, depth, ScanStatus::Queued);
}

std::optional<ScanId> ScanRegistry::record_file(const std::string& url, ScanId parent_id, int depth) {
    return add(url, ScanType::File, parent_id, depth, ScanStatus::Complete);
}

std::optional<ScanId> ScanRegistry::add(const std::string&    base_url,
                                        ScanType              type,
                                        std::optional<ScanId> parent_id,
                                        int                   depth,
                                        ScanStatus            status) {
    if (config_->depth > 0 && depth > config_->depth) {
        Logger::warn("Not registering " + base_url + ": depth " + std::to_string(depth)
                     + " exceeds maximum " + std::to_string(config_->depth));
        return std::nullopt;
    }

    std::string key = key_for(base_url, type);

    std::lock_guard<std::mutex> lock(mutex_);
    if (by_url_.count(key))
        return std::nullopt;
    if (parent_id && !index_.count(*parent_id)) {
        Logger::warn("Not registering " + base_url + ": unknown parent scan "
                     + std::to_string(*parent_id));
        return std::nullopt;
    }

    Scan scan;
    scan.id           = next_id_++;
    scan.base_url     = key;
    scan.scan_type    = type;
    scan.parent_id    = parent_id;
    scan.depth        = depth;
    scan.status       = status;
    scan.thread_count = config_->threads;
    scan.rate_limit   = config_->rate_limit;

    index_[scan.id] = scans_.size();
    by_url_[key]    = scan.id;
    scans_.push_back(scan);
    return scan.id;
}

bool ScanRegistry::transition(ScanId id, ScanStatus status, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = index_.find(id);
    if (it == index_.end()) {
        Logger::warn("Transition of unknown scan " + std::to_string(id));
        return false;
    }

    Scan& scan = scans_[it->second];
    if (!is_valid_transition(scan.status, status)) {
        Logger::warn("Refusing transition of scan " + std::to_string(id) + " from "
                     + to_string(scan.status) + " to " + to_string(status));
        return false;
    }

    scan.status = status;
    if (status == ScanStatus::Cancelled)
        scan.cancel_reason = reason;
    return true;
}

size_t ScanRegistry::count_locked(ScanStatus status) const {
    return static_cast<size_t>(std::count_if(
        scans_.begin(), scans_.end(), [status](const Scan& s) { return s.status == status; }));
}

std::optional<Scan> ScanRegistry::admit_next(int scan_limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Paused scans were admitted and still hold their slot.
    size_t active = count_locked(ScanStatus::Running) + count_locked(ScanStatus::Paused);
    if (scan_limit > 0 && active >= static_cast<size_t>(scan_limit))
        return std::nullopt;

    for (auto& scan : scans_) {
        if (scan.status == ScanStatus::Queued && scan.scan_type != ScanType::File) {
            scan.status = ScanStatus::Running;
            return scan;
        }
    }
    return std::nullopt;
}

bool ScanRegistry::update_tuning(ScanId id, int thread_count, int rate_limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = index_.find(id);
    if (it == index_.end())
        return false;
    scans_[it->second].thread_count = thread_count;
    scans_[it->second].rate_limit   = rate_limit;
    return true;
}

std::optional<Scan> ScanRegistry::find(ScanId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = index_.find(id);
    if (it == index_.end())
        return std::nullopt;
    return scans_[it->second];
}

std::vector<Scan> ScanRegistry::list(const std::function<bool(const Scan&)>& predicate) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!predicate)
        return scans_;

    std::vector<Scan> result;
    std::copy_if(scans_.begin(), scans_.end(), std::back_inserter(result), predicate);
    return result;
}

std::vector<Scan> ScanRegistry::snapshot() const {
    return list();
}

std::vector<ScanId> ScanRegistry::descendants(ScanId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ScanId>         result;
    std::vector<ScanId>         frontier{id};

    // Children are always registered after their parent.
    while (!frontier.empty()) {
        ScanId current = frontier.back();
        frontier.pop_back();
        for (const auto& scan : scans_) {
            if (scan.parent_id && *scan.parent_id == current) {
                result.push_back(scan.id);
                frontier.push_back(scan.id);
            }
        }
    }
    return result;
}

size_t ScanRegistry::count(ScanStatus status) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_locked(status);
}

size_t ScanRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scans_.size();
}

bool ScanRegistry::has_pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(scans_.begin(), scans_.end(), [](const Scan& s) {
        return s.status == ScanStatus::Queued || s.status == ScanStatus::Running
               || s.status == ScanStatus::Paused;
    });
}

bool ScanRegistry::add_extension(const std::string& extension) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (extension.empty()
        || std::find(extensions_.begin(), extensions_.end(), extension) != extensions_.end())
        return false;
    extensions_.push_back(extension);
    return true;
}

std::vector<std::string> ScanRegistry::extensions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return extensions_;
}

void ScanRegistry::restore(const std::vector<Scan>& scans, const std::vector<std::string>& extensions) {
    std::vector<Scan> ordered = scans;
    std::sort(ordered.begin(), ordered.end(), [](const Scan& a, const Scan& b) {
        return a.id < b.id;
    });

    std::lock_guard<std::mutex> lock(mutex_);
    scans_.clear();
    index_.clear();
    by_url_.clear();
    next_id_ = 1;
    extensions_ = extensions;

    for (auto& scan : ordered) {
        scan.base_url          = key_for(scan.base_url, scan.scan_type);
        index_[scan.id]        = scans_.size();
        by_url_[scan.base_url] = scan.id;
        next_id_               = std::max(next_id_, scan.id + 1);
        scans_.push_back(scan);
    }
}

}  // namespace Engine
}  // namespace Burrow
