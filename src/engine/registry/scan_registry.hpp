#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../../core/config/run_config.hpp"
#include "../../core/types/scan.hpp"

#ifndef CPPCHECK
class ScanRegistryTest_RestoreContinuesIds_Test;
#endif

namespace Burrow {
namespace Engine {

using Burrow::Core::Scan;
using Burrow::Core::ScanId;
using Burrow::Core::ScanStatus;
using Burrow::Core::ScanType;

/**
 * @brief Authoritative store of every Scan and its lifecycle state.
 *
 * Scans live in one insertion-ordered arena; parents are referenced by id only.
 * Every mutation happens under a single lock.
 */
class ScanRegistry {
#ifndef CPPCHECK
    friend class ::ScanRegistryTest_RestoreContinuesIds_Test;
#endif

public:
    explicit ScanRegistry(std::shared_ptr<const Burrow::Core::RunConfig> config);

    /// Fails (nullopt) when depth exceeds the maximum or the url is already registered.
    std::optional<ScanId> register_scan(const std::string&    base_url,
                                        ScanType              type,
                                        std::optional<ScanId> parent_id,
                                        int                   depth);

    /// Records a file found by link extraction; it is Complete from the start
    /// and never holds a scan-limit slot.
    std::optional<ScanId> record_file(const std::string& url, ScanId parent_id, int depth);

    /// Fails (false, logged) on unknown ids and illegal lifecycle moves.
    bool transition(ScanId id, ScanStatus status, const std::string& reason = "");

    /// Marks the oldest Queued scan Running if fewer than `scan_limit` are active.
    std::optional<Scan> admit_next(int scan_limit);

    bool update_tuning(ScanId id, int thread_count, int rate_limit);

    /// Remembers an extension learned from a found file; false if it was already known.
    bool                     add_extension(const std::string& extension);
    std::vector<std::string> extensions() const;

    std::optional<Scan> find(ScanId id) const;
    std::vector<Scan>   list(const std::function<bool(const Scan&)>& predicate = nullptr) const;
    std::vector<Scan>   snapshot() const;
    std::vector<ScanId> descendants(ScanId id) const;

    size_t count(ScanStatus status) const;
    size_t size() const;
    bool   has_pending() const;

    /// Replaces the registry content, e.g. when resuming from a state file.
    void restore(const std::vector<Scan>& scans, const std::vector<std::string>& extensions = {});

#ifdef CPPCHECK
public:
#else
private:
#endif
    std::shared_ptr<const Burrow::Core::RunConfig> config_;

    mutable std::mutex                      mutex_;
    std::vector<Scan>                       scans_;
    std::unordered_map<ScanId, size_t>      index_;
    std::unordered_map<std::string, ScanId> by_url_;
    ScanId                                  next_id_ = 1;
    std::vector<std::string>                extensions_;  // in discovery order

    static std::string key_for(const std::string& url, ScanType type);
    std::optional<ScanId> add(const std::string&    base_url,
                              ScanType              type,
                              std::optional<ScanId> parent_id,
                              int                   depth,
                              ScanStatus            status);
    size_t             count_locked(ScanStatus status) const;
};

}  // namespace Engine
}  // namespace Burrow
