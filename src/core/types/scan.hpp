#pragma once
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace Burrow {
namespace Core {

using ScanId = std::uint64_t;

enum class ScanType { Initial, Directory, File };

enum class ScanStatus { Queued, Running, Paused, Cancelled, Complete };

struct Scan {
    ScanId                id = 0;
    std::string           base_url;
    ScanType              scan_type = ScanType::Initial;
    std::optional<ScanId> parent_id;  // weak, resolved through the registry
    int                   depth        = 0;
    ScanStatus            status       = ScanStatus::Queued;
    int                   thread_count = 1;
    int                   rate_limit   = 0;
    std::string           cancel_reason;

    bool is_terminal() const {
        return status == ScanStatus::Cancelled || status == ScanStatus::Complete;
    }
};

const char* to_string(ScanType type);
const char* to_string(ScanStatus status);
ScanType    scan_type_from_string(const std::string& value);
ScanStatus  scan_status_from_string(const std::string& value);

/// Whether the lifecycle allows moving from `from` to `to`.
bool is_valid_transition(ScanStatus from, ScanStatus to);

void to_json(nlohmann::json& j, const Scan& scan);
void from_json(const nlohmann::json& j, Scan& scan);

}  // namespace Core
}  // namespace Burrow
