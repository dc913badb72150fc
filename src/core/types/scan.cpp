#include "scan.hpp"
#include <stdexcept>

namespace Burrow {
namespace Core {

const char* to_string(ScanType type) {
    switch (type) {
        case ScanType::Initial:
            return "initial";
        case ScanType::Directory:
            return "directory";
        case ScanType::File:
            return "file";
    }
    return "directory";
}

const char* to_string(ScanStatus status) {
    switch (status) {
        case ScanStatus::Queued:
            return "queued";
        case ScanStatus::Running:
            return "running";
        case ScanStatus::Paused:
            return "paused";
        case ScanStatus::Cancelled:
            return "cancelled";
        case ScanStatus::Complete:
            return "complete";
    }
    return "queued";
}

ScanType scan_type_from_string(const std::string& value) {
    if (value == "initial")
        return ScanType::Initial;
    if (value == "directory")
        return ScanType::Directory;
    if (value == "file")
        return ScanType::File;
    throw std::invalid_argument("Unknown scan type: " + value);
}

ScanStatus scan_status_from_string(const std::string& value) {
    if (value == "queued")
        return ScanStatus::Queued;
    if (value == "running")
        return ScanStatus::Running;
    if (value == "paused")
        return ScanStatus::Paused;
    if (value == "cancelled")
        return ScanStatus::Cancelled;
    if (value == "complete")
        return ScanStatus::Complete;
    throw std::invalid_argument("Unknown scan status: " + value);
}

bool is_valid_transition(ScanStatus from, ScanStatus to) {
    switch (from) {
        case ScanStatus::Queued:
            return to == ScanStatus::Running || to == ScanStatus::Cancelled;
        case ScanStatus::Running:
            return to == ScanStatus::Paused || to == ScanStatus::Complete
                   || to == ScanStatus::Cancelled;
        case ScanStatus::Paused:
            return to == ScanStatus::Running || to == ScanStatus::Complete
                   || to == ScanStatus::Cancelled;
        case ScanStatus::Cancelled:
        case ScanStatus::Complete:
            return false;
    }
    return false;
}

void to_json(nlohmann::json& j, const Scan& scan) {
    j = nlohmann::json{{"id", scan.id},
                       {"url", scan.base_url},
                       {"scan_type", to_string(scan.scan_type)},
                       {"parent_id", nullptr},
                       {"depth", scan.depth},
                       {"status", to_string(scan.status)},
                       {"thread_count", scan.thread_count},
                       {"rate_limit", scan.rate_limit},
                       {"cancel_reason", scan.cancel_reason}};
    if (scan.parent_id)
        j["parent_id"] = *scan.parent_id;
}

void from_json(const nlohmann::json& j, Scan& scan) {
    j.at("id").get_to(scan.id);
    j.at("url").get_to(scan.base_url);
    scan.scan_type = scan_type_from_string(j.at("scan_type").get<std::string>());
    if (j.at("parent_id").is_null())
        scan.parent_id.reset();
    else
        scan.parent_id = j.at("parent_id").get<ScanId>();
    j.at("depth").get_to(scan.depth);
    scan.status = scan_status_from_string(j.at("status").get<std::string>());
    j.at("thread_count").get_to(scan.thread_count);
    j.at("rate_limit").get_to(scan.rate_limit);
    scan.cancel_reason = j.value("cancel_reason", std::string());
}

}  // namespace Core
}  // namespace Burrow
