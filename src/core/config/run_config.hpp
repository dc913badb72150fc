#pragma once
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "../types/constants.hpp"
#include "config.hpp"

namespace Burrow {
namespace Core {

/**
 * @brief Validated, frozen view of every tunable the engine honors.
 *
 * Built once by RunConfig::from() and shared as a pointer to const.
 */
struct RunConfig {
    std::vector<std::string> targets;
    std::string              wordlist;
    std::vector<std::string> extensions;

    int  depth              = Constants::DEFAULT_DEPTH;
    bool no_recursion       = false;
    bool force_recursion    = false;
    bool extensionless_dirs = true;
    int  threads            = Constants::DEFAULT_THREADS;
    int  io_threads         = Constants::DEFAULT_IO_THREADS;
    int  scan_limit         = Constants::DEFAULT_SCAN_LIMIT;
    int  rate_limit         = Constants::DEFAULT_RATE_LIMIT;

    bool   auto_tune      = false;
    bool   auto_bail      = false;
    double tune_threshold = Constants::DEFAULT_TUNE_THRESHOLD;
    double bail_threshold = Constants::DEFAULT_BAIL_THRESHOLD;
    int    error_window   = Constants::DEFAULT_ERROR_WINDOW;

    std::chrono::seconds time_limit{0};
    std::string          state_file;
    bool                 no_state       = false;
    int                  state_interval = 0;

    std::vector<std::string> dont_scan;
    std::vector<std::string> scope;

    std::set<int>            status_allow = default_status_allow();
    std::set<int>            status_deny;
    std::set<long long>      filter_size;
    std::set<long long>      filter_words;
    std::set<long long>      filter_lines;
    std::vector<std::string> filter_regex;
    std::vector<std::string> filter_similar;
    double                   similarity_threshold = Constants::DEFAULT_SIMILARITY;
    bool                     dont_filter          = false;
    double                   wildcard_tolerance   = Constants::DEFAULT_WILDCARD_TOLERANCE;

    bool extract_links = true;

    bool                     collect_extensions = false;
    std::vector<std::string> dont_collect       = default_ignored_extensions();
    bool                     collect_backups    = false;
    std::vector<std::string> backup_extensions  = default_backup_extensions();

    std::vector<std::pair<std::string, std::string>> headers;
    std::string user_agent    = Constants::USER_AGENT;
    int         timeout       = Constants::REQUEST_TIMEOUT_SECONDS;
    bool        insecure      = false;
    std::string proxy;
    int         retries       = Constants::DEFAULT_RETRIES;
    int         retry_backoff = Constants::DEFAULT_RETRY_BACKOFF_MS;

    std::string output;
    bool        json = false;  // NDJSON lines in the output file

    /// Throws ConfigError on any invalid or contradictory value.
    static std::shared_ptr<const RunConfig> from(const Config& config);

    /// Normalizes and checks a value built directly, e.g. restored from a state file.
    static void validate(const RunConfig& config);
};

std::chrono::seconds parse_time_limit(const std::string& text);
std::string          normalize_target(const std::string& url);

void to_json(nlohmann::json& j, const RunConfig& config);
void from_json(const nlohmann::json& j, RunConfig& config);

}  // namespace Core
}  // namespace Burrow
