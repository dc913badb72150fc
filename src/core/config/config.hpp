#pragma once
#include <stdexcept>
#include <string>
#include <vector>

#include "../types/constants.hpp"

namespace Burrow {
namespace Core {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {
    }
};

struct Config {
    std::vector<std::string> urls;
    std::string              wordlist;
    std::vector<std::string> extensions;

    int  depth                = Constants::DEFAULT_DEPTH;
    bool no_recursion         = false;
    bool force_recursion      = false;
    bool extensionless_dirs   = true;
    int  threads              = Constants::DEFAULT_THREADS;
    int  io_threads           = Constants::DEFAULT_IO_THREADS;
    int  scan_limit           = Constants::DEFAULT_SCAN_LIMIT;
    int  rate_limit           = Constants::DEFAULT_RATE_LIMIT;

    bool   auto_tune      = false;
    bool   auto_bail      = false;
    double tune_threshold = Constants::DEFAULT_TUNE_THRESHOLD;
    double bail_threshold = Constants::DEFAULT_BAIL_THRESHOLD;
    int    error_window   = Constants::DEFAULT_ERROR_WINDOW;

    std::string time_limit;
    std::string resume_from;
    std::string state_file;
    bool        no_state       = false;
    int         state_interval = 0;  // seconds, 0 = only on interrupt

    std::vector<std::string> dont_scan;
    std::vector<std::string> scope;

    std::vector<int>         status_codes;
    std::vector<int>         filter_status;
    std::vector<long long>   filter_size;
    std::vector<long long>   filter_words;
    std::vector<long long>   filter_lines;
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

    std::vector<std::string> headers;
    std::string              user_agent    = Constants::USER_AGENT;
    int                      timeout       = Constants::REQUEST_TIMEOUT_SECONDS;
    bool                     insecure      = false;
    std::string              proxy;
    int                      retries       = Constants::DEFAULT_RETRIES;
    int                      retry_backoff = Constants::DEFAULT_RETRY_BACKOFF_MS;

    std::string output;
    bool        json    = false;
    bool        quiet   = false;
    bool        verbose = false;
    std::string config_path;

    static Config parse(int argc, char* argv[]);
};

void load_yaml(Config& config, const std::string& path);

}  // namespace Core
}  // namespace Burrow
