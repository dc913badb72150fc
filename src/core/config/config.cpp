#include "config.hpp"
#include <CLI/CLI.hpp>
#include <yaml-cpp/yaml.h>

namespace Burrow {
namespace Core {

namespace {

template <typename T>
void read_scalar(const YAML::Node& yaml, const char* key, T& target) {
    if (yaml[key])
        target = yaml[key].as<T>();
}

template <typename T>
void read_sequence(const YAML::Node& yaml, const char* key, std::vector<T>& target) {
    const YAML::Node node = yaml[key];
    if (!node)
        return;
    if (!node.IsSequence()) {
        target = {node.as<T>()};
        return;
    }
    target.clear();
    for (const auto& item : node)
        target.push_back(item.as<T>());
}

}  // namespace

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);

        read_sequence(yaml, "urls", config.urls);
        read_scalar(yaml, "wordlist", config.wordlist);
        read_sequence(yaml, "extensions", config.extensions);

        read_scalar(yaml, "depth", config.depth);
        read_scalar(yaml, "no_recursion", config.no_recursion);
        read_scalar(yaml, "force_recursion", config.force_recursion);
        read_scalar(yaml, "extensionless_dirs", config.extensionless_dirs);
        read_scalar(yaml, "threads", config.threads);
        read_scalar(yaml, "io_threads", config.io_threads);
        read_scalar(yaml, "scan_limit", config.scan_limit);
        read_scalar(yaml, "rate_limit", config.rate_limit);

        read_scalar(yaml, "auto_tune", config.auto_tune);
        read_scalar(yaml, "auto_bail", config.auto_bail);
        read_scalar(yaml, "tune_threshold", config.tune_threshold);
        read_scalar(yaml, "bail_threshold", config.bail_threshold);
        read_scalar(yaml, "error_window", config.error_window);

        read_scalar(yaml, "time_limit", config.time_limit);
        read_scalar(yaml, "state_file", config.state_file);
        read_scalar(yaml, "no_state", config.no_state);
        read_scalar(yaml, "state_interval", config.state_interval);

        read_sequence(yaml, "dont_scan", config.dont_scan);
        read_sequence(yaml, "scope", config.scope);

        read_sequence(yaml, "status_codes", config.status_codes);
        read_sequence(yaml, "filter_status", config.filter_status);
        read_sequence(yaml, "filter_size", config.filter_size);
        read_sequence(yaml, "filter_words", config.filter_words);
        read_sequence(yaml, "filter_lines", config.filter_lines);
        read_sequence(yaml, "filter_regex", config.filter_regex);
        read_sequence(yaml, "filter_similar", config.filter_similar);
        read_scalar(yaml, "similarity_threshold", config.similarity_threshold);
        read_scalar(yaml, "dont_filter", config.dont_filter);
        read_scalar(yaml, "wildcard_tolerance", config.wildcard_tolerance);

        read_scalar(yaml, "extract_links", config.extract_links);

        read_sequence(yaml, "headers", config.headers);
        read_scalar(yaml, "user_agent", config.user_agent);
        read_scalar(yaml, "timeout", config.timeout);
        read_scalar(yaml, "insecure", config.insecure);
        read_scalar(yaml, "proxy", config.proxy);
        read_scalar(yaml, "retries", config.retries);
        read_scalar(yaml, "retry_backoff", config.retry_backoff);

        read_scalar(yaml, "collect_extensions", config.collect_extensions);
        read_sequence(yaml, "dont_collect", config.dont_collect);
        read_scalar(yaml, "collect_backups", config.collect_backups);
        read_sequence(yaml, "backup_extensions", config.backup_extensions);

        read_scalar(yaml, "output", config.output);
        read_scalar(yaml, "json", config.json);
        read_scalar(yaml, "quiet", config.quiet);
        read_scalar(yaml, "verbose", config.verbose);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Error parsing config file: " + std::string(e.what()));
    }
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Burrow - Recursive content discovery for web servers"};

    std::vector<std::string> positional_urls;

    app.add_option("-u,--url", config.urls, "Target URL (repeatable)");
    app.add_option("-w,--wordlist", config.wordlist, "Path to the wordlist");
    app.add_option("-x,--extensions", config.extensions, "File extensions to append to words")
        ->delimiter(',');

    app.add_option("-d,--depth", config.depth, "Maximum recursion depth (0 = unlimited)");
    app.add_flag("-n,--no-recursion", config.no_recursion, "Do not scan discovered directories");
    app.add_flag("--force-recursion", config.force_recursion, "Recurse into every accepted result");
    app.add_flag(
        "--no-extensionless-dirs",
        [&](size_t count) {
            if (count > 0)
                config.extensionless_dirs = false;
        },
        "Do not treat extensionless paths as directories");

    app.add_option("-t,--threads", config.threads, "Concurrent requests per scan");
    app.add_option("--io-threads", config.io_threads, "IO threads driving the event loop");
    app.add_option("-L,--scan-limit", config.scan_limit, "Concurrent scans (0 = unlimited)");
    app.add_option("--rate-limit", config.rate_limit, "Requests per second per scan (0 = unlimited)");

    app.add_flag("--auto-tune", config.auto_tune, "Slow a scan down when errors pile up");
    app.add_flag("--auto-bail", config.auto_bail, "Cancel a scan when errors stay excessive");
    app.add_option("--tune-threshold", config.tune_threshold, "Error rate that triggers tuning");
    app.add_option("--bail-threshold", config.bail_threshold, "Error rate that triggers bailing");
    app.add_option("--error-window", config.error_window, "Requests per error-rate window");

    app.add_option("--time-limit", config.time_limit, "Overall time limit (e.g. 30s, 10m, 2h, 1d)");
    app.add_option("--resume-from", config.resume_from, "Resume from a state file");
    app.add_option("--state-file", config.state_file, "Where to write checkpoints");
    app.add_flag("--no-state", config.no_state, "Never write state files");
    app.add_option("--state-interval", config.state_interval, "Seconds between checkpoints");

    app.add_option("--dont-scan", config.dont_scan, "URL or regex excluded from scanning");
    app.add_option("--scope", config.scope, "Additional hosts considered in scope");

    app.add_option("-s,--status-codes", config.status_codes, "Status codes to report")
        ->delimiter(',');
    app.add_option("-C,--filter-status", config.filter_status, "Status codes to drop")
        ->delimiter(',');
    app.add_option("-S,--filter-size", config.filter_size, "Response sizes to drop")
        ->delimiter(',');
    app.add_option("-W,--filter-words", config.filter_words, "Word counts to drop")
        ->delimiter(',');
    app.add_option("-N,--filter-lines", config.filter_lines, "Line counts to drop")
        ->delimiter(',');
    app.add_option("-X,--filter-regex", config.filter_regex, "Regex matched against body/headers");
    app.add_option("--filter-similar-to", config.filter_similar, "Drop pages similar to this URL");
    app.add_option("--similarity-threshold",
                   config.similarity_threshold,
                   "Similarity (0-1) at which a page is dropped");
    app.add_flag("-D,--dont-filter", config.dont_filter, "Disable wildcard detection");
    app.add_option("--wildcard-tolerance",
                   config.wildcard_tolerance,
                   "Relative size band for dynamic wildcard pages");

    app.add_flag("-e,--extract-links", config.extract_links, "Extract links from responses");
    app.add_flag(
        "--dont-extract-links",
        [&](size_t count) {
            if (count > 0)
                config.extract_links = false;
        },
        "Do not extract links from responses");

    app.add_flag("-E,--collect-extensions",
                 config.collect_extensions,
                 "Add extensions seen in found files to later requests");
    app.add_option("-I,--dont-collect", config.dont_collect, "Extensions never collected")
        ->delimiter(',');
    app.add_flag("-B,--collect-backups", config.collect_backups, "Request backup copies of found files");
    app.add_option("--backup-extensions", config.backup_extensions, "Suffixes tried by --collect-backups")
        ->delimiter(',');

    app.add_option("-H,--header", config.headers, "Extra request header (Name: value)");
    app.add_option("-a,--user-agent", config.user_agent, "User-Agent header");
    app.add_option("-T,--timeout", config.timeout, "Request timeout in seconds");
    app.add_flag("-k,--insecure", config.insecure, "Skip TLS certificate verification");
    app.add_option("-p,--proxy", config.proxy, "HTTP proxy URL");
    app.add_option("--retries", config.retries, "Retries per failed request");
    app.add_option("--retry-backoff", config.retry_backoff, "Base retry backoff in milliseconds");

    app.add_option("-o,--output", config.output, "Append results to this file");
    app.add_flag("--json", config.json, "Write the output file as JSON lines");
    app.add_flag("-q,--quiet", config.quiet, "Only print results, warnings and errors");
    app.add_flag("-v,--verbose", config.verbose, "Print debug messages");
    app.add_option("--config", config.config_path, "Path to YAML configuration file");

    app.add_option("targets", positional_urls, "Target URLs");
    app.set_version_flag("-V,--version", std::string(Constants::VERSION));

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        // Command line wins over the file.
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    config.urls.insert(config.urls.end(), positional_urls.begin(), positional_urls.end());
    return config;
}

}  // namespace Core
}  // namespace Burrow
