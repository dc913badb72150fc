#include "run_config.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"

namespace Burrow {
namespace Core {

using namespace Burrow::Utils;

namespace {

void check_regexes(const std::vector<std::string>& patterns, const std::string& option) {
    for (const auto& pattern : patterns) {
        try {
            std::regex compiled(pattern);
        } catch (const std::regex_error& e) {
            throw ConfigError("Invalid regex for " + option + " '" + pattern + "': " + e.what());
        }
    }
}

std::pair<std::string, std::string> parse_header(const std::string& raw) {
    size_t colon = raw.find(':');
    if (colon == std::string::npos || colon == 0)
        throw ConfigError("Invalid header '" + raw + "', expected 'Name: value'");
    return {Text::trim(raw.substr(0, colon)), Text::trim(raw.substr(colon + 1))};
}

}  // namespace

std::chrono::seconds parse_time_limit(const std::string& text) {
    static const std::regex TIME_SPEC(R"(^(\d+)([smhdSMHD])$)");

    std::smatch match;
    if (!std::regex_match(text, match, TIME_SPEC))
        throw ConfigError("Invalid time limit '" + text + "', expected e.g. 30s, 10m, 2h or 1d");

    long long value = std::stoll(match[1].str());
    switch (std::tolower(static_cast<unsigned char>(match[2].str()[0]))) {
        case 'm':
            return std::chrono::seconds(value * 60);
        case 'h':
            return std::chrono::seconds(value * 3600);
        case 'd':
            return std::chrono::seconds(value * 86400);
        default:
            return std::chrono::seconds(value);
    }
}

std::string normalize_target(const std::string& url) {
    auto parsed = Url::parse(url);
    if ((parsed.scheme != "http" && parsed.scheme != "https") || parsed.host.empty())
        throw ConfigError("Invalid target URL '" + url + "', expected http(s)://host[/path]");
    return Url::as_directory(url);
}

void RunConfig::validate(const RunConfig& config) {
    if (config.targets.empty())
        throw ConfigError("No target URL given");
    if (config.threads < 1)
        throw ConfigError("--threads must be at least 1");
    if (config.io_threads < 1)
        throw ConfigError("--io-threads must be at least 1");
    if (config.depth < 0 || config.scan_limit < 0 || config.rate_limit < 0)
        throw ConfigError("--depth, --scan-limit and --rate-limit must not be negative");
    if (config.error_window < 1)
        throw ConfigError("--error-window must be at least 1");
    if (config.tune_threshold <= 0.0 || config.tune_threshold > 1.0 || config.bail_threshold <= 0.0
        || config.bail_threshold > 1.0)
        throw ConfigError("Error thresholds must be in (0, 1]");
    if (config.similarity_threshold <= 0.0 || config.similarity_threshold > 1.0)
        throw ConfigError("--similarity-threshold must be in (0, 1]");
    if (config.wildcard_tolerance < 0.0 || config.wildcard_tolerance >= 1.0)
        throw ConfigError("--wildcard-tolerance must be in [0, 1)");
    if (config.collect_backups && config.backup_extensions.empty())
        throw ConfigError("--collect-backups needs at least one backup extension");
    if (config.retries < 0 || config.retry_backoff < 0 || config.timeout < 1)
        throw ConfigError("--retries, --retry-backoff and --timeout must be positive");

    for (int code : config.status_deny) {
        if (config.status_allow.count(code))
            throw ConfigError("Status code " + std::to_string(code)
                              + " is both allowed and filtered");
    }

    check_regexes(config.filter_regex, "--filter-regex");
    for (const auto& entry : config.dont_scan) {
        if (entry.find("://") == std::string::npos)
            check_regexes({entry}, "--dont-scan");
    }
}

std::shared_ptr<const RunConfig> RunConfig::from(const Config& config) {
    auto run = std::make_shared<RunConfig>();

    for (const auto& url : config.urls)
        run->targets.push_back(normalize_target(url));
    run->wordlist = config.wordlist;
    for (auto ext : config.extensions) {
        ext = Text::trim(ext);
        if (!ext.empty() && ext[0] == '.')
            ext.erase(0, 1);
        if (!ext.empty())
            run->extensions.push_back(ext);
    }

    run->depth              = config.depth;
    run->no_recursion       = config.no_recursion;
    run->force_recursion    = config.force_recursion;
    run->extensionless_dirs = config.extensionless_dirs;
    run->threads            = config.threads;
    run->io_threads         = config.io_threads;
    run->scan_limit         = config.scan_limit;
    run->rate_limit         = config.rate_limit;

    run->auto_tune      = config.auto_tune;
    run->auto_bail      = config.auto_bail;
    run->tune_threshold = config.tune_threshold;
    run->bail_threshold = config.bail_threshold;
    run->error_window   = config.error_window;

    if (!config.time_limit.empty())
        run->time_limit = parse_time_limit(config.time_limit);
    run->state_file     = config.state_file;
    run->no_state       = config.no_state;
    run->state_interval = config.state_interval;

    run->dont_scan = config.dont_scan;
    run->scope     = config.scope;

    if (!config.status_codes.empty())
        run->status_allow = std::set<int>(config.status_codes.begin(), config.status_codes.end());
    run->status_deny  = std::set<int>(config.filter_status.begin(), config.filter_status.end());
    // An explicit deny wins over the built-in allow-list, not over a user one.
    if (config.status_codes.empty()) {
        for (int code : run->status_deny)
            run->status_allow.erase(code);
    }
    run->filter_size  = std::set<long long>(config.filter_size.begin(), config.filter_size.end());
    run->filter_words = std::set<long long>(config.filter_words.begin(), config.filter_words.end());
    run->filter_lines = std::set<long long>(config.filter_lines.begin(), config.filter_lines.end());
    run->filter_regex = config.filter_regex;
    run->filter_similar       = config.filter_similar;
    run->similarity_threshold = config.similarity_threshold;
    run->dont_filter          = config.dont_filter;
    run->wildcard_tolerance   = config.wildcard_tolerance;

    run->extract_links = config.extract_links;

    run->collect_extensions = config.collect_extensions;
    run->dont_collect.clear();
    for (auto ext : config.dont_collect) {
        ext = Text::to_lower(Text::trim(ext));
        if (!ext.empty() && ext[0] == '.')
            ext.erase(0, 1);
        if (!ext.empty())
            run->dont_collect.push_back(ext);
    }
    run->collect_backups   = config.collect_backups;
    run->backup_extensions = config.backup_extensions;

    for (const auto& header : config.headers)
        run->headers.push_back(parse_header(header));
    run->user_agent    = config.user_agent;
    run->timeout       = config.timeout;
    run->insecure      = config.insecure;
    run->proxy         = config.proxy;
    run->retries       = config.retries;
    run->retry_backoff = config.retry_backoff;

    run->output = config.output;
    run->json   = config.json;

    validate(*run);
    return run;
}

void to_json(nlohmann::json& j, const RunConfig& config) {
    j = nlohmann::json{{"targets", config.targets},
                       {"wordlist", config.wordlist},
                       {"extensions", config.extensions},
                       {"depth", config.depth},
                       {"no_recursion", config.no_recursion},
                       {"force_recursion", config.force_recursion},
                       {"extensionless_dirs", config.extensionless_dirs},
                       {"threads", config.threads},
                       {"io_threads", config.io_threads},
                       {"scan_limit", config.scan_limit},
                       {"rate_limit", config.rate_limit},
                       {"auto_tune", config.auto_tune},
                       {"auto_bail", config.auto_bail},
                       {"tune_threshold", config.tune_threshold},
                       {"bail_threshold", config.bail_threshold},
                       {"error_window", config.error_window},
                       {"time_limit", config.time_limit.count()},
                       {"state_file", config.state_file},
                       {"no_state", config.no_state},
                       {"state_interval", config.state_interval},
                       {"dont_scan", config.dont_scan},
                       {"scope", config.scope},
                       {"status_allow", config.status_allow},
                       {"status_deny", config.status_deny},
                       {"filter_size", config.filter_size},
                       {"filter_words", config.filter_words},
                       {"filter_lines", config.filter_lines},
                       {"filter_regex", config.filter_regex},
                       {"filter_similar", config.filter_similar},
                       {"similarity_threshold", config.similarity_threshold},
                       {"dont_filter", config.dont_filter},
                       {"wildcard_tolerance", config.wildcard_tolerance},
                       {"extract_links", config.extract_links},
                       {"collect_extensions", config.collect_extensions},
                       {"dont_collect", config.dont_collect},
                       {"collect_backups", config.collect_backups},
                       {"backup_extensions", config.backup_extensions},
                       {"headers", config.headers},
                       {"user_agent", config.user_agent},
                       {"timeout", config.timeout},
                       {"insecure", config.insecure},
                       {"proxy", config.proxy},
                       {"retries", config.retries},
                       {"retry_backoff", config.retry_backoff},
                       {"output", config.output},
                       {"json", config.json}};
}

void from_json(const nlohmann::json& j, RunConfig& config) {
    j.at("targets").get_to(config.targets);
    j.at("wordlist").get_to(config.wordlist);
    j.at("extensions").get_to(config.extensions);
    j.at("depth").get_to(config.depth);
    j.at("no_recursion").get_to(config.no_recursion);
    j.at("force_recursion").get_to(config.force_recursion);
    j.at("extensionless_dirs").get_to(config.extensionless_dirs);
    j.at("threads").get_to(config.threads);
    j.at("io_threads").get_to(config.io_threads);
    j.at("scan_limit").get_to(config.scan_limit);
    j.at("rate_limit").get_to(config.rate_limit);
    j.at("auto_tune").get_to(config.auto_tune);
    j.at("auto_bail").get_to(config.auto_bail);
    j.at("tune_threshold").get_to(config.tune_threshold);
    j.at("bail_threshold").get_to(config.bail_threshold);
    j.at("error_window").get_to(config.error_window);
    config.time_limit = std::chrono::seconds(j.at("time_limit").get<long long>());
    j.at("state_file").get_to(config.state_file);
    j.at("no_state").get_to(config.no_state);
    j.at("state_interval").get_to(config.state_interval);
    j.at("dont_scan").get_to(config.dont_scan);
    j.at("scope").get_to(config.scope);
    j.at("status_allow").get_to(config.status_allow);
    j.at("status_deny").get_to(config.status_deny);
    j.at("filter_size").get_to(config.filter_size);
    j.at("filter_words").get_to(config.filter_words);
    j.at("filter_lines").get_to(config.filter_lines);
    j.at("filter_regex").get_to(config.filter_regex);
    j.at("filter_similar").get_to(config.filter_similar);
    j.at("similarity_threshold").get_to(config.similarity_threshold);
    j.at("dont_filter").get_to(config.dont_filter);
    j.at("wildcard_tolerance").get_to(config.wildcard_tolerance);
    j.at("extract_links").get_to(config.extract_links);
    j.at("headers").get_to(config.headers);
    j.at("user_agent").get_to(config.user_agent);
    j.at("timeout").get_to(config.timeout);
    j.at("insecure").get_to(config.insecure);
    j.at("proxy").get_to(config.proxy);
    j.at("retries").get_to(config.retries);
    j.at("retry_backoff").get_to(config.retry_backoff);
    j.at("output").get_to(config.output);
    config.collect_extensions = j.value("collect_extensions", false);
    config.dont_collect       = j.value("dont_collect", default_ignored_extensions());
    config.collect_backups    = j.value("collect_backups", false);
    config.backup_extensions  = j.value("backup_extensions", default_backup_extensions());
    config.json               = j.value("json", false);
}

}  // namespace Core
}  // namespace Burrow
