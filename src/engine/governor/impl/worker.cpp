#include <algorithm>
#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include "../../../core/logger/logger.hpp"
#include "../../../core/types/constants.hpp"
#include "../../../filters/filter.hpp"
#include "../../../utils/text/string_utils.hpp"
#include "../../../utils/url/url.hpp"
#include "../governor.hpp"

namespace Burrow {
namespace Engine {

using Burrow::Utils::Url;

namespace {
constexpr int WORKER_POLL_INTERVAL_MS = 50;
constexpr int TOO_MANY_REQUESTS       = 429;

struct WorkerGuard {
    std::atomic<int>& count;
    explicit WorkerGuard(std::atomic<int>& c) : count(c) {
    }
    ~WorkerGuard() {
        count--;
    }
};

bool is_failure(const HttpResponse& http) {
    return http.failed() || http.status_code == TOO_MANY_REQUESTS;
}

boost::asio::awaitable<void> sleep_for(boost::asio::steady_timer&               timer,
                                       boost::asio::steady_timer::duration duration) {
    timer.expires_after(duration);
    boost::system::error_code ec;
    co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
}

}  // namespace

boost::asio::awaitable<void> Governor::worker_loop(std::shared_ptr<ScanTask> task, int slot) {
    WorkerGuard guard(task->active_workers);
    try {
        auto client = client_factory_(ioc_);

        while (!done_ && !task->token.cancelled()) {
            if (slot >= task->target_threads.load()) {
                Logger::debug("Worker " + std::to_string(slot) + " of " + task->scan.base_url
                              + " retired after tuning");
                co_return;
            }

            size_t index = task->next_index.fetch_add(1);
            if (index >= words_.size())
                co_return;

            for (const auto& candidate : candidates_for(words_[index])) {
                if (done_ || task->token.cancelled())
                    co_return;

                std::string url = Url::join(task->scan.base_url, candidate);
                if (recursion_.is_denied(url))
                    continue;

                auto sent = co_await send_with_retry(*client, *task, url);
                if (!sent)
                    co_return;

                const HttpResponse& http = *sent;
                record_outcome(task, http);
                if (http.failed()) {
                    Logger::debug("Request failed: " + url + " (" + to_string(http.error_type)
                                  + ": " + http.error + ")");
                    continue;
                }

                process_response(task, Response::from_http(http, url, task->scan.base_url),
                                 ProbeKind::Word);
            }
        }
    } catch (const std::exception& e) {
        Logger::error("Worker Loop Exception: " + std::string(e.what()));
    }
}

boost::asio::awaitable<bool> Governor::wait_for_turn(ScanTask& task, boost::asio::steady_timer& timer) {
    while (paused_ && !done_ && !task.token.cancelled())
        co_await sleep_for(timer, std::chrono::milliseconds(WORKER_POLL_INTERVAL_MS));

    if (done_ || task.token.cancelled())
        co_return false;

    auto wait = task.bucket.reserve();
    if (wait > LeakyBucket::clock::duration::zero())
        co_await sleep_for(timer, wait);

    co_return !done_ && !task.token.cancelled();
}

boost::asio::awaitable<std::optional<HttpResponse>>
Governor::send_with_retry(HttpClient& client, ScanTask& task, const std::string& url) {
    HttpResponse              http;
    boost::asio::steady_timer timer(ioc_);

    for (int attempt = 0; attempt <= config_->retries; ++attempt) {
        if (attempt > 0) {
            co_await sleep_for(timer, get_backoff_time(attempt, config_->retry_backoff));
            Logger::debug("Retry " + std::to_string(attempt) + " for " + url);
        }

        // Every attempt waits out a pause and takes a token from the scan's bucket.
        if (!co_await wait_for_turn(task, timer))
            co_return std::nullopt;

        task.requests++;
        http = co_await client.send(url, "GET", config_->headers);
        if (!is_failure(http))
            break;
    }
    co_return http;
}

void Governor::record_outcome(const std::shared_ptr<ScanTask>& task, const HttpResponse& http) {
    if (http.error_type == ErrorType::Resource && !resource_warned_.exchange(true))
        Logger::warn("Too many open files; lower --threads or --scan-limit, or raise ulimit -n");

    if (!tuner_.enabled())
        return;

    std::lock_guard<std::mutex> lock(task->tune_mutex);
    task->window.record(is_failure(http));
    if (!task->window.full() || task->token.cancelled())
        return;

    TuningState state;
    state.thread_count = task->target_threads.load();
    state.rate_limit   = task->bucket.rate();
    state.observed_rps = task->observed_rps();

    auto decision = tuner_.evaluate(task->window.error_rate(), state);
    switch (decision.action) {
        case TuningAction::None:
            break;
        case TuningAction::Tune:
            task->target_threads = decision.thread_count;
            task->bucket.set_rate(decision.rate_limit);
            registry_.update_tuning(task->scan.id, decision.thread_count, decision.rate_limit);
            task->window.clear();
            Logger::warn(task->scan.base_url + ": " + decision.reason);
            break;
        case TuningAction::Bail:
            task->window.clear();
            cancel(task->scan.id, decision.reason);
            break;
    }
}

void Governor::process_response(const std::shared_ptr<ScanTask>& task,
                                Response                         response,
                                ProbeKind                        kind) {
    auto verdict = Burrow::Filters::classify(response, *filters_.snapshot());
    if (!verdict.keep) {
        Logger::debug("Filtered (" + std::string(Burrow::Filters::to_string(verdict.stage))
                      + "): " + response.url);
        return;
    }

    if (!responses_.append(response))
        return;
    if (sink_)
        sink_(response);
    if (config_->collect_extensions)
        collect_extension(response);

    // Results of a cancelled scan are reported but never recursed into.
    if (task->token.cancelled())
        return;

    auto parent = registry_.find(task->scan.id);
    if (!parent)
        return;

    bool is_file = response.url.back() != '/';
    if (kind != ProbeKind::Word && is_file)
        register_file(*task, response.url);

    if (verdict.recurse)
        recursion_.consider(response, *parent, registry_);

    if (config_->collect_backups && kind != ProbeKind::Backup && is_file
        && !is_redirect(static_cast<int>(response.status_code)))
        spawn_probes(task, extractor_.backups(response.url, config_->backup_extensions),
                     ProbeKind::Backup);

    if (config_->extract_links && !response.body.empty())
        spawn_probes(task, extractor_.extract(response), ProbeKind::Link);
}

void Governor::register_file(const ScanTask& task, const std::string& url) {
    if (registry_.record_file(url, task.scan.id, task.scan.depth))
        Logger::debug("Recorded file " + url);
}

void Governor::collect_extension(const Response& response) {
    std::string extension = Burrow::Utils::Text::to_lower(Url::extension(response.url));
    if (extension.empty())
        return;

    const auto& configured = config_->extensions;
    const auto& ignored    = config_->dont_collect;
    if (std::find(configured.begin(), configured.end(), extension) != configured.end()
        || std::find(ignored.begin(), ignored.end(), extension) != ignored.end())
        return;

    if (registry_.add_extension(extension))
        Logger::info("Discovered new extension: " + extension);
}

void Governor::spawn_probes(const std::shared_ptr<ScanTask>& task,
                            const std::vector<std::string>&  urls,
                            ProbeKind                        kind) {
    for (const auto& url : urls) {
        {
            std::lock_guard<std::mutex> lock(links_mutex_);
            if (!seen_links_.insert(url).second)
                continue;
        }
        task->active_workers++;
        boost::asio::co_spawn(ioc_, probe_link(task, url, kind), boost::asio::detached);
    }
}

boost::asio::awaitable<void> Governor::probe_link(std::shared_ptr<ScanTask> task,
                                                  std::string               url,
                                                  ProbeKind                 kind) {
    WorkerGuard guard(task->active_workers);
    try {
        auto sent = co_await send_with_retry(*task->client, *task, url);
        if (!sent)
            co_return;

        const HttpResponse& http = *sent;
        record_outcome(task, http);
        if (http.failed()) {
            Logger::debug("Request failed: " + url + " (" + http.error + ")");
            co_return;
        }

        process_response(task, Response::from_http(http, url, Url::directory_of(url)), kind);
    } catch (const std::exception& e) {
        Logger::error("Request exception for " + url + ": " + std::string(e.what()));
    }
}

boost::asio::awaitable<void> Governor::scan_robots(std::shared_ptr<ScanTask> task) {
    std::string robots_url = Url::origin(task->scan.base_url) + "/robots.txt";
    Logger::debug("Fetching " + robots_url);

    auto sent = co_await send_with_retry(*task->client, *task, robots_url);
    if (!sent)
        co_return;

    const HttpResponse& http = *sent;
    if (http.failed() || !is_success(static_cast<int>(http.status_code))) {
        Logger::debug("No robots.txt at " + robots_url);
        co_return;
    }

    auto links = extractor_.extract_robots(robots_url, http.body);
    Logger::info("robots.txt lists " + std::to_string(links.size()) + " paths for "
                 + task->scan.base_url);
    spawn_probes(task, links, ProbeKind::Link);
}

}  // namespace Engine
}  // namespace Burrow
