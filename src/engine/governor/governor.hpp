#pragma once
#include <atomic>
#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio.hpp>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include "../../core/config/run_config.hpp"
#include "../../core/types/response.hpp"
#include "../../core/types/scan.hpp"
#include "../../filters/filter_store.hpp"
#include "../../filters/wildcard/wildcard_detector.hpp"
#include "../../network/http/http_client.hpp"
#include "../extractor/link_extractor.hpp"
#include "../recursion/recursion_policy.hpp"
#include "../registry/scan_registry.hpp"
#include "../results/response_buffer.hpp"
#include "auto_tuner.hpp"
#include "error_window.hpp"
#include "leaky_bucket.hpp"

#ifndef CPPCHECK
class GovernorTest_ExpandsExtensions_Test;
class GovernorTest_FinishedScansReleaseClients_Test;
#endif

namespace Burrow {
namespace Engine {

using namespace Burrow::Core;
using namespace Burrow::Network::Http;

enum class RunOutcome { Completed = 0, Unreachable = 1, Interrupted = 2, TimeLimit = 3 };

/// How a request came about; decides what a found file leads to.
enum class ProbeKind { Word, Link, Backup };

const char* to_string(RunOutcome outcome);

using ResponseSink   = std::function<void(const Response&)>;
using CheckpointHook = std::function<void()>;
using ClientFactory  = std::function<std::unique_ptr<HttpClient>(boost::asio::io_context&)>;

/// Shared flag tripped once when a scan is cancelled.
class CancellationToken {
public:
    void cancel() {
        flag_->store(true);
    }
    bool cancelled() const {
        return flag_->load();
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_ = std::make_shared<std::atomic<bool>>(false);
};

/// Runtime state of one admitted scan, shared by its workers and link probes.
struct ScanTask {
    ScanTask(const Scan& scan, int window_size);

    Scan                                  scan;  // as admitted
    std::atomic<size_t>                   next_index{0};
    std::atomic<int>                      target_threads{1};
    std::atomic<int>                      active_workers{0};
    std::atomic<std::uint64_t>            requests{0};
    LeakyBucket                           bucket;
    ErrorWindow                           window;
    CancellationToken                     token;
    std::chrono::steady_clock::time_point started;
    std::mutex                            tune_mutex;
    std::unique_ptr<HttpClient>           client;  // probes, robots.txt and wildcard checks

    double observed_rps() const;
};

/**
 * @brief Runs admitted scans on one io_context.
 *
 * Owns the scan-limit admission loop, per-scan worker pools, throttling,
 * auto-tune/auto-bail, the time limit and signal handling. Every accepted
 * response is handed to the sink; cancellation goes through cancel().
 */
class Governor {
#ifndef CPPCHECK
    friend class ::GovernorTest_ExpandsExtensions_Test;
    friend class ::GovernorTest_FinishedScansReleaseClients_Test;
#endif

public:
    Governor(std::shared_ptr<const RunConfig> config,
             ScanRegistry&                    registry,
             Burrow::Filters::FilterStore&    filters,
             ResponseBuffer&                  responses,
             std::vector<std::string>         wordlist,
             ClientFactory                    client_factory);
    ~Governor();

    void set_sink(ResponseSink sink);
    void set_checkpoint(CheckpointHook hook);

    /// Blocks until every scan is terminal, the time limit expires or a signal arrives.
    RunOutcome run();

    /// Cancels one scan; false if it is unknown or already terminal.
    bool   cancel(ScanId id, const std::string& reason);
    /// Cancels a scan and every non-terminal descendant. Returns how many were cancelled.
    size_t cancel_tree(ScanId id, const std::string& reason);

    /// Stops issuing requests and moves Running scans to Paused.
    void pause();
    void resume();
    bool is_paused() const {
        return paused_.load();
    }

    void trigger_done(RunOutcome outcome);

    std::uint64_t requests_made(ScanId id) const;

#ifdef CPPCHECK
public:
#else
private:
#endif
    boost::asio::io_context ioc_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
                             work_guard_;
    std::vector<std::thread> io_threads_;
    boost::asio::signal_set  signals_{ioc_};
    boost::asio::steady_timer time_limit_timer_{ioc_};

    std::shared_ptr<const RunConfig>  config_;
    ScanRegistry&                     registry_;
    Burrow::Filters::FilterStore&     filters_;
    ResponseBuffer&                   responses_;
    std::vector<std::string>          words_;
    ClientFactory                     client_factory_;
    ResponseSink                      sink_;
    CheckpointHook                    checkpoint_;

    AutoTuner                         tuner_;
    RecursionPolicy                   recursion_;
    LinkExtractor                     extractor_;
    Burrow::Filters::WildcardDetector wildcard_;

    std::map<ScanId, std::shared_ptr<ScanTask>> tasks_;
    mutable std::mutex                          tasks_mutex_;

    std::unordered_set<std::string> seen_links_;
    std::mutex                      links_mutex_;

    std::atomic<int>        running_tasks_{0};
    std::atomic<bool>       paused_{false};
    std::atomic<bool>       resource_warned_{false};
    std::atomic<bool>       done_{false};
    RunOutcome              outcome_ = RunOutcome::Completed;
    std::condition_variable done_cv_;
    std::mutex              done_mutex_;
    std::atomic<bool>       is_shutdown_{false};

    static std::vector<std::string> expand_wordlist(const std::vector<std::string>& words,
                                                    const std::vector<std::string>& extensions);

    void init_io_services();
    void init_signals();
    void init_timers();
    void await_completion();
    void shutdown();
    void on_time_limit();

    boost::asio::awaitable<void> startup();
    boost::asio::awaitable<bool> connectivity_test();
    boost::asio::awaitable<void> load_similarity_targets();
    boost::asio::awaitable<void> admission_loop();
    boost::asio::awaitable<void> checkpoint_loop();

    boost::asio::awaitable<void> run_scan(Scan scan);
    boost::asio::awaitable<void> scan_robots(std::shared_ptr<ScanTask> task);
    boost::asio::awaitable<void> worker_loop(std::shared_ptr<ScanTask> task, int slot);
    boost::asio::awaitable<void> probe_link(std::shared_ptr<ScanTask> task, std::string url, ProbeKind kind);

    boost::asio::awaitable<bool> wait_for_turn(ScanTask& task, boost::asio::steady_timer& timer);
    /// Gated GET with retries; empty when the run or the scan stopped before it was sent.
    boost::asio::awaitable<std::optional<HttpResponse>> send_with_retry(HttpClient&        client,
                                                                        ScanTask&          task,
                                                                        const std::string& url);

    /// Run-wide gate for requests that belong to no scan (startup checks).
    std::shared_ptr<ScanTask> make_gate(const std::string& name) const;
    /// The word itself plus one entry per configured and collected extension.
    std::vector<std::string>  candidates_for(const std::string& word) const;

    void record_outcome(const std::shared_ptr<ScanTask>& task, const HttpResponse& http);
    void process_response(const std::shared_ptr<ScanTask>& task, Response response, ProbeKind kind);
    void spawn_probes(const std::shared_ptr<ScanTask>& task,
                      const std::vector<std::string>&  urls,
                      ProbeKind                        kind);
    void register_file(const ScanTask& task, const std::string& url);
    void collect_extension(const Response& response);
};

}  // namespace Engine
}  // namespace Burrow
