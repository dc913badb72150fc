#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include "../../../core/logger/logger.hpp"
#include "../../../filters/filter.hpp"
#include "../../../utils/url/url.hpp"
#include "../governor.hpp"

namespace Burrow {
namespace Engine {

using Burrow::Filters::SimilarityFilter;

namespace {
constexpr int ADMISSION_POLL_INTERVAL_MS = 50;
constexpr int SCAN_POLL_INTERVAL_MS      = 50;
}  // namespace

Governor::~Governor() {
    shutdown();
}

RunOutcome Governor::run() {
    done_    = false;
    outcome_ = RunOutcome::Completed;

    Logger::info("Governor: " + std::to_string(registry_.size()) + " scans registered, "
                 + std::to_string(words_.size() * (config_->extensions.size() + 1))
                 + " requests per directory");

    init_io_services();
    init_signals();
    init_timers();
    boost::asio::co_spawn(ioc_, startup(), boost::asio::detached);

    await_completion();
    shutdown();

    bool unfinished = outcome_ == RunOutcome::Interrupted || outcome_ == RunOutcome::TimeLimit;
    if (unfinished && checkpoint_)
        checkpoint_();

    Logger::info("Finished (" + std::string(to_string(outcome_)) + "): "
                 + std::to_string(registry_.count(ScanStatus::Complete)) + " complete, "
                 + std::to_string(registry_.count(ScanStatus::Cancelled)) + " cancelled, "
                 + std::to_string(responses_.size()) + " results");
    return outcome_;
}

void Governor::init_io_services() {
    if (ioc_.stopped())
        ioc_.restart();
    work_guard_ =
        std::make_unique<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
            ioc_.get_executor());
    for (int i = 0; i < config_->io_threads; ++i) {
        io_threads_.emplace_back([this]() {
            try {
                ioc_.run();
            } catch (const std::exception& e) {
                Logger::error("IO Thread Exception: " + std::string(e.what()));
            }
        });
    }
    Logger::debug("Started " + std::to_string(config_->io_threads) + " IO threads");
}

void Governor::init_signals() {
    signals_.clear();
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait([this](const boost::system::error_code& error, int signal_number) {
        if (!error) {
            Logger::warn("Signal " + std::to_string(signal_number) + " received, stopping");
            trigger_done(RunOutcome::Interrupted);
        }
    });
}

void Governor::init_timers() {
    if (config_->time_limit.count() > 0) {
        time_limit_timer_.expires_after(config_->time_limit);
        time_limit_timer_.async_wait([this](const boost::system::error_code& error) {
            if (!error)
                on_time_limit();
        });
    }

    if (config_->state_interval > 0 && checkpoint_)
        boost::asio::co_spawn(ioc_, checkpoint_loop(), boost::asio::detached);
}

void Governor::on_time_limit() {
    Logger::warn("Time limit of " + std::to_string(config_->time_limit.count())
                 + "s reached, cancelling remaining scans");
    for (const auto& scan : registry_.list([](const Scan& s) { return !s.is_terminal(); }))
        cancel(scan.id, "time limit");
    trigger_done(RunOutcome::TimeLimit);
}

void Governor::await_completion() {
    std::unique_lock<std::mutex> lock(done_mutex_);
    done_cv_.wait(lock, [this] { return done_.load(); });
}

void Governor::trigger_done(RunOutcome outcome) {
    {
        std::lock_guard<std::mutex> lock(done_mutex_);
        if (done_)
            return;
        outcome_ = outcome;
        done_    = true;
    }
    done_cv_.notify_all();
}

void Governor::shutdown() {
    if (is_shutdown_.exchange(true))
        return;

    done_ = true;
    Logger::debug("Shutting down IO threads...");

    work_guard_.reset();
    ioc_.stop();

    for (auto& t : io_threads_) {
        if (t.get_id() == std::this_thread::get_id())
            continue;
        if (t.joinable())
            t.join();
    }
    io_threads_.clear();
}

boost::asio::awaitable<void> Governor::startup() {
    try {
        if (!co_await connectivity_test()) {
            trigger_done(RunOutcome::Unreachable);
            co_return;
        }
        co_await load_similarity_targets();
    } catch (const std::exception& e) {
        Logger::error("Startup checks failed: " + std::string(e.what()));
    }
    co_await admission_loop();
}

boost::asio::awaitable<bool> Governor::connectivity_test() {
    auto targets = registry_.list([](const Scan& s) {
        return s.scan_type == ScanType::Initial && s.status == ScanStatus::Queued;
    });
    if (targets.empty())
        co_return true;

    auto   gate      = make_gate("connectivity test");
    auto   client    = client_factory_(ioc_);
    size_t reachable = 0;
    for (const auto& scan : targets) {
        auto sent = co_await send_with_retry(*client, *gate, scan.base_url);
        if (!sent)
            co_return true;

        if (sent->failed()) {
            Logger::warn("Could not connect to " + scan.base_url + ", skipping (" + sent->error + ")");
            cancel(scan.id, "unreachable");
            continue;
        }
        reachable++;
    }

    if (reachable == 0) {
        Logger::error("Could not connect to any target provided");
        co_return false;
    }
    co_return true;
}

boost::asio::awaitable<void> Governor::load_similarity_targets() {
    if (config_->filter_similar.empty())
        co_return;

    auto gate   = make_gate("similarity targets");
    auto client = client_factory_(ioc_);
    for (const auto& url : config_->filter_similar) {
        auto sent = co_await send_with_retry(*client, *gate, url);
        if (!sent)
            co_return;

        const HttpResponse& http = *sent;
        if (http.failed()) {
            Logger::warn("Could not fetch similarity target " + url + ": " + http.error);
            continue;
        }
        auto page = Response::from_http(http, url, Burrow::Utils::Url::directory_of(url));
        filters_.add_filter(SimilarityFilter{url, page.fingerprint, config_->similarity_threshold});
        Logger::info("Filtering pages similar to " + url);
    }
}

boost::asio::awaitable<void> Governor::admission_loop() {
    boost::asio::steady_timer timer(ioc_);

    while (!done_) {
        if (!paused_) {
            while (auto scan = registry_.admit_next(config_->scan_limit)) {
                running_tasks_++;
                boost::asio::co_spawn(ioc_, run_scan(*scan), boost::asio::detached);
            }
        }

        if (running_tasks_ == 0 && !registry_.has_pending()) {
            trigger_done(RunOutcome::Completed);
            co_return;
        }

        timer.expires_after(std::chrono::milliseconds(ADMISSION_POLL_INTERVAL_MS));
        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
}

boost::asio::awaitable<void> Governor::checkpoint_loop() {
    boost::asio::steady_timer timer(ioc_);
    while (!done_) {
        timer.expires_after(std::chrono::seconds(config_->state_interval));
        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec || done_)
            co_return;
        checkpoint_();
    }
}

boost::asio::awaitable<void> Governor::run_scan(Scan scan) {
    auto task = std::make_shared<ScanTask>(scan, config_->error_window);
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        tasks_[scan.id] = task;
    }
    // A cancel may have landed between admission and registration of the task.
    auto current = registry_.find(scan.id);
    if (current && current->status == ScanStatus::Cancelled)
        task->token.cancel();

    Logger::info("Scanning " + scan.base_url + " (depth " + std::to_string(scan.depth) + ", "
                 + std::to_string(task->target_threads.load()) + " threads)");

    try {
        task->client = client_factory_(ioc_);

        if (scan.scan_type == ScanType::Initial && config_->extract_links)
            co_await scan_robots(task);

        if (!task->token.cancelled() && !done_) {
            Burrow::Filters::RequestSender send = [this, task](const std::string& url) {
                return send_with_retry(*task->client, *task, url);
            };
            co_await wildcard_.detect(send, scan.base_url);
        }

        int threads = task->target_threads.load();
        for (int slot = 0; slot < threads && !task->token.cancelled(); ++slot) {
            task->active_workers++;
            boost::asio::co_spawn(ioc_, worker_loop(task, slot), boost::asio::detached);
        }

        boost::asio::steady_timer timer(ioc_);
        while (task->active_workers > 0 && !done_) {
            timer.expires_after(std::chrono::milliseconds(SCAN_POLL_INTERVAL_MS));
            boost::system::error_code ec;
            co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }
    } catch (const std::exception& e) {
        Logger::error("Scan of " + scan.base_url + " failed: " + std::string(e.what()));
    }

    if (!done_ && !task->token.cancelled()) {
        if (registry_.transition(scan.id, ScanStatus::Complete))
            Logger::info("Finished " + scan.base_url + " (" + std::to_string(task->requests.load())
                         + " requests)");
    }
    // Only the counters outlive the scan; link requests still in flight keep the client.
    if (task->active_workers == 0)
        task->client.reset();
    running_tasks_--;
}

}  // namespace Engine
}  // namespace Burrow
