#include "governor.hpp"
#include <algorithm>
#include "../../core/logger/logger.hpp"

namespace Burrow {
namespace Engine {

const char* to_string(RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::Completed:
            return "completed";
        case RunOutcome::Unreachable:
            return "unreachable";
        case RunOutcome::Interrupted:
            return "interrupted";
        case RunOutcome::TimeLimit:
            return "time limit";
    }
    return "unknown";
}

ScanTask::ScanTask(const Scan& scan, int window_size)
    : scan(scan),
      target_threads(std::max(1, scan.thread_count)),
      bucket(scan.rate_limit),
      window(static_cast<size_t>(window_size)),
      started(std::chrono::steady_clock::now()) {
}

double ScanTask::observed_rps() const {
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    if (elapsed <= 0.0)
        return 0.0;
    return static_cast<double>(requests.load()) / elapsed;
}

Governor::Governor(std::shared_ptr<const RunConfig> config,
                   ScanRegistry&                    registry,
                   Burrow::Filters::FilterStore&    filters,
                   ResponseBuffer&                  responses,
                   std::vector<std::string>         wordlist,
                   ClientFactory                    client_factory)
    : config_(config),
      registry_(registry),
      filters_(filters),
      responses_(responses),
      words_(std::move(wordlist)),
      client_factory_(std::move(client_factory)),
      tuner_(*config),
      recursion_(config),
      extractor_(recursion_),
      wildcard_(config, filters) {
}

std::vector<std::string> Governor::expand_wordlist(const std::vector<std::string>& words,
                                                   const std::vector<std::string>& extensions) {
    std::vector<std::string> expanded;
    expanded.reserve(words.size() * (extensions.size() + 1));
    for (const auto& word : words) {
        expanded.push_back(word);
        for (const auto& ext : extensions)
            expanded.push_back(word + "." + ext);
    }
    return expanded;
}

std::vector<std::string> Governor::candidates_for(const std::string& word) const {
    std::vector<std::string> extensions = config_->extensions;
    if (config_->collect_extensions) {
        for (auto& ext : registry_.extensions()) {
            if (std::find(extensions.begin(), extensions.end(), ext) == extensions.end())
                extensions.push_back(std::move(ext));
        }
    }
    return expand_wordlist({word}, extensions);
}

std::shared_ptr<ScanTask> Governor::make_gate(const std::string& name) const {
    Scan setup;
    setup.base_url   = name;
    setup.rate_limit = config_->rate_limit;
    return std::make_shared<ScanTask>(setup, config_->error_window);
}

void Governor::set_sink(ResponseSink sink) {
    sink_ = std::move(sink);
}

void Governor::set_checkpoint(CheckpointHook hook) {
    checkpoint_ = std::move(hook);
}

bool Governor::cancel(ScanId id, const std::string& reason) {
    if (!registry_.transition(id, ScanStatus::Cancelled, reason))
        return false;

    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        auto                        it = tasks_.find(id);
        if (it != tasks_.end())
            it->second->token.cancel();
    }

    auto scan = registry_.find(id);
    Logger::warn("Cancelled scan of " + (scan ? scan->base_url : std::to_string(id)) + " ("
                 + reason + ")");
    return true;
}

size_t Governor::cancel_tree(ScanId id, const std::string& reason) {
    std::vector<ScanId> tree{id};
    for (ScanId child : registry_.descendants(id))
        tree.push_back(child);

    size_t cancelled = 0;
    for (ScanId member : tree) {
        auto scan = registry_.find(member);
        if (scan && !scan->is_terminal() && cancel(member, reason))
            cancelled++;
    }
    return cancelled;
}

void Governor::pause() {
    if (paused_.exchange(true))
        return;
    for (const auto& scan : registry_.list([](const Scan& s) { return s.status == ScanStatus::Running; }))
        registry_.transition(scan.id, ScanStatus::Paused);
    Logger::info("Paused; no new requests are issued");
}

void Governor::resume() {
    for (const auto& scan : registry_.list([](const Scan& s) { return s.status == ScanStatus::Paused; }))
        registry_.transition(scan.id, ScanStatus::Running);
    if (paused_.exchange(false))
        Logger::info("Resumed");
}

std::uint64_t Governor::requests_made(ScanId id) const {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    auto                        it = tasks_.find(id);
    return it == tasks_.end() ? 0 : it->second->requests.load();
}

}  // namespace Engine
}  // namespace Burrow
