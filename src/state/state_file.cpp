#include "state_file.hpp"
#include <algorithm>
#include <chrono>
#include <nlohmann/json.hpp>
#include "../core/logger/logger.hpp"
#include "../utils/url/url.hpp"

namespace Burrow {
namespace State {

using namespace Burrow::Core;
using namespace Burrow::Engine;
using json = nlohmann::json;

std::string StateFile::serialize() const {
    json j;
    j["scans"]     = scans;
    j["config"]    = config;
    j["responses"] = responses;
    j["collected_extensions"] = collected_extensions;
    return j.dump(Constants::STATE_FILE_INDENT);
}

StateFile StateFile::deserialize(const std::string& text) {
    StateFile state;
    try {
        json j = json::parse(text);
        j.at("scans").get_to(state.scans);
        j.at("config").get_to(state.config);
        j.at("responses").get_to(state.responses);
        state.collected_extensions =
            j.value("collected_extensions", std::vector<std::string>());
    } catch (const json::exception& e) {
        throw StateError("Malformed state file: " + std::string(e.what()));
    } catch (const std::invalid_argument& e) {
        throw StateError("Malformed state file: " + std::string(e.what()));
    }

    try {
        RunConfig::validate(state.config);
    } catch (const ConfigError& e) {
        throw StateError("State file holds an invalid configuration: " + std::string(e.what()));
    }
    return state;
}

StatePersistence::StatePersistence(std::shared_ptr<const RunConfig>          config,
                                   const ScanRegistry&                       registry,
                                   const ResponseBuffer&                     responses,
                                   std::unique_ptr<Burrow::Storage::Storage> storage,
                                   std::string                               path)
    : config_(std::move(config)),
      registry_(registry),
      responses_(responses),
      storage_(std::move(storage)),
      path_(std::move(path)) {
}

StateFile StatePersistence::capture() const {
    StateFile state;
    state.scans     = registry_.snapshot();
    state.config    = *config_;
    state.responses = responses_.snapshot();
    state.collected_extensions = registry_.extensions();
    return state;
}

bool StatePersistence::checkpoint() const {
    StateFile state = capture();
    if (!storage_->save(path_, state.serialize())) {
        Logger::error("Could not write state file " + path_);
        return false;
    }
    Logger::info("State saved to " + path_ + " (" + std::to_string(state.scans.size())
                 + " scans, " + std::to_string(state.responses.size()) + " results)");
    return true;
}

StateFile StatePersistence::load(const Burrow::Storage::Storage& storage, const std::string& path) {
    std::string text;
    try {
        text = storage.load(path);
    } catch (const std::runtime_error& e) {
        throw StateError("Cannot read state file: " + std::string(e.what()));
    }
    return StateFile::deserialize(text);
}

void StatePersistence::check_compatible(const RunConfig& saved, const Config& invocation) {
    if (!invocation.urls.empty()) {
        std::vector<std::string> requested;
        try {
            for (const auto& url : invocation.urls)
                requested.push_back(normalize_target(url));
        } catch (const ConfigError& e) {
            throw StateError(e.what());
        }
        std::vector<std::string> recorded = saved.targets;
        std::sort(requested.begin(), requested.end());
        std::sort(recorded.begin(), recorded.end());
        if (requested != recorded)
            throw StateError("State file was recorded for different targets");
    }

    if (!invocation.wordlist.empty() && invocation.wordlist != saved.wordlist)
        throw StateError("State file was recorded with wordlist " + saved.wordlist + ", not "
                         + invocation.wordlist);
}

std::vector<Scan> StatePersistence::reseed(const std::vector<Scan>& scans) {
    std::vector<Scan> result;
    result.reserve(scans.size());
    for (auto scan : scans) {
        if (scan.status != ScanStatus::Complete) {
            scan.status = ScanStatus::Queued;
            scan.cancel_reason.clear();
        }
        result.push_back(std::move(scan));
    }
    return result;
}

void StatePersistence::restore(const StateFile& state,
                               ScanRegistry&    registry,
                               ResponseBuffer&  responses) {
    auto scans = reseed(state.scans);
    registry.restore(scans, state.collected_extensions);
    responses.restore(state.responses);

    size_t queued = static_cast<size_t>(std::count_if(scans.begin(), scans.end(), [](const Scan& s) {
        return s.status == ScanStatus::Queued;
    }));
    Logger::info("Resumed " + std::to_string(scans.size()) + " scans (" + std::to_string(queued)
                 + " to run) and " + std::to_string(state.responses.size()) + " results");
}

std::string StatePersistence::default_path(const RunConfig& config) {
    std::string host = "scan";
    if (!config.targets.empty()) {
        auto parsed = Burrow::Utils::Url::parse(config.targets.front());
        host        = parsed.port.empty() ? parsed.host : parsed.host + ":" + parsed.port;
    }
    std::replace(host.begin(), host.end(), ':', '_');
    auto now = std::chrono::duration_cast<std::chrono::seconds>(
                   std::chrono::system_clock::now().time_since_epoch())
                   .count();
    return "burrow-" + host + "-" + std::to_string(now) + ".state";
}

}  // namespace State
}  // namespace Burrow
