#include <iostream>
#include <optional>
#include "core/config/config.hpp"
#include "core/config/run_config.hpp"
#include "core/logger/logger.hpp"
#include "engine/control/control_plane.hpp"
#include "engine/governor/governor.hpp"
#include "engine/registry/scan_registry.hpp"
#include "engine/results/reporter.hpp"
#include "engine/results/response_buffer.hpp"
#include "filters/filter_store.hpp"
#include "network/http/beast_client.hpp"
#include "state/state_file.hpp"
#include "storage/disk_storage.hpp"
#include "utils/wordlist/wordlist.hpp"

namespace {

using namespace Burrow;

void configure_logger(const Core::Config& config) {
    int level = Core::LOG_DEFAULT;
    if (config.quiet)
        level = Core::LOG_WARN | Core::LOG_ERROR | Core::LOG_SUCCESS;
    if (config.verbose)
        level |= Core::LOG_DEBUG;
    Core::Logger::set_level(level);
}

Network::Http::ClientOptions client_options(const Core::RunConfig& config) {
    Network::Http::ClientOptions options;
    options.user_agent      = config.user_agent;
    options.proxy           = config.proxy;
    options.insecure        = config.insecure;
    options.connect_timeout = std::chrono::milliseconds(Core::Constants::CONNECT_TIMEOUT_MS);
    options.request_timeout = std::chrono::seconds(config.timeout);
    return options;
}

int run(const Core::Config& config) {
    std::shared_ptr<const Core::RunConfig> run_config;
    std::optional<State::StateFile>        resumed;

    if (!config.resume_from.empty()) {
        Storage::DiskStorage storage;
        resumed = State::StatePersistence::load(storage, config.resume_from);
        State::StatePersistence::check_compatible(resumed->config, config);
        run_config = std::make_shared<const Core::RunConfig>(resumed->config);
        Core::Logger::info("Resuming from " + config.resume_from);
    } else {
        run_config = Core::RunConfig::from(config);
    }

    auto words = Utils::Wordlist::load(run_config->wordlist);
    if (words.empty())
        throw Core::ConfigError("Wordlist " + run_config->wordlist + " has no usable entries");

    Engine::ScanRegistry   registry(run_config);
    Engine::ResponseBuffer responses;

    if (resumed) {
        State::StatePersistence::restore(*resumed, registry, responses);
    } else {
        for (const auto& target : run_config->targets)
            registry.register_scan(target, Core::ScanType::Initial, std::nullopt, 0);
    }

    Filters::FilterStore filters(Filters::FilterSet::from_config(*run_config));

    Engine::Reporter reporter(std::make_unique<Storage::DiskStorage>(), run_config->output,
                              run_config->json);

    auto options = client_options(*run_config);
    Engine::Governor governor(
        run_config, registry, filters, responses, std::move(words), [options](boost::asio::io_context& ioc) {
            return std::make_unique<Network::Http::BeastClient>(ioc, options);
        });
    governor.set_sink([&reporter](const Core::Response& response) { reporter.report(response); });

    std::unique_ptr<State::StatePersistence> persistence;
    if (!run_config->no_state) {
        std::string path = !run_config->state_file.empty()
                               ? run_config->state_file
                               : State::StatePersistence::default_path(*run_config);
        persistence = std::make_unique<State::StatePersistence>(
            run_config, registry, responses, std::make_unique<Storage::DiskStorage>(), path);
        governor.set_checkpoint([&persistence]() { persistence->checkpoint(); });
    }

    Engine::ControlPlane control(governor, registry);
    control.start();

    auto outcome = governor.run();
    control.stop();

    return static_cast<int>(outcome);
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        auto config = Burrow::Core::Config::parse(argc, argv);
        configure_logger(config);
        return run(config);
    } catch (const Burrow::Core::ConfigError& e) {
        Burrow::Core::Logger::error(e.what());
    } catch (const Burrow::State::StateError& e) {
        Burrow::Core::Logger::error(e.what());
    } catch (const std::exception& e) {
        Burrow::Core::Logger::error("Fatal: " + std::string(e.what()));
    }
    return 1;
}
