#pragma once
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "../core/config/config.hpp"
#include "../core/config/run_config.hpp"
#include "../core/types/response.hpp"
#include "../core/types/scan.hpp"
#include "../engine/registry/scan_registry.hpp"
#include "../engine/results/response_buffer.hpp"
#include "../storage/storage.hpp"

namespace Burrow {
namespace State {

using Burrow::Core::Response;
using Burrow::Core::RunConfig;
using Burrow::Core::Scan;

class StateError : public std::runtime_error {
public:
    explicit StateError(const std::string& message) : std::runtime_error(message) {
    }
};

/// {"scans": [...], "config": {...}, "responses": [...], "collected_extensions": [...]}
struct StateFile {
    std::vector<Scan>        scans;
    RunConfig                config;
    std::vector<Response>    responses;
    std::vector<std::string> collected_extensions;

    std::string serialize() const;

    /// Throws StateError on malformed input.
    static StateFile deserialize(const std::string& text);
};

/**
 * @brief Checkpoints a run and restores it on --resume-from.
 */
class StatePersistence {
public:
    StatePersistence(std::shared_ptr<const RunConfig>         config,
                     const Burrow::Engine::ScanRegistry&      registry,
                     const Burrow::Engine::ResponseBuffer&    responses,
                     std::unique_ptr<Burrow::Storage::Storage> storage,
                     std::string                              path);

    StateFile capture() const;

    /// Writes the current state; false (logged) on I/O failure.
    bool checkpoint() const;

    const std::string& path() const {
        return path_;
    }

    /// Reads and parses a state file; throws StateError.
    static StateFile load(const Burrow::Storage::Storage& storage, const std::string& path);

    /// Saved targets and wordlist must match whatever the current invocation names.
    static void check_compatible(const RunConfig& saved, const Burrow::Core::Config& invocation);

    /// Complete scans stay Complete, everything else starts over as Queued.
    static std::vector<Scan> reseed(const std::vector<Scan>& scans);

    static void restore(const StateFile&                  state,
                        Burrow::Engine::ScanRegistry&     registry,
                        Burrow::Engine::ResponseBuffer&   responses);

    static std::string default_path(const RunConfig& config);

private:
    std::shared_ptr<const RunConfig>          config_;
    const Burrow::Engine::ScanRegistry&       registry_;
    const Burrow::Engine::ResponseBuffer&     responses_;
    std::unique_ptr<Burrow::Storage::Storage> storage_;
    std::string                               path_;
};

}  // namespace State
}  // namespace Burrow
