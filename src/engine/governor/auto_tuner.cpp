#include "auto_tuner.hpp"
#include <algorithm>
#include <cmath>

namespace Burrow {
namespace Engine {

namespace {

std::string percent(double ratio) {
    return std::to_string(static_cast<int>(std::lround(ratio * 100.0))) + "%";
}

}  // namespace

AutoTuner::AutoTuner(const Burrow::Core::RunConfig& config)
    : auto_tune_(config.auto_tune),
      auto_bail_(config.auto_bail),
      tune_threshold_(config.tune_threshold),
      bail_threshold_(config.bail_threshold),
      window_(config.error_window) {
}

TuningDecision AutoTuner::evaluate(double error_rate, const TuningState& state) const {
    TuningDecision decision;
    decision.thread_count = state.thread_count;
    decision.rate_limit   = state.rate_limit;

    bool bottomed_out = !auto_tune_ || state.thread_count <= 1;
    if (auto_bail_ && bottomed_out && error_rate >= bail_threshold_) {
        decision.action = TuningAction::Bail;
        decision.reason = "auto-bail: " + percent(error_rate) + " of the last "
                          + std::to_string(window_) + " requests failed";
        return decision;
    }

    if (!auto_tune_ || error_rate < tune_threshold_)
        return decision;

    int threads = std::max(1, state.thread_count / 2);
    int rate    = state.rate_limit > 0
                      ? std::max(1, state.rate_limit / 2)
                      : std::max(1, static_cast<int>(state.observed_rps / 2.0));

    if (threads == state.thread_count && rate == state.rate_limit)
        return decision;

    decision.action       = TuningAction::Tune;
    decision.thread_count = threads;
    decision.rate_limit   = rate;
    decision.reason       = "auto-tune: " + percent(error_rate) + " errors, threads "
                      + std::to_string(state.thread_count) + " -> " + std::to_string(threads)
                      + ", rate " + std::to_string(rate) + "/s";
    return decision;
}

}  // namespace Engine
}  // namespace Burrow
