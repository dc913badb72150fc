#pragma once
#include <string>

#include "../../core/config/run_config.hpp"

namespace Burrow {
namespace Engine {

struct TuningState {
    int    thread_count = 1;
    int    rate_limit   = 0;  // 0 = unlimited
    double observed_rps = 0.0;
};

enum class TuningAction { None, Tune, Bail };

struct TuningDecision {
    TuningAction action       = TuningAction::None;
    int          thread_count = 1;
    int          rate_limit   = 0;
    std::string  reason;
};

/**
 * @brief Auto-tune / auto-bail policy for one full error window.
 *
 * Tuning only ever lowers thread count and rate. Bailing requires tuning to
 * have reached a single thread when auto-tune is enabled.
 */
class AutoTuner {
public:
    explicit AutoTuner(const Burrow::Core::RunConfig& config);

    bool enabled() const {
        return auto_tune_ || auto_bail_;
    }

    TuningDecision evaluate(double error_rate, const TuningState& state) const;

private:
    bool   auto_tune_;
    bool   auto_bail_;
    double tune_threshold_;
    double bail_threshold_;
    int    window_;
};

}  // namespace Engine
}  // namespace Burrow
