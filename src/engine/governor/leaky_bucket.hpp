#pragma once
#include <chrono>
#include <mutex>

namespace Burrow {
namespace Engine {

/**
 * @brief Token bucket shared by the workers of one scan.
 *
 * Holds at most `rate` tokens, starts half full and refills at `rate` tokens
 * per second. A rate of 0 disables throttling.
 */
class LeakyBucket {
public:
    using clock = std::chrono::steady_clock;

    explicit LeakyBucket(int rate, clock::time_point now = clock::now());

    /// Takes one token and returns how long the caller has to wait before using it.
    clock::duration reserve(clock::time_point now = clock::now());

    /// Lowers (or raises) the refill rate; excess stored tokens are discarded.
    void set_rate(int rate);
    int  rate() const;

private:
    mutable std::mutex mutex_;
    int                rate_;
    double             tokens_;
    clock::time_point  last_refill_;

    void refill(clock::time_point now);
};

}  // namespace Engine
}  // namespace Burrow
