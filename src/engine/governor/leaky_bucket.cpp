#include "leaky_bucket.hpp"
#include <algorithm>

namespace Burrow {
namespace Engine {

LeakyBucket::LeakyBucket(int rate, clock::time_point now)
    : rate_(std::max(rate, 0)), tokens_(rate_ / 2.0), last_refill_(now) {
}

void LeakyBucket::refill(clock::time_point now) {
    if (now <= last_refill_)
        return;
    std::chrono::duration<double> elapsed = now - last_refill_;
    tokens_      = std::min<double>(rate_, tokens_ + elapsed.count() * rate_);
    last_refill_ = now;
}

LeakyBucket::clock::duration LeakyBucket::reserve(clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (rate_ == 0)
        return clock::duration::zero();

    refill(now);
    tokens_ -= 1.0;
    if (tokens_ >= 0.0)
        return clock::duration::zero();

    // Negative balance: this caller queues behind everyone already waiting.
    std::chrono::duration<double> wait(-tokens_ / rate_);
    return std::chrono::duration_cast<clock::duration>(wait);
}

void LeakyBucket::set_rate(int rate) {
    std::lock_guard<std::mutex> lock(mutex_);
    refill(clock::now());
    rate_ = std::max(rate, 0);
    if (rate_ > 0)
        tokens_ = std::min<double>(tokens_, rate_);
    else
        tokens_ = 0.0;
}

int LeakyBucket::rate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rate_;
}

}  // namespace Engine
}  // namespace Burrow
