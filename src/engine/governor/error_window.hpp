#pragma once
#include <deque>
#include <mutex>

namespace Burrow {
namespace Engine {

/// Outcomes of the most recent requests of one scan.
class ErrorWindow {
public:
    explicit ErrorWindow(size_t capacity);

    void record(bool failed);
    void clear();

    bool   full() const;
    size_t size() const;
    size_t failures() const;
    double error_rate() const;

private:
    mutable std::mutex mutex_;
    size_t             capacity_;
    std::deque<bool>   outcomes_;
    size_t             failures_ = 0;
};

}  // namespace Engine
}  // namespace Burrow
