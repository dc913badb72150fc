#include "error_window.hpp"
#include <algorithm>

namespace Burrow {
namespace Engine {

ErrorWindow::ErrorWindow(size_t capacity) : capacity_(std::max<size_t>(capacity, 1)) {
}

void ErrorWindow::record(bool failed) {
    std::lock_guard<std::mutex> lock(mutex_);
    outcomes_.push_back(failed);
    if (failed)
        ++failures_;
    if (outcomes_.size() > capacity_) {
        if (outcomes_.front())
            --failures_;
        outcomes_.pop_front();
    }
}

void ErrorWindow::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    outcomes_.clear();
    failures_ = 0;
}

bool ErrorWindow::full() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_.size() >= capacity_;
}

size_t ErrorWindow::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_.size();
}

size_t ErrorWindow::failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

double ErrorWindow::error_rate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (outcomes_.empty())
        return 0.0;
    return static_cast<double>(failures_) / static_cast<double>(outcomes_.size());
}

}  // namespace Engine
}  // namespace Burrow
