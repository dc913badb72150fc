#include "response_buffer.hpp"

namespace Burrow {
namespace Engine {

std::string ResponseBuffer::key_for(const Response& response) {
    return response.method + " " + response.url;
}

bool ResponseBuffer::append(const Response& response) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!seen_.insert(key_for(response)).second)
        return false;

    Response stored = response;
    stored.body.clear();
    stored.body.shrink_to_fit();
    responses_.push_back(std::move(stored));
    return true;
}

std::vector<Response> ResponseBuffer::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return responses_;
}

size_t ResponseBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return responses_.size();
}

bool ResponseBuffer::contains(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& response : responses_) {
        if (response.url == url)
            return true;
    }
    return false;
}

void ResponseBuffer::restore(const std::vector<Response>& responses) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_.clear();
    seen_.clear();
    for (const auto& response : responses) {
        if (seen_.insert(key_for(response)).second)
            responses_.push_back(response);
    }
}

}  // namespace Engine
}  // namespace Burrow
