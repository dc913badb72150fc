#pragma once
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "../../core/types/response.hpp"

namespace Burrow {
namespace Engine {

using Burrow::Core::Response;

/// Every accepted response of the run, in discovery order.
class ResponseBuffer {
public:
    /// False when a response for the same method and url was already collected.
    bool append(const Response& response);

    std::vector<Response> snapshot() const;
    size_t                size() const;
    bool                  contains(const std::string& url) const;

    /// Seeds the buffer with responses reported by an earlier run.
    void restore(const std::vector<Response>& responses);

private:
    mutable std::mutex              mutex_;
    std::vector<Response>           responses_;
    std::unordered_set<std::string> seen_;

    static std::string key_for(const Response& response);
};

}  // namespace Engine
}  // namespace Burrow
