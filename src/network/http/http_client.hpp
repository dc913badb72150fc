#pragma once

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio.hpp>
#include <chrono>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace Burrow {
namespace Network {
namespace Http {

enum class ErrorType { None, Network, Timeout, Resource, Proxy, Other };

using Headers = std::vector<std::pair<std::string, std::string>>;

struct HttpResponse {
    std::string                        effective_url;
    std::string                        method = "GET";
    long                               status_code = 0;
    std::map<std::string, std::string> headers;  // lower-cased names
    std::string                        body;
    std::chrono::milliseconds          elapsed{0};
    std::string                        error;
    ErrorType                          error_type = ErrorType::None;

    bool failed() const {
        return error_type != ErrorType::None;
    }

    std::string header(const std::string& name) const {
        auto it = headers.find(name);
        return it == headers.end() ? "" : it->second;
    }
};

const char* to_string(ErrorType type);

class HttpClient {
public:
    virtual ~HttpClient() = default;

    /// Never throws for request-level failures; they come back with error_type set.
    virtual boost::asio::awaitable<HttpResponse>
    send(const std::string& url, const std::string& method, const Headers& headers) = 0;
};

}  // namespace Http
}  // namespace Network
}  // namespace Burrow
