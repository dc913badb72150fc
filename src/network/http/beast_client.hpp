#pragma once

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <string>
#include "http_client.hpp"

namespace Burrow {
namespace Network {
namespace Http {

struct ClientOptions {
    std::string               user_agent;
    std::string               proxy;
    bool                      insecure = false;
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds request_timeout{7000};
};

/**
 * @brief HTTP/1.1 client on Boost.Beast coroutines.
 *
 * One connection per request, redirects are reported rather than followed.
 * Supports plain HTTP proxies (absolute-form for http, CONNECT for https).
 */
class BeastClient : public HttpClient {
public:
    BeastClient(boost::asio::io_context& ioc, ClientOptions options);
    ~BeastClient() override = default;

    boost::asio::awaitable<HttpResponse>
    send(const std::string& url, const std::string& method, const Headers& headers) override;

private:
    ClientOptions             options_;
    boost::asio::ssl::context ssl_ctx_{boost::asio::ssl::context::tlsv12_client};

    boost::asio::awaitable<void> perform_http_request(const std::string& host,
                                                      const std::string& port,
                                                      const std::string& target,
                                                      const Headers&     headers,
                                                      HttpResponse&      response);
    boost::asio::awaitable<void> perform_https_request(const std::string& host,
                                                       const std::string& port,
                                                       const std::string& target,
                                                       const Headers&     headers,
                                                       HttpResponse&      response);

    boost::asio::awaitable<void> open_tunnel(boost::beast::tcp_stream& stream,
                                             const std::string&        host,
                                             const std::string&        port);

    boost::beast::http::request<boost::beast::http::empty_body>
    build_request(const std::string& method,
                  const std::string& host,
                  const std::string& target,
                  const Headers&     headers) const;
};

}  // namespace Http
}  // namespace Network
}  // namespace Burrow
