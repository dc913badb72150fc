#include "beast_client.hpp"
#include "../../core/types/constants.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"

namespace Burrow {
namespace Network {
namespace Http {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

namespace {

ErrorType classify_error(const boost::system::error_code& ec) {
    if (ec == beast::error::timeout || ec == net::error::timed_out)
        return ErrorType::Timeout;
    if (ec == boost::system::errc::too_many_files_open
        || ec == boost::system::errc::too_many_files_open_in_system)
        return ErrorType::Resource;
    return ErrorType::Network;
}

template <typename Stream>
net::awaitable<void> exchange(Stream&                                 stream,
                              const http::request<http::empty_body>&  req,
                              HttpResponse&                           response) {
    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer                       buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(Burrow::Core::Constants::MAX_BODY_BYTES);
    parser.skip(req.method() == http::verb::head);
    co_await http::async_read(stream, buffer, parser, net::use_awaitable);

    auto& res            = parser.get();
    response.status_code = res.result_int();
    for (const auto& field : res) {
        std::string name  = Burrow::Utils::Text::to_lower(std::string(field.name_string()));
        std::string value = std::string(field.value());
        auto        it    = response.headers.find(name);
        if (it == response.headers.end())
            response.headers.emplace(std::move(name), std::move(value));
        else
            it->second += ", " + value;
    }
    response.body = std::move(res.body());
}

}  // namespace

BeastClient::BeastClient(net::io_context& /*ioc*/, ClientOptions options)
    : options_(std::move(options)) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(options_.insecure ? ssl::verify_none : ssl::verify_peer);
}

http::request<http::empty_body> BeastClient::build_request(const std::string& method,
                                                           const std::string& host,
                                                           const std::string& target,
                                                           const Headers&     headers) const {
    http::request<http::empty_body> req;
    http::verb                      verb = http::string_to_verb(method);
    if (verb == http::verb::unknown)
        req.method_string(method);
    else
        req.method(verb);
    req.target(target);
    req.version(11);
    req.set(http::field::host, host);
    req.set(http::field::user_agent, options_.user_agent);
    req.set(http::field::accept, "*/*");
    for (const auto& [name, value] : headers)
        req.set(name, value);
    return req;
}

net::awaitable<HttpResponse>
BeastClient::send(const std::string& url, const std::string& method, const Headers& headers) {
    HttpResponse response;
    response.effective_url = url;
    response.method        = method;

    auto parsed = Burrow::Utils::Url::parse(url);
    if (parsed.host.empty() || (parsed.scheme != "http" && parsed.scheme != "https")) {
        response.error      = "Invalid URL";
        response.error_type = ErrorType::Other;
        co_return response;
    }

    bool        is_ssl = (parsed.scheme == "https");
    std::string port   = parsed.port.empty() ? (is_ssl ? "443" : "80") : parsed.port;
    std::string target = parsed.path.empty() ? "/" : parsed.path;
    if (!parsed.query.empty())
        target += "?" + parsed.query;

    auto start = std::chrono::steady_clock::now();
    try {
        if (is_ssl)
            co_await perform_https_request(parsed.host, port, target, headers, response);
        else
            co_await perform_http_request(parsed.host, port, target, headers, response);
    } catch (const boost::system::system_error& e) {
        response.status_code = 0;
        response.error       = e.what();
        response.error_type  = classify_error(e.code());
    } catch (const std::exception& e) {
        response.status_code = 0;
        response.error       = e.what();
        response.error_type  = ErrorType::Other;
    }
    response.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    co_return response;
}

net::awaitable<void> BeastClient::perform_http_request(const std::string& host,
                                                       const std::string& port,
                                                       const std::string& target,
                                                       const Headers&     headers,
                                                       HttpResponse&      response) {
    std::string connect_host = host;
    std::string connect_port = port;
    std::string req_target   = target;

    if (!options_.proxy.empty()) {
        auto proxy_parsed = Burrow::Utils::Url::parse(options_.proxy);
        connect_host      = proxy_parsed.host;
        connect_port      = proxy_parsed.port.empty() ? "8080" : proxy_parsed.port;
        req_target        = "http://" + host + (port == "80" ? "" : ":" + port) + target;
    }

    tcp::resolver resolver(co_await net::this_coro::executor);
    auto results = co_await resolver.async_resolve(connect_host, connect_port, net::use_awaitable);

    beast::tcp_stream stream(co_await net::this_coro::executor);
    stream.expires_after(options_.connect_timeout);
    co_await stream.async_connect(results, net::use_awaitable);

    stream.expires_after(options_.request_timeout);
    auto req = build_request(response.method, host, req_target, headers);
    co_await exchange(stream, req, response);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
}

net::awaitable<void> BeastClient::open_tunnel(beast::tcp_stream& stream,
                                              const std::string& host,
                                              const std::string& port) {
    http::request<http::empty_body> req{http::verb::connect, host + ":" + port, 11};
    req.set(http::field::host, host + ":" + port);
    req.set(http::field::user_agent, options_.user_agent);
    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer                       buffer;
    http::response_parser<http::empty_body> parser;
    parser.skip(true);
    co_await http::async_read(stream, buffer, parser, net::use_awaitable);

    if (parser.get().result() != http::status::ok) {
        throw boost::system::system_error(
            boost::system::errc::make_error_code(boost::system::errc::connection_refused),
            "Proxy CONNECT failed with " + std::to_string(parser.get().result_int()));
    }
}

net::awaitable<void> BeastClient::perform_https_request(const std::string& host,
                                                        const std::string& port,
                                                        const std::string& target,
                                                        const Headers&     headers,
                                                        HttpResponse&      response) {
    std::string connect_host = host;
    std::string connect_port = port;
    bool        use_proxy    = !options_.proxy.empty();

    if (use_proxy) {
        auto proxy_parsed = Burrow::Utils::Url::parse(options_.proxy);
        connect_host      = proxy_parsed.host;
        connect_port      = proxy_parsed.port.empty() ? "8080" : proxy_parsed.port;
    }

    tcp::resolver resolver(co_await net::this_coro::executor);
    auto results = co_await resolver.async_resolve(connect_host, connect_port, net::use_awaitable);

    beast::ssl_stream<beast::tcp_stream> ssl_stream(co_await net::this_coro::executor, ssl_ctx_);
    if (!SSL_set_tlsext_host_name(ssl_stream.native_handle(), host.c_str())) {
        throw beast::system_error(
            beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
    }
    if (!options_.insecure)
        ssl_stream.set_verify_callback(ssl::host_name_verification(host));

    auto& lowest = beast::get_lowest_layer(ssl_stream);
    lowest.expires_after(options_.connect_timeout);
    co_await lowest.async_connect(results, net::use_awaitable);

    if (use_proxy) {
        try {
            co_await open_tunnel(lowest, host, port);
        } catch (const boost::system::system_error& e) {
            response.error_type = ErrorType::Proxy;
            response.error      = e.what();
            co_return;
        }
    }

    lowest.expires_after(options_.connect_timeout);
    co_await ssl_stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

    lowest.expires_after(options_.request_timeout);
    auto req = build_request(response.method, host, target, headers);
    co_await exchange(ssl_stream, req, response);

    // Servers commonly drop the connection without close_notify.
    beast::error_code ec;
    co_await ssl_stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
}

}  // namespace Http
}  // namespace Network
}  // namespace Burrow
