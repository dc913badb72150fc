#pragma once
#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>

#include "../../core/config/run_config.hpp"
#include "../../network/http/http_client.hpp"
#include "../filter_store.hpp"

#ifndef CPPCHECK
class WildcardTest_RandomTokenShape_Test;
#endif

namespace Burrow {
namespace Filters {

/// Sends one GET through the caller's throttling; empty when the request was not sent.
using RequestSender = std::function<boost::asio::awaitable<std::optional<Burrow::Network::Http::HttpResponse>>(
    const std::string& url)>;

/**
 * @brief Learns what a directory answers for paths that cannot exist.
 *
 * Two probes with random names of different lengths are sent before the
 * directory's wordlist starts; the resulting signature is installed in the
 * FilterStore so matching responses are dropped at the wildcard stage.
 * Probes go through the sender so they are paced and paused like any other
 * request of the scan.
 */
class WildcardDetector {
#ifndef CPPCHECK
    friend class ::WildcardTest_RandomTokenShape_Test;
#endif

public:
    WildcardDetector(std::shared_ptr<const Burrow::Core::RunConfig> config, FilterStore& store);

    boost::asio::awaitable<std::optional<WildcardSignature>>
    detect(const RequestSender& send, const std::string& base_url);

    static std::optional<WildcardSignature> analyze(const Response&                first,
                                                    const std::optional<Response>& second,
                                                    const std::set<int>&           allowed,
                                                    double                         tolerance);

#ifdef CPPCHECK
public:
#else
private:
#endif
    std::shared_ptr<const Burrow::Core::RunConfig> config_;
    FilterStore&                                   store_;

    /// `length` random lowercase hex characters.
    static std::string random_token(int length);

    boost::asio::awaitable<std::optional<Response>> probe(const RequestSender& send,
                                                          const std::string&   base_url,
                                                          int                  length);
};

}  // namespace Filters
}  // namespace Burrow
