#include "wildcard_detector.hpp"
#include <algorithm>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cmath>
#include "../../core/logger/logger.hpp"
#include "../../core/types/constants.hpp"
#include "../../utils/url/url.hpp"

namespace Burrow {
namespace Filters {

using namespace Burrow::Core;
using namespace Burrow::Network::Http;

namespace {
constexpr int SHORT_PROBE_LENGTH = Constants::WILDCARD_TOKEN_LENGTH;
constexpr int LONG_PROBE_LENGTH  = Constants::WILDCARD_TOKEN_LENGTH * 3;
}  // namespace

WildcardDetector::WildcardDetector(std::shared_ptr<const RunConfig> config, FilterStore& store)
    : config_(std::move(config)), store_(store) {
}

std::string WildcardDetector::random_token(int length) {
    thread_local boost::uuids::random_generator generator;

    std::string token;
    while (static_cast<int>(token.size()) < length) {
        std::string uuid = boost::uuids::to_string(generator());
        uuid.erase(std::remove(uuid.begin(), uuid.end(), '-'), uuid.end());
        token += uuid;
    }
    token.resize(static_cast<size_t>(std::max(length, 0)));
    return token;
}

boost::asio::awaitable<std::optional<Response>>
WildcardDetector::probe(const RequestSender& send, const std::string& base_url, int length) {
    std::string url  = Burrow::Utils::Url::join(base_url, random_token(length));
    auto        sent = co_await send(url);
    if (!sent)
        co_return std::nullopt;

    const HttpResponse& http = *sent;
    if (http.failed()) {
        Logger::debug("Wildcard probe failed for " + url + ": " + http.error);
        co_return std::nullopt;
    }
    auto response        = Response::from_http(http, url, base_url);
    response.is_wildcard = true;
    co_return response;
}

std::optional<WildcardSignature> WildcardDetector::analyze(const Response&                first,
                                                           const std::optional<Response>& second,
                                                           const std::set<int>&           allowed,
                                                           double tolerance) {
    if (first.status_code == 404 || !allowed.count(first.status_code))
        return std::nullopt;

    WildcardSignature signature;
    signature.status_code = first.status_code;
    signature.length      = first.content_length;

    if (!second || second->status_code != first.status_code
        || second->content_length == first.content_length) {
        signature.kind = WildcardKind::Static;
        return signature;
    }

    std::uint64_t len1 = first.content_length;
    std::uint64_t len2 = second->content_length;
    std::uint64_t path1 = first.path.size();
    std::uint64_t path2 = second->path.size();

    if (len2 > len1 && path2 > path1 && len2 - len1 == path2 - path1 && len1 >= path1) {
        signature.kind   = WildcardKind::Reflected;
        signature.length = len1 - path1;
        return signature;
    }

    double lower         = static_cast<double>(std::min(len1, len2)) * (1.0 - tolerance);
    double upper         = static_cast<double>(std::max(len1, len2)) * (1.0 + tolerance);
    signature.kind       = WildcardKind::Band;
    signature.min_length = static_cast<std::uint64_t>(std::floor(lower));
    signature.max_length = static_cast<std::uint64_t>(std::ceil(upper));
    return signature;
}

boost::asio::awaitable<std::optional<WildcardSignature>>
WildcardDetector::detect(const RequestSender& send, const std::string& base_url) {
    if (config_->dont_filter || store_.has_wildcard(base_url))
        co_return std::nullopt;

    auto first = co_await probe(send, base_url, SHORT_PROBE_LENGTH);
    if (!first)
        co_return std::nullopt;

    std::optional<Response> second;
    if (first->status_code != 404 && config_->status_allow.count(first->status_code))
        second = co_await probe(send, base_url, LONG_PROBE_LENGTH);

    auto signature = analyze(*first, second, config_->status_allow, config_->wildcard_tolerance);
    if (!signature)
        co_return std::nullopt;

    if (store_.add_wildcard(base_url, *signature)) {
        std::string detail = signature->kind == WildcardKind::Band
                                 ? std::to_string(signature->min_length) + "-"
                                       + std::to_string(signature->max_length) + "c"
                                 : std::to_string(signature->length) + "c";
        Logger::warn("Wildcard response detected at " + base_url + " ("
                     + std::to_string(signature->status_code) + ", " + to_string(signature->kind)
                     + ", " + detail + "); filtering matching responses");
    }
    co_return signature;
}

}  // namespace Filters
}  // namespace Burrow
