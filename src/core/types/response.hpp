#pragma once
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>

#include "../../network/http/http_client.hpp"

namespace Burrow {
namespace Core {

/**
 * @brief A classified HTTP answer to one scan request.
 *
 * Built once from the transport result; the body is kept only for filtering
 * and link extraction and is never written to a state file.
 */
struct Response {
    std::string                        url;
    std::string                        path;
    std::string                        method = "GET";
    int                                status_code    = 0;
    std::uint64_t                      content_length = 0;
    std::uint64_t                      line_count     = 0;
    std::uint64_t                      word_count     = 0;
    std::map<std::string, std::string> headers;
    bool                               is_wildcard = false;
    std::string                        base_url;  // directory the request was issued for
    std::string                        body;
    std::uint64_t                      fingerprint = 0;

    std::string header(const std::string& name) const;

    /// "200      GET        9l       31w      219c http://host/path"
    std::string as_report_line() const;

    static Response from_http(const Network::Http::HttpResponse& http,
                              const std::string&                 url,
                              const std::string&                 base_url);
};

void to_json(nlohmann::json& j, const Response& response);
void from_json(const nlohmann::json& j, Response& response);

}  // namespace Core
}  // namespace Burrow
