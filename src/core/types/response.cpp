#include "response.hpp"
#include <cstdio>
#include "constants.hpp"
#include "../../utils/crypto/simhash.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"

namespace Burrow {
namespace Core {

using namespace Burrow::Utils;

std::string Response::header(const std::string& name) const {
    auto it = headers.find(Text::to_lower(name));
    return it == headers.end() ? "" : it->second;
}

std::string Response::as_report_line() const {
    char counts[96];
    std::snprintf(counts,
                  sizeof(counts),
                  "%3d %7s %8llul %8lluw %8lluc ",
                  status_code,
                  method.c_str(),
                  static_cast<unsigned long long>(line_count),
                  static_cast<unsigned long long>(word_count),
                  static_cast<unsigned long long>(content_length));
    std::string line = counts + url;
    if (is_redirect(status_code)) {
        std::string location = header("location");
        if (!location.empty())
            line += " => " + location;
    }
    return line;
}

Response Response::from_http(const Network::Http::HttpResponse& http,
                             const std::string&                 url,
                             const std::string&                 base_url) {
    Response response;
    response.url         = url;
    response.path        = Url::parse(url).path;
    response.method      = http.method;
    response.status_code = static_cast<int>(http.status_code);
    response.headers     = http.headers;
    response.base_url    = base_url;
    response.body        = http.body;

    response.content_length = http.body.size();
    if (http.body.empty()) {
        std::string declared = http.header("content-length");
        if (!declared.empty()) {
            try {
                response.content_length = std::stoull(declared);
            } catch (const std::exception&) {
                response.content_length = 0;
            }
        }
    }
    response.line_count  = Text::count_lines(http.body);
    response.word_count  = Text::count_words(http.body);
    response.fingerprint = Crypto::SimHash::fingerprint(http.body);
    return response;
}

void to_json(nlohmann::json& j, const Response& response) {
    j = nlohmann::json{{"url", response.url},
                       {"path", response.path},
                       {"method", response.method},
                       {"status", response.status_code},
                       {"content_length", response.content_length},
                       {"line_count", response.line_count},
                       {"word_count", response.word_count},
                       {"headers", response.headers},
                       {"wildcard", response.is_wildcard},
                       {"base_url", response.base_url}};
}

void from_json(const nlohmann::json& j, Response& response) {
    j.at("url").get_to(response.url);
    j.at("path").get_to(response.path);
    response.method = j.value("method", std::string("GET"));
    j.at("status").get_to(response.status_code);
    j.at("content_length").get_to(response.content_length);
    j.at("line_count").get_to(response.line_count);
    j.at("word_count").get_to(response.word_count);
    j.at("headers").get_to(response.headers);
    j.at("wildcard").get_to(response.is_wildcard);
    response.base_url = j.value("base_url", std::string());
}

}  // namespace Core
}  // namespace Burrow
