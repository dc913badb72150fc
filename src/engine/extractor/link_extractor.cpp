#include "link_extractor.hpp"
#include <algorithm>
#include <gumbo.h>
#include <regex>
#include <unordered_set>
#include "../../core/types/constants.hpp"
#include "../../utils/robotstxt/robotstxt.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"

namespace Burrow {
namespace Engine {

using namespace Burrow::Utils;

namespace {

struct LinkAttribute {
    GumboTag    tag;
    const char* attribute;
};

constexpr LinkAttribute LINK_ATTRIBUTES[] = {{GUMBO_TAG_A, "href"},
                                             {GUMBO_TAG_LINK, "href"},
                                             {GUMBO_TAG_IMG, "src"},
                                             {GUMBO_TAG_SCRIPT, "src"},
                                             {GUMBO_TAG_IFRAME, "src"},
                                             {GUMBO_TAG_FRAME, "src"},
                                             {GUMBO_TAG_EMBED, "src"},
                                             {GUMBO_TAG_FORM, "action"}};

// Absolute urls, relative paths and "dir/file.ext" fragments, matched against
// the text between a pair of quotes.
const std::regex& link_finder() {
    static const std::regex regex(
        R"RE(((?:[a-zA-Z]{1,10}://|//)[^"'/]{1,}\.[a-zA-Z]{2,}[^"']{0,})|((?:/|\.\./|\./)[^"'><,;| *()(%$^/\\\[\]][^"'><,;|()]{1,})|([a-zA-Z0-9_\-/]{1,}/[a-zA-Z0-9_\-/]{1,}\.(?:[a-zA-Z]{1,4}|action)(?:[\?|#][^"|']{0,}|))|([a-zA-Z0-9_\-/]{1,}/[a-zA-Z0-9_\-/]{3,}(?:[\?|#][^"|']{0,}|))|([a-zA-Z0-9_\-.]{1,}\.(?:php|asp|aspx|jsp|json|action|html|js|txt|xml)(?:[\?|#][^"|']{0,}|)))RE");
    return regex;
}

void collect_links(GumboNode* node, std::vector<std::string>& links) {
    if (node->type != GUMBO_NODE_ELEMENT)
        return;

    for (const auto& entry : LINK_ATTRIBUTES) {
        if (node->v.element.tag != entry.tag)
            continue;
        GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, entry.attribute);
        if (attr && attr->value[0] != '\0')
            links.emplace_back(attr->value);
    }

    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        collect_links(static_cast<GumboNode*>(children->data[i]), links);
    }
}

bool is_text_body(const std::string& content_type) {
    return content_type.find("text/") != std::string::npos
           || content_type.find("javascript") != std::string::npos
           || content_type.find("json") != std::string::npos
           || content_type.find("xml") != std::string::npos;
}

}  // namespace

LinkExtractor::LinkExtractor(const RecursionPolicy& policy) : policy_(policy) {
}

std::vector<std::string> LinkExtractor::html_links(const std::string& html) {
    std::vector<std::string> links;
    if (html.empty())
        return links;

    GumboOutput* output = gumbo_parse(html.c_str());
    collect_links(output->root, links);
    gumbo_destroy_output(&kGumboDefaultOptions, output);

    return links;
}

std::vector<std::string> LinkExtractor::script_links(const std::string& body) {
    std::vector<std::string> links;
    const std::size_t        limit = Burrow::Core::Constants::MAX_LINK_CANDIDATE_BYTES;

    std::size_t open = body.find_first_of("\"'");
    while (open != std::string::npos) {
        std::size_t close = body.find_first_of("\"'", open + 1);
        if (close == std::string::npos)
            break;

        std::size_t length = close - open - 1;
        if (length > 0 && length <= limit) {
            std::string candidate = body.substr(open + 1, length);
            if (std::regex_match(candidate, link_finder())) {
                links.push_back(std::move(candidate));
                open = body.find_first_of("\"'", close + 1);
                continue;
            }
        }
        // The closing quote may open the next string.
        open = close;
    }
    return links;
}

void LinkExtractor::add_candidates(const std::string&        base_url,
                                   const std::string&        raw,
                                   std::vector<std::string>& out) const {
    std::string link = Text::trim(raw);
    if (link.empty() || link[0] == '#')
        return;

    std::string absolute = Url::resolve(base_url, link);
    if (absolute.empty() || !policy_.in_scope(absolute))
        return;

    for (auto& url : Url::sub_paths(absolute)) {
        if (policy_.is_denied(url))
            continue;
        if (std::find(out.begin(), out.end(), url) == out.end())
            out.push_back(std::move(url));
    }
}

std::vector<std::string> LinkExtractor::extract(const Response& response) const {
    std::vector<std::string> result;
    std::string content_type = Text::to_lower(response.header("content-type"));
    if (response.body.empty() || !is_text_body(content_type))
        return result;

    if (content_type.find("html") != std::string::npos) {
        for (const auto& link : html_links(response.body))
            add_candidates(response.url, link, result);
    }
    for (const auto& link : script_links(response.body))
        add_candidates(response.url, link, result);

    // The page itself is already known.
    result.erase(std::remove(result.begin(), result.end(), response.url), result.end());
    return result;
}

std::vector<std::string> LinkExtractor::extract_robots(const std::string& robots_url,
                                                       const std::string& body) const {
    std::vector<std::string> result;
    auto                     robots = RobotsTxt::parse(body);
    for (const auto& path : robots.paths())
        add_candidates(robots_url, path, result);
    return result;
}

std::vector<std::string> LinkExtractor::backups(const std::string&              url,
                                                const std::vector<std::string>& suffixes) const {
    std::vector<std::string> result;
    UrlParts                 parts    = Url::parse(url);
    std::string              filename = parts.filename();
    if (filename.empty())
        return result;

    std::string directory = parts.directory();
    std::string extension = Url::extension(url);
    std::string stem      = extension.empty()
                                ? ""
                                : filename.substr(0, filename.size() - extension.size() - 1);

    std::vector<std::string> names;
    for (const auto& suffix : suffixes) {
        names.push_back(filename + suffix);
        if (!stem.empty() && !suffix.empty() && suffix[0] == '.')
            names.push_back(stem + suffix);
    }
    names.push_back("." + filename + ".swp");

    for (const auto& name : names) {
        std::string candidate = directory + name;
        if (policy_.is_denied(candidate))
            continue;
        if (std::find(result.begin(), result.end(), candidate) == result.end())
            result.push_back(std::move(candidate));
    }
    return result;
}

}  // namespace Engine
}  // namespace Burrow
