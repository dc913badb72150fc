#pragma once
#include <string>
#include <vector>

#include "../../core/types/response.hpp"
#include "../recursion/recursion_policy.hpp"

namespace Burrow {
namespace Engine {

/**
 * @brief Turns accepted bodies and robots.txt files into in-scope urls to probe.
 */
class LinkExtractor {
public:
    explicit LinkExtractor(const RecursionPolicy& policy);

    /// Raw attribute values (href, src, action) from an HTML document.
    static std::vector<std::string> html_links(const std::string& html);

    /// Quoted paths and urls found in scripts or any other text body.
    static std::vector<std::string> script_links(const std::string& body);

    /// Absolute, in-scope urls plus each of their parent directories.
    std::vector<std::string> extract(const Response& response) const;

    std::vector<std::string> extract_robots(const std::string& robots_url,
                                            const std::string& body) const;

    /// Likely leftovers of a found file: "index.php" -> "index.php.bak", "index.bak",
    /// ".index.php.swp" for each suffix, minus denied urls.
    std::vector<std::string> backups(const std::string&              url,
                                     const std::vector<std::string>& suffixes) const;

private:
    const RecursionPolicy& policy_;

    void add_candidates(const std::string&        base_url,
                        const std::string&        raw,
                        std::vector<std::string>& out) const;
};

}  // namespace Engine
}  // namespace Burrow
