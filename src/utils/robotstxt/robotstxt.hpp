/**
 * WRAPPER AROUND GOOGLE ROBOTSTXT PARSER (https://github.com/google/robotstxt)
 */
#pragma once

#include <string>
#include <vector>

namespace Burrow {
namespace Utils {

class RobotsTxt {
public:
    RobotsTxt() = default;

    static RobotsTxt parse(const std::string& content);

    /// Allow and Disallow paths of every group, in file order, without duplicates.
    const std::vector<std::string>& paths() const {
        return paths_;
    }

    const std::vector<std::string>& sitemaps() const {
        return sitemaps_;
    }

private:
    std::vector<std::string> paths_;
    std::vector<std::string> sitemaps_;
};

}  // namespace Utils
}  // namespace Burrow
