/**
 * WRAPPER AROUND GOOGLE ROBOTSTXT PARSER (https://github.com/google/robotstxt)
 */
#include "robotstxt.hpp"
#include <algorithm>
#include "robots.h"

namespace Burrow {
namespace Utils {

namespace {

class PathCollector : public googlebot::RobotsParseHandler {
public:
    PathCollector(std::vector<std::string>& paths, std::vector<std::string>& sitemaps)
        : paths_(paths), sitemaps_(sitemaps) {
    }

    void HandleRobotsStart() override {
    }
    void HandleRobotsEnd() override {
    }
    void HandleUserAgent(int /*line_num*/, absl::string_view /*value*/) override {
    }

    void HandleAllow(int /*line_num*/, absl::string_view value) override {
        add_path(value);
    }

    void HandleDisallow(int /*line_num*/, absl::string_view value) override {
        add_path(value);
    }

    void HandleSitemap(int /*line_num*/, absl::string_view value) override {
        if (!value.empty())
            sitemaps_.emplace_back(value);
    }

    void HandleUnknownAction(int /*line_num*/,
                             absl::string_view /*action*/,
                             absl::string_view /*value*/) override {
    }

private:
    std::vector<std::string>& paths_;
    std::vector<std::string>& sitemaps_;

    void add_path(absl::string_view value) {
        std::string path(value);
        // Patterns cannot be requested literally.
        if (path.empty() || path.find('*') != std::string::npos)
            return;
        if (path.back() == '$')
            path.pop_back();
        if (path.empty() || path[0] != '/')
            return;
        if (std::find(paths_.begin(), paths_.end(), path) == paths_.end())
            paths_.push_back(path);
    }
};

}  // namespace

RobotsTxt RobotsTxt::parse(const std::string& content) {
    RobotsTxt     robots;
    PathCollector collector(robots.paths_, robots.sitemaps_);
    googlebot::ParseRobotsTxt(content, &collector);
    return robots;
}

}  // namespace Utils
}  // namespace Burrow
