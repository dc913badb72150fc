#include <gtest/gtest.h>
#include "../../src/utils/robotstxt/robotstxt.hpp"

using Burrow::Utils::RobotsTxt;

TEST(RobotsTxtTest, CollectsPathsOfEveryGroup) {
    auto robots = RobotsTxt::parse("User-agent: googlebot\n"
                                   "Disallow: /private/\n"
                                   "\n"
                                   "User-agent: *\n"
                                   "Disallow: /private/\n"
                                   "Allow: /public/\n"
                                   "Disallow: /tmp\n");

    ASSERT_EQ(robots.paths().size(), 3u);
    EXPECT_EQ(robots.paths()[0], "/private/");
    EXPECT_EQ(robots.paths()[1], "/public/");
    EXPECT_EQ(robots.paths()[2], "/tmp");
}

TEST(RobotsTxtTest, SkipsWildcardsAndStripsAnchor) {
    auto robots = RobotsTxt::parse("User-agent: *\n"
                                   "Disallow: /*.php\n"
                                   "Disallow: /search$\n"
                                   "Disallow:\n");

    ASSERT_EQ(robots.paths().size(), 1u);
    EXPECT_EQ(robots.paths()[0], "/search");
}

TEST(RobotsTxtTest, Sitemaps) {
    auto robots = RobotsTxt::parse("Sitemap: http://host/sitemap.xml\n"
                                   "User-agent: *\n"
                                   "Disallow: /x/\n");

    ASSERT_EQ(robots.sitemaps().size(), 1u);
    EXPECT_EQ(robots.sitemaps()[0], "http://host/sitemap.xml");
}

TEST(RobotsTxtTest, EmptyContent) {
    auto robots = RobotsTxt::parse("");
    EXPECT_TRUE(robots.paths().empty());
    EXPECT_TRUE(robots.sitemaps().empty());
}
