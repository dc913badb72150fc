#include <gtest/gtest.h>
#include "../../src/filters/filter.hpp"
#include "../../src/filters/filter_store.hpp"
#include "../../src/utils/crypto/simhash.hpp"

using namespace Burrow::Filters;
using Burrow::Core::ConfigError;
using Burrow::Core::RunConfig;

namespace {

Response make(int status, const std::string& body, const std::string& url = "http://host/x") {
    Response r;
    r.url            = url;
    r.path           = url.substr(url.find('/', 8));
    r.base_url       = "http://host/";
    r.status_code    = status;
    r.body           = body;
    r.content_length = body.size();
    r.word_count     = 1;
    r.line_count     = 1;
    r.fingerprint    = Burrow::Utils::Crypto::SimHash::fingerprint(body);
    return r;
}

}  // namespace

TEST(FilterTest, DefaultAllowList) {
    RunConfig config;
    FilterSet set = FilterSet::from_config(config);

    EXPECT_TRUE(classify(make(200, "ok"), set).keep);
    EXPECT_TRUE(classify(make(403, "no"), set).keep);

    auto verdict = classify(make(404, "missing"), set);
    EXPECT_FALSE(verdict.keep);
    EXPECT_EQ(verdict.stage, Stage::StatusAllow);
}

TEST(FilterTest, DenyRunsBeforeAllow) {
    RunConfig config;
    config.status_deny = {500};
    config.status_allow.insert(500);
    FilterSet set = FilterSet::from_config(config);

    auto verdict = classify(make(500, "boom"), set);
    EXPECT_FALSE(verdict.keep);
    EXPECT_EQ(verdict.stage, Stage::StatusDeny);
}

TEST(FilterTest, SizeWordLineFilters) {
    RunConfig config;
    config.filter_size  = {5};
    config.filter_words = {99};
    config.filter_lines = {1};
    FilterSet set       = FilterSet::from_config(config);

    auto sized = classify(make(200, "12345"), set);
    EXPECT_EQ(sized.stage, Stage::Size);

    auto lined = classify(make(200, "123456"), set);
    EXPECT_FALSE(lined.keep);
    EXPECT_EQ(lined.stage, Stage::Lines);
}

TEST(FilterTest, RegexMatchesBodyAndHeaders) {
    RunConfig config;
    config.filter_regex = {"Access Denied", "^server: nginx"};
    FilterSet set       = FilterSet::from_config(config);

    EXPECT_EQ(classify(make(200, "<h1>Access Denied</h1>"), set).stage, Stage::Regex);

    auto with_header               = make(200, "fine");
    with_header.headers["server"] = "nginx";
    EXPECT_FALSE(classify(with_header, set).keep);

    EXPECT_TRUE(classify(make(200, "fine"), set).keep);
}

TEST(FilterTest, RegexOverLargeBody) {
    RunConfig config;
    config.filter_regex = {"maintenance.*mode"};
    FilterSet set       = FilterSet::from_config(config);

    std::string body = std::string(2 * 1024 * 1024, 'x') + "\n<p>maintenance mode</p>\n";
    EXPECT_EQ(classify(make(200, body), set).stage, Stage::Regex);
    EXPECT_TRUE(classify(make(200, std::string(2 * 1024 * 1024, 'x')), set).keep);
}

TEST(FilterTest, BadRegexIsConfigError) {
    RunConfig config;
    config.filter_regex = {"(unclosed"};
    EXPECT_THROW(FilterSet::from_config(config), ConfigError);
}

TEST(FilterTest, SimilarityFilter) {
    std::string page;
    for (int i = 0; i < 100; ++i)
        page += "word" + std::to_string(i) + " ";

    RunConfig config;
    FilterSet set = FilterSet::from_config(config);
    set.add(SimilarityFilter{"http://host/404", Burrow::Utils::Crypto::SimHash::fingerprint(page), 0.95});

    auto verdict = classify(make(200, page), set);
    EXPECT_FALSE(verdict.keep);
    EXPECT_EQ(verdict.stage, Stage::Similarity);
}

TEST(FilterTest, FiltersStaySortedByStage) {
    FilterSet set;
    set.add(LineFilter{{1}});
    set.add(StatusDeny{{500}});
    set.add(RegexFilter{"x", std::regex("x")});
    set.add(StatusAllow{{200}});

    ASSERT_EQ(set.filters.size(), 4u);
    EXPECT_EQ(stage_of(set.filters[0]), Stage::StatusDeny);
    EXPECT_EQ(stage_of(set.filters[1]), Stage::StatusAllow);
    EXPECT_EQ(stage_of(set.filters[2]), Stage::Lines);
    EXPECT_EQ(stage_of(set.filters[3]), Stage::Regex);
}

TEST(FilterTest, ClassifyIsIdempotent) {
    RunConfig config;
    config.filter_size = {3};
    FilterSet set      = FilterSet::from_config(config);
    auto      response = make(301, "moved here");

    auto first  = classify(response, set);
    auto second = classify(response, set);
    EXPECT_EQ(first.keep, second.keep);
    EXPECT_EQ(first.recurse, second.recurse);
    EXPECT_EQ(first.stage, second.stage);
    EXPECT_TRUE(first.recurse);
}

TEST(FilterTest, WildcardStageBeforeSize) {
    RunConfig config;
    config.filter_size = {10};
    FilterSet set      = FilterSet::from_config(config);

    WildcardSignature signature;
    signature.kind                         = WildcardKind::Static;
    signature.status_code                  = 200;
    signature.length                       = 10;
    set.wildcard_signatures["http://host/"] = signature;

    auto verdict = classify(make(200, "0123456789"), set);
    EXPECT_FALSE(verdict.keep);
    EXPECT_EQ(verdict.stage, Stage::Wildcard);

    set.wildcard_filtering = false;
    EXPECT_EQ(classify(make(200, "0123456789"), set).stage, Stage::Size);
}

TEST(FilterTest, ProbeResponsesAreNeverKept) {
    RunConfig config;
    FilterSet set     = FilterSet::from_config(config);
    auto      probe   = make(200, "anything");
    probe.is_wildcard = true;
    EXPECT_FALSE(classify(probe, set).keep);
}

TEST(FilterTest, WildcardSignatureKinds) {
    WildcardSignature reflected;
    reflected.kind        = WildcardKind::Reflected;
    reflected.status_code = 200;
    reflected.length      = 100;

    auto r1           = make(200, "", "http://host/abc");
    r1.content_length = 104;  // "/abc" reflected into the page
    EXPECT_TRUE(reflected.matches(r1));
    r1.content_length = 105;
    EXPECT_FALSE(reflected.matches(r1));

    WildcardSignature band;
    band.kind        = WildcardKind::Band;
    band.status_code = 200;
    band.min_length  = 90;
    band.max_length  = 110;

    auto r2           = make(200, "");
    r2.content_length = 95;
    EXPECT_TRUE(band.matches(r2));
    r2.status_code = 302;
    EXPECT_FALSE(band.matches(r2));
}

TEST(FilterTest, StoreAddsWildcardOnce) {
    FilterStore       store;
    WildcardSignature signature;
    signature.status_code = 200;
    signature.length      = 42;

    auto before = store.snapshot();
    EXPECT_TRUE(store.add_wildcard("http://host/", signature));
    EXPECT_FALSE(store.add_wildcard("http://host/", signature));
    EXPECT_TRUE(store.has_wildcard("http://host/"));

    // Earlier snapshots are immutable.
    EXPECT_TRUE(before->wildcard_signatures.empty());
    EXPECT_EQ(store.snapshot()->wildcard_signatures.size(), 1u);
}
