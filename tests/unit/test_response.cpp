#include <gtest/gtest.h>
#include "../../src/core/types/response.hpp"
#include "../../src/core/types/scan.hpp"
#include "mock_client.hpp"

using namespace Burrow::Core;
using Burrow::Testing::make_response;

TEST(ResponseTest, FromHttpCountsBody) {
    auto http = make_response(200, "<html>\n<body>hello world</body>\n</html>", {{"content-type", "text/html"}});
    auto response = Response::from_http(http, "http://host/admin/index.html", "http://host/admin/");

    EXPECT_EQ(response.path, "/admin/index.html");
    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(response.content_length, http.body.size());
    EXPECT_EQ(response.line_count, 3u);
    EXPECT_EQ(response.word_count, 4u);
    EXPECT_EQ(response.header("Content-Type"), "text/html");
    EXPECT_NE(response.fingerprint, 0u);
}

TEST(ResponseTest, DeclaredLengthForEmptyBody) {
    auto http     = make_response(301, "", {{"content-length", "178"}, {"location", "/admin/"}});
    auto response = Response::from_http(http, "http://host/admin", "http://host/");
    EXPECT_EQ(response.content_length, 178u);

    auto bogus = make_response(200, "", {{"content-length", "lots"}});
    EXPECT_EQ(Response::from_http(bogus, "http://host/a", "http://host/").content_length, 0u);
}

TEST(ResponseTest, ReportLine) {
    auto http     = make_response(301, "", {{"location", "http://host/admin/"}});
    auto response = Response::from_http(http, "http://host/admin", "http://host/");

    std::string line = response.as_report_line();
    EXPECT_EQ(line.rfind("301", 0), 0u);
    EXPECT_NE(line.find("GET"), std::string::npos);
    EXPECT_NE(line.find("0l"), std::string::npos);
    EXPECT_NE(line.find("http://host/admin => http://host/admin/"), std::string::npos);
}

TEST(ResponseTest, JsonOmitsBody) {
    auto http     = make_response(200, "secret body", {{"server", "test"}});
    auto response = Response::from_http(http, "http://host/a", "http://host/");

    nlohmann::json j = response;
    EXPECT_FALSE(j.contains("body"));
    EXPECT_EQ(j["status"], 200);

    Response restored = j.get<Response>();
    EXPECT_EQ(restored.url, response.url);
    EXPECT_EQ(restored.content_length, response.content_length);
    EXPECT_TRUE(restored.body.empty());
}

TEST(ScanTest, LifecycleTransitions) {
    EXPECT_TRUE(is_valid_transition(ScanStatus::Queued, ScanStatus::Running));
    EXPECT_TRUE(is_valid_transition(ScanStatus::Queued, ScanStatus::Cancelled));
    EXPECT_TRUE(is_valid_transition(ScanStatus::Running, ScanStatus::Paused));
    EXPECT_TRUE(is_valid_transition(ScanStatus::Paused, ScanStatus::Running));
    EXPECT_TRUE(is_valid_transition(ScanStatus::Paused, ScanStatus::Complete));

    EXPECT_FALSE(is_valid_transition(ScanStatus::Queued, ScanStatus::Complete));
    EXPECT_FALSE(is_valid_transition(ScanStatus::Complete, ScanStatus::Running));
    EXPECT_FALSE(is_valid_transition(ScanStatus::Cancelled, ScanStatus::Queued));
    EXPECT_FALSE(is_valid_transition(ScanStatus::Complete, ScanStatus::Cancelled));
}

TEST(ScanTest, JsonShape) {
    Scan scan;
    scan.id        = 7;
    scan.base_url  = "http://host/admin/";
    scan.scan_type = ScanType::Directory;
    scan.parent_id = 1;
    scan.depth     = 1;
    scan.status    = ScanStatus::Cancelled;
    scan.cancel_reason = "user";

    nlohmann::json j = scan;
    EXPECT_EQ(j["url"], "http://host/admin/");
    EXPECT_EQ(j["parent_id"], 1);

    Scan root;
    nlohmann::json r = root;
    EXPECT_TRUE(r["parent_id"].is_null());

    Scan back = j.get<Scan>();
    EXPECT_EQ(back.status, ScanStatus::Cancelled);
    EXPECT_EQ(back.cancel_reason, "user");
    ASSERT_TRUE(back.parent_id);
    EXPECT_EQ(*back.parent_id, 1u);

    j["status"] = "Exploded";
    EXPECT_THROW(j.get<Scan>(), std::invalid_argument);
}
