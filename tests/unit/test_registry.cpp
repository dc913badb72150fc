#include <gtest/gtest.h>
#include <algorithm>
#include "../../src/engine/registry/scan_registry.hpp"

using namespace Burrow::Engine;
using Burrow::Core::RunConfig;

class ScanRegistryTest : public ::testing::Test {
protected:
    std::shared_ptr<RunConfig> config = std::make_shared<RunConfig>();

    void SetUp() override {
        config->depth   = 2;
        config->threads = 8;
    }
};

TEST_F(ScanRegistryTest, RegisterAssignsMonotonicIds) {
    ScanRegistry registry(config);
    auto         root  = registry.register_scan("http://host", ScanType::Initial, std::nullopt, 0);
    auto         child = registry.register_scan("http://host/admin", ScanType::Directory, root, 1);

    ASSERT_TRUE(root && child);
    EXPECT_LT(*root, *child);

    auto scan = registry.find(*child);
    ASSERT_TRUE(scan);
    EXPECT_EQ(scan->base_url, "http://host/admin/");
    EXPECT_EQ(scan->status, ScanStatus::Queued);
    EXPECT_EQ(scan->thread_count, 8);
    EXPECT_EQ(*scan->parent_id, *root);
}

TEST_F(ScanRegistryTest, DepthLimit) {
    ScanRegistry registry(config);
    auto         root = registry.register_scan("http://host/", ScanType::Initial, std::nullopt, 0);
    auto         a    = registry.register_scan("http://host/a/", ScanType::Directory, root, 1);
    auto         b    = registry.register_scan("http://host/a/b/", ScanType::Directory, a, 2);
    auto         c    = registry.register_scan("http://host/a/b/c/", ScanType::Directory, b, 3);

    EXPECT_TRUE(b);
    EXPECT_FALSE(c);
    EXPECT_EQ(registry.size(), 3u);

    config->depth = 0;  // unlimited
    ScanRegistry unlimited(config);
    EXPECT_TRUE(unlimited.register_scan("http://host/x/", ScanType::Directory, std::nullopt, 50));
}

TEST_F(ScanRegistryTest, DuplicateAndUnknownParent) {
    ScanRegistry registry(config);
    auto         root = registry.register_scan("http://host/", ScanType::Initial, std::nullopt, 0);
    EXPECT_TRUE(registry.register_scan("http://host/a", ScanType::Directory, root, 1));
    EXPECT_FALSE(registry.register_scan("http://host/a/", ScanType::Directory, root, 1));
    EXPECT_FALSE(registry.register_scan("http://host/b/", ScanType::Directory, ScanId{999}, 1));
}

TEST_F(ScanRegistryTest, TransitionsFollowLifecycle) {
    ScanRegistry registry(config);
    auto         id = *registry.register_scan("http://host/", ScanType::Initial, std::nullopt, 0);

    EXPECT_FALSE(registry.transition(id, ScanStatus::Complete));
    EXPECT_TRUE(registry.transition(id, ScanStatus::Running));
    EXPECT_TRUE(registry.transition(id, ScanStatus::Paused));
    EXPECT_TRUE(registry.transition(id, ScanStatus::Cancelled, "user"));
    EXPECT_FALSE(registry.transition(id, ScanStatus::Running));
    EXPECT_EQ(registry.find(id)->cancel_reason, "user");
    EXPECT_FALSE(registry.transition(ScanId{42}, ScanStatus::Running));
}

TEST_F(ScanRegistryTest, AdmitFifoWithinLimit) {
    ScanRegistry registry(config);
    auto         a = registry.register_scan("http://a/", ScanType::Initial, std::nullopt, 0);
    auto         b = registry.register_scan("http://b/", ScanType::Initial, std::nullopt, 0);
    auto         c = registry.register_scan("http://c/", ScanType::Initial, std::nullopt, 0);

    auto first = registry.admit_next(2);
    auto second = registry.admit_next(2);
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->id, *a);
    EXPECT_EQ(second->id, *b);
    EXPECT_FALSE(registry.admit_next(2));

    // A paused scan still holds its slot.
    registry.transition(*a, ScanStatus::Paused);
    EXPECT_FALSE(registry.admit_next(2));

    registry.transition(*a, ScanStatus::Complete);
    auto third = registry.admit_next(2);
    ASSERT_TRUE(third);
    EXPECT_EQ(third->id, *c);
    EXPECT_EQ(registry.count(ScanStatus::Running), 2u);
}

TEST_F(ScanRegistryTest, FileRecordsAreNeverAdmitted) {
    ScanRegistry registry(config);
    auto root = registry.register_scan("http://host/", ScanType::Initial, std::nullopt, 0);
    registry.transition(*root, ScanStatus::Running);
    registry.register_scan("http://host/app.js", ScanType::File, root, 0);
    EXPECT_FALSE(registry.admit_next(0));
}

TEST_F(ScanRegistryTest, RecordedFilesHoldNoSlot) {
    ScanRegistry registry(config);
    auto root = registry.register_scan("http://host/", ScanType::Initial, std::nullopt, 0);
    auto dir  = registry.register_scan("http://host/static/", ScanType::Directory, root, 1);
    ASSERT_TRUE(registry.admit_next(1));

    auto file = registry.record_file("http://host/static/app.js", *root, 0);
    ASSERT_TRUE(file);
    EXPECT_EQ(registry.find(*file)->status, ScanStatus::Complete);
    EXPECT_EQ(registry.find(*file)->scan_type, ScanType::File);
    EXPECT_EQ(registry.count(ScanStatus::Running), 1u);
    EXPECT_FALSE(registry.record_file("http://host/static/app.js", *root, 0));

    EXPECT_FALSE(registry.admit_next(1));
    registry.transition(*root, ScanStatus::Complete);
    auto next = registry.admit_next(1);
    ASSERT_TRUE(next);
    EXPECT_EQ(next->id, *dir);
}

TEST_F(ScanRegistryTest, Descendants) {
    config->depth = 0;
    ScanRegistry registry(config);
    auto         root = registry.register_scan("http://host/", ScanType::Initial, std::nullopt, 0);
    auto         a    = registry.register_scan("http://host/a/", ScanType::Directory, root, 1);
    auto         b    = registry.register_scan("http://host/b/", ScanType::Directory, root, 1);
    auto         aa   = registry.register_scan("http://host/a/a/", ScanType::Directory, a, 2);
    auto         aaa  = registry.register_scan("http://host/a/a/a/", ScanType::Directory, aa, 3);

    auto of_a = registry.descendants(*a);
    EXPECT_EQ(of_a.size(), 2u);
    EXPECT_NE(std::find(of_a.begin(), of_a.end(), *aaa), of_a.end());
    EXPECT_EQ(std::find(of_a.begin(), of_a.end(), *b), of_a.end());
    EXPECT_EQ(registry.descendants(*root).size(), 4u);
}

TEST_F(ScanRegistryTest, PendingAndCounts) {
    ScanRegistry registry(config);
    EXPECT_FALSE(registry.has_pending());
    auto id = registry.register_scan("http://host/", ScanType::Initial, std::nullopt, 0);
    EXPECT_TRUE(registry.has_pending());
    registry.transition(*id, ScanStatus::Cancelled, "time limit");
    EXPECT_FALSE(registry.has_pending());
    EXPECT_EQ(registry.count(ScanStatus::Cancelled), 1u);
}

TEST_F(ScanRegistryTest, RestoreContinuesIds) {
    Scan done;
    done.id       = 3;
    done.base_url = "http://host/";
    done.status   = ScanStatus::Complete;

    Scan child;
    child.id        = 9;
    child.base_url  = "http://host/api";
    child.scan_type = ScanType::Directory;
    child.parent_id = 3;
    child.depth     = 1;

    ScanRegistry registry(config);
    registry.restore({child, done});

    EXPECT_EQ(registry.next_id_, 10u);
    EXPECT_EQ(registry.snapshot().front().id, 3u);
    EXPECT_EQ(registry.find(9)->base_url, "http://host/api/");

    auto next = registry.register_scan("http://host/other/", ScanType::Directory, ScanId{3}, 1);
    ASSERT_TRUE(next);
    EXPECT_EQ(*next, 10u);
    EXPECT_FALSE(registry.register_scan("http://host/api/", ScanType::Directory, ScanId{3}, 1));
}

TEST_F(ScanRegistryTest, UpdateTuning) {
    ScanRegistry registry(config);
    auto         id = registry.register_scan("http://host/", ScanType::Initial, std::nullopt, 0);
    EXPECT_TRUE(registry.update_tuning(*id, 2, 5));
    EXPECT_EQ(registry.find(*id)->thread_count, 2);
    EXPECT_EQ(registry.find(*id)->rate_limit, 5);
}
