#include <gtest/gtest.h>
#include "../../src/engine/governor/leaky_bucket.hpp"

using namespace Burrow::Engine;
using namespace std::chrono_literals;

TEST(LeakyBucketTest, UnlimitedNeverWaits) {
    LeakyBucket bucket(0);
    for (int i = 0; i < 1000; ++i)
        EXPECT_EQ(bucket.reserve(), LeakyBucket::clock::duration::zero());
}

TEST(LeakyBucketTest, HalfFullBurstThenSpacing) {
    auto        start = LeakyBucket::clock::now();
    LeakyBucket bucket(10, start);

    // Five tokens are available straight away.
    for (int i = 0; i < 5; ++i)
        EXPECT_EQ(bucket.reserve(start), LeakyBucket::clock::duration::zero());

    auto sixth   = bucket.reserve(start);
    auto seventh = bucket.reserve(start);
    EXPECT_NEAR(std::chrono::duration<double>(sixth).count(), 0.1, 1e-6);
    EXPECT_NEAR(std::chrono::duration<double>(seventh).count(), 0.2, 1e-6);
}

TEST(LeakyBucketTest, RefillsOverTime) {
    auto        start = LeakyBucket::clock::now();
    LeakyBucket bucket(2, start);

    EXPECT_EQ(bucket.reserve(start), LeakyBucket::clock::duration::zero());
    EXPECT_GT(bucket.reserve(start), LeakyBucket::clock::duration::zero());

    // Two seconds later the bucket is full again (capacity 2), the debt is paid.
    auto later = start + 2s;
    EXPECT_EQ(bucket.reserve(later), LeakyBucket::clock::duration::zero());
}

TEST(LeakyBucketTest, SetRateLowers) {
    LeakyBucket bucket(100);
    bucket.set_rate(1);
    EXPECT_EQ(bucket.rate(), 1);
    bucket.set_rate(-5);
    EXPECT_EQ(bucket.rate(), 0);
    EXPECT_EQ(bucket.reserve(), LeakyBucket::clock::duration::zero());
}
