#include <gtest/gtest.h>
#include "../../src/engine/governor/error_window.hpp"

using namespace Burrow::Engine;

TEST(ErrorWindowTest, FillsThenSlides) {
    ErrorWindow window(4);
    window.record(true);
    window.record(true);
    window.record(false);
    EXPECT_FALSE(window.full());
    EXPECT_DOUBLE_EQ(window.error_rate(), 2.0 / 3.0);

    window.record(false);
    EXPECT_TRUE(window.full());
    EXPECT_DOUBLE_EQ(window.error_rate(), 0.5);

    // Oldest failure drops out.
    window.record(false);
    EXPECT_EQ(window.size(), 4u);
    EXPECT_EQ(window.failures(), 1u);
}

TEST(ErrorWindowTest, Clear) {
    ErrorWindow window(2);
    window.record(true);
    window.record(true);
    window.clear();
    EXPECT_FALSE(window.full());
    EXPECT_DOUBLE_EQ(window.error_rate(), 0.0);
}

TEST(ErrorWindowTest, ZeroCapacityActsAsOne) {
    ErrorWindow window(0);
    window.record(true);
    EXPECT_TRUE(window.full());
}
