#include <gtest/gtest.h>
#include "random_context.h"

using namespace autopoiesis;

TEST(RandomContextTest, SameSeedSameSequence) {
    RandomContext a(2024);
    RandomContext b(2024);

    EXPECT_EQ(a.get_seed(), 2024u);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(a.uniform(-5.0f, 5.0f), b.uniform(-5.0f, 5.0f));
        EXPECT_EQ(a.uniform_int(4), b.uniform_int(4));
    }
}

TEST(RandomContextTest, DrawsStayInRange) {
    RandomContext rng(3);

    for (int i = 0; i < 1000; ++i) {
        float x = rng.uniform(15.0f, 25.0f);
        EXPECT_GE(x, 15.0f);
        EXPECT_LE(x, 25.0f);

        int action = rng.uniform_int(4);
        EXPECT_GE(action, 0);
        EXPECT_LT(action, 4);
    }
    EXPECT_EQ(rng.uniform_int(1), 0);
}

TEST(RandomContextTest, ChanceExtremes) {
    RandomContext rng(8);

    for (int i = 0; i < 100; ++i) {
        EXPECT_FALSE(rng.chance(0.0f));
        EXPECT_TRUE(rng.chance(1.0f));
    }
}
