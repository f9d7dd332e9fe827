#include "position.h"
#include <gtest/gtest.h>

TEST(Position, DefaultsUnsetComponentsToZero) {
    Position p{3.0f};
    EXPECT_EQ(p.x, 3.0f);
    EXPECT_EQ(p.y, 0.0f);
    EXPECT_EQ(p.z, 0.0f);
}

TEST(Position, AddIncrementsOneComponent) {
    Position p{1.0f, 2.0f, 3.0f};
    p.add_x(0.5f);
    p.add_y(-2.0f);
    p.add_z(4.0f);
    EXPECT_EQ(p.x, 1.5f);
    EXPECT_EQ(p.y, 0.0f);
    EXPECT_EQ(p.z, 7.0f);
}

TEST(Position, SetWithOnlyXLeavesYAndZ) {
    Position p{1.0f, 2.0f, 3.0f};
    p.set(5.0f);
    EXPECT_EQ(p.x, 5.0f);
    EXPECT_EQ(p.y, 2.0f);
    EXPECT_EQ(p.z, 3.0f);
}

TEST(Position, SetWithExplicitZerosAppliesThem) {
    Position p{1.0f, 2.0f, 3.0f};
    p.set(5.0f, 0.0f, 0.0f);
    EXPECT_EQ(p.x, 5.0f);
    EXPECT_EQ(p.y, 0.0f);
    EXPECT_EQ(p.z, 0.0f);
}

TEST(Position, SetZeroXIsApplied) {
    Position p{1.0f, 2.0f, 3.0f};
    p.set(0.0f, 7.0f);
    EXPECT_EQ(p.x, 0.0f);
    EXPECT_EQ(p.y, 7.0f);
    EXPECT_EQ(p.z, 3.0f);
}
