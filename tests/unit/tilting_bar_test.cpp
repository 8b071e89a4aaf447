#include <gtest/gtest.h>
#include <cmath>
#include "tiltball/geometry/tilting_bar.hpp"

TEST(TiltingBarTest, StartsFlatAtTheBottom) {
    TiltingBar bar;
    EXPECT_DOUBLE_EQ(bar.leftHeight(), 590.0);
    EXPECT_DOUBLE_EQ(bar.rightHeight(), 590.0);
    EXPECT_DOUBLE_EQ(bar.rotation(), 0.0);

    BarEndpoints ends = bar.getEndpoints();
    EXPECT_EQ(ends.start, Position(30.0, 590.0));
    EXPECT_EQ(ends.end, Position(330.0, 590.0));

    EXPECT_EQ(bar.getNormal(), Vector(0.0, -1.0));
    EXPECT_EQ(bar.getTangent(), Vector(1.0, 0.0));
}

TEST(TiltingBarTest, SideInputMovesAndClamps) {
    TiltingBar bar;

    // Raising moves toward smaller y
    bar.moveLeftSide(1.0, 1.0);
    EXPECT_DOUBLE_EQ(bar.leftHeight(), 490.0);
    EXPECT_DOUBLE_EQ(bar.rightHeight(), 590.0);

    // Zero input is a no-op
    bar.moveLeftSide(0.0, 10.0);
    EXPECT_DOUBLE_EQ(bar.leftHeight(), 490.0);

    // Lowering past the bottom clamps
    bar.moveRightSide(-1.0, 5.0);
    EXPECT_DOUBLE_EQ(bar.rightHeight(), 590.0);

    // Raising past the top clamps
    bar.moveLeftSide(1.0, 100.0);
    EXPECT_DOUBLE_EQ(bar.leftHeight(), 50.0);

    bar.setRightHeight(-1000.0);
    EXPECT_DOUBLE_EQ(bar.rightHeight(), 50.0);
    bar.setRightHeight(1000.0);
    EXPECT_DOUBLE_EQ(bar.rightHeight(), 590.0);
}

TEST(TiltingBarTest, RotationFollowsHeights) {
    TiltingBar bar;
    double const maxRotation = bar.getConfig().maxRotation;

    bar.setLeftHeight(50.0);
    EXPECT_NEAR(bar.rotation(), maxRotation, 1e-12);
    EXPECT_NEAR(bar.tiltPercentage(), 1.0, 1e-12);

    bar.setLeftHeight(590.0);
    bar.setRightHeight(50.0);
    EXPECT_NEAR(bar.rotation(), -maxRotation, 1e-12);
    EXPECT_NEAR(bar.tiltPercentage(), -1.0, 1e-12);

    bar.setRightHeight(320.0);
    EXPECT_NEAR(bar.tiltPercentage(), -0.5, 1e-12);
}

TEST(TiltingBarTest, NormalPointsUpWhenTilted) {
    TiltingBar bar;
    bar.setLeftHeight(300.0);

    Vector normal = bar.getNormal();
    EXPECT_LE(normal.y, 0.0);
    EXPECT_NEAR(normal.length(), 1.0, 1e-12);
    EXPECT_NEAR(normal.dotProduct(bar.getTangent()), 0.0, 1e-12);

    // Tangent still runs left to right
    EXPECT_GT(bar.getTangent().x, 0.0);
}

TEST(TiltingBarTest, ProximityTest) {
    TiltingBar bar;
    // radius 12 + half thickness 6 + tolerance 2
    EXPECT_TRUE(bar.isPointNearBar(Position(180.0, 570.0), 12.0));
    EXPECT_FALSE(bar.isPointNearBar(Position(180.0, 569.0), 12.0));
    EXPECT_DOUBLE_EQ(bar.distanceToBar(Position(0.0, 550.0)), 50.0);
}

TEST(TiltingBarTest, ConfigIsSanitized) {
    TiltingBarConfig config;
    config.minHeight = 500.0;
    config.maxHeight = 100.0;
    config.friction = 4.0;

    TiltingBar bar(config);
    EXPECT_DOUBLE_EQ(bar.getConfig().minHeight, 100.0);
    EXPECT_DOUBLE_EQ(bar.getConfig().maxHeight, 500.0);
    EXPECT_DOUBLE_EQ(bar.friction(), 1.0);
    EXPECT_DOUBLE_EQ(bar.leftHeight(), 500.0);
}

TEST(TiltingBarTest, ResetFlattens) {
    TiltingBar bar;
    bar.setLeftHeight(100.0);
    bar.setRightHeight(200.0);
    bar.reset();
    EXPECT_DOUBLE_EQ(bar.leftHeight(), 590.0);
    EXPECT_DOUBLE_EQ(bar.rightHeight(), 590.0);
}
