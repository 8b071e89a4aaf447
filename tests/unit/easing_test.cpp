#include <gtest/gtest.h>
#include "tiltball/math/easing.hpp"

TEST(EasingTest, CurvesHitEndpoints) {
    EXPECT_NEAR(Easing::easeInOut(0.0), 0.0, 1e-12);
    EXPECT_NEAR(Easing::easeInOut(1.0), 1.0, 1e-12);
    EXPECT_NEAR(Easing::easeOutBack(0.0), 0.0, 1e-12);
    EXPECT_NEAR(Easing::easeOutBack(1.0), 1.0, 1e-12);
    EXPECT_NEAR(Easing::easeInBack(0.0), 0.0, 1e-12);
    EXPECT_NEAR(Easing::easeInBack(1.0), 1.0, 1e-12);
    EXPECT_NEAR(Easing::smoothstep(0.0), 0.0, 1e-12);
    EXPECT_NEAR(Easing::smoothstep(1.0), 1.0, 1e-12);
}

TEST(EasingTest, EaseInOutIsSymmetric) {
    EXPECT_DOUBLE_EQ(Easing::easeInOut(0.5), 0.5);
    EXPECT_DOUBLE_EQ(Easing::easeInOut(0.25), 0.125);
    EXPECT_NEAR(Easing::easeInOut(0.25) + Easing::easeInOut(0.75), 1.0, 1e-12);
}

TEST(EasingTest, BackCurvesOvershoot) {
    // Pop-in goes past full size before settling
    EXPECT_GT(Easing::easeOutBack(0.7), 1.0);
    // Pop-out dips below zero first
    EXPECT_LT(Easing::easeInBack(0.3), 0.0);
}

TEST(EasingTest, SmoothstepMidpoint) {
    EXPECT_DOUBLE_EQ(Easing::smoothstep(0.5), 0.5);
    EXPECT_LT(Easing::smoothstep(0.1), 0.1);
}
