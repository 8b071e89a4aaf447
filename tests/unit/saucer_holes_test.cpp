#include <gtest/gtest.h>
#include <cmath>
#include "tiltball/holes/hole_field.hpp"
#include "scripted_random.hpp"

using Components::SaucerPhase;

class SaucerHolesTest : public ::testing::Test {
protected:
    // Every draw is 0.5: kick straight along kickAngle, wait 3000 ms, force 275
    HoleField field{ScriptedRandomSource::make()};

    HoleState hole(const std::string& id) {
        auto state = field.findHole(id);
        EXPECT_TRUE(state.has_value());
        return state.value_or(HoleState{});
    }

    void SetUp() override {
        field.addPowerUpHole("p", Position(100.0, 200.0));
    }
};

TEST_F(SaucerHolesTest, CaptureDrawsKickOnce) {
    field.startSaucerCapture("p", "ball", 0.0);

    HoleState state = hole("p");
    ASSERT_TRUE(state.saucer.has_value());
    EXPECT_EQ(state.saucer->ballId, "ball");
    EXPECT_EQ(state.saucer->phase, SaucerPhase::Sinking);
    EXPECT_DOUBLE_EQ(state.saucer->waitDuration, 3000.0);
    EXPECT_DOUBLE_EQ(state.saucer->kickForce, 275.0);

    // 135 degrees: up and to the left on a y-down playfield
    EXPECT_NEAR(state.saucer->kickDirection.x, -std::sqrt(0.5), 1e-12);
    EXPECT_NEAR(state.saucer->kickDirection.y, -std::sqrt(0.5), 1e-12);

    EXPECT_TRUE(field.isBallInSaucer("ball"));
    EXPECT_EQ(field.saucerHoleForBall("ball").value_or(""), "p");
    EXPECT_EQ(field.getSaucerBallPosition("p").value_or(Position()), Position(100.0, 200.0));

    // A second capture does not redraw anything
    field.startSaucerCapture("p", "other", 50.0);
    EXPECT_EQ(hole("p").saucer->ballId, "ball");
}

TEST_F(SaucerHolesTest, OnlyPowerUpHolesCapture) {
    field.addStaticHole("s", Position(10.0, 10.0));
    field.startSaucerCapture("s", "ball", 0.0);
    field.startSaucerCapture("missing", "ball", 0.0);

    EXPECT_FALSE(hole("s").saucer.has_value());
    EXPECT_FALSE(field.isBallInSaucer("ball"));
    EXPECT_FALSE(field.getSaucerBallPosition("s").has_value());
}

TEST_F(SaucerHolesTest, SinkWaitEject) {
    field.startSaucerCapture("p", "ball", 0.0);

    EXPECT_FALSE(field.advanceSaucerStates(300.0).has_value());
    EXPECT_NEAR(hole("p").saucer->sinkDepth, 0.25, 1e-12);

    EXPECT_FALSE(field.advanceSaucerStates(600.0).has_value());
    EXPECT_EQ(hole("p").saucer->phase, SaucerPhase::Waiting);
    EXPECT_DOUBLE_EQ(hole("p").saucer->sinkDepth, 1.0);

    EXPECT_FALSE(field.advanceSaucerStates(3599.0).has_value());
    EXPECT_EQ(hole("p").saucer->phase, SaucerPhase::Waiting);

    EXPECT_FALSE(field.advanceSaucerStates(3600.0).has_value());
    EXPECT_EQ(hole("p").saucer->phase, SaucerPhase::Ejecting);

    EXPECT_FALSE(field.advanceSaucerStates(3700.0).has_value());

    auto kick = field.advanceSaucerStates(3800.0);
    ASSERT_TRUE(kick.has_value());
    EXPECT_EQ(kick->ballId, "ball");
    EXPECT_EQ(kick->holeId, "p");
    EXPECT_DOUBLE_EQ(kick->force, 275.0);
    EXPECT_NEAR(kick->direction.length(), 1.0, 1e-12);

    // The hole is used up
    EXPECT_FALSE(field.findHole("p").has_value());
    EXPECT_FALSE(field.isBallInSaucer("ball"));
    EXPECT_EQ(field.holeCount(), 0u);
}

TEST_F(SaucerHolesTest, OnePhasePerCall) {
    field.startSaucerCapture("p", "ball", 0.0);

    // Long past every deadline, still only one transition per call
    field.advanceSaucerStates(100000.0);
    EXPECT_EQ(hole("p").saucer->phase, SaucerPhase::Waiting);
    field.advanceSaucerStates(100000.0);
    EXPECT_EQ(hole("p").saucer->phase, SaucerPhase::Waiting);
    field.advanceSaucerStates(103000.0);
    EXPECT_EQ(hole("p").saucer->phase, SaucerPhase::Ejecting);
}

TEST_F(SaucerHolesTest, KickAngleSpread) {
    HoleField spread{ScriptedRandomSource::make({1.0, 0.0, 0.0})};
    spread.addPowerUpHole("p", Position(100.0, 200.0));
    spread.startSaucerCapture("p", "ball", 0.0);

    // Top of the +/- 15 degree range around 135 degrees
    double const angle = 0.75 * 3.14159265358979323846 + 3.14159265358979323846 / 12.0;
    auto state = spread.findHole("p");
    ASSERT_TRUE(state.has_value());
    EXPECT_NEAR(state->saucer->kickDirection.x, std::cos(angle), 1e-12);
    EXPECT_NEAR(state->saucer->kickDirection.y, -std::sin(angle), 1e-12);
    EXPECT_DOUBLE_EQ(state->saucer->waitDuration, 1000.0);
    EXPECT_DOUBLE_EQ(state->saucer->kickForce, 200.0);
}

TEST_F(SaucerHolesTest, ResetReleasesBall) {
    field.startSaucerCapture("p", "ball", 0.0);
    field.reset();

    EXPECT_FALSE(field.isBallInSaucer("ball"));
    ASSERT_TRUE(field.findHole("p").has_value());
    EXPECT_TRUE(hole("p").isActive);
}
