#include <gtest/gtest.h>
#include "tiltball/level/level_director.hpp"
#include "tiltball/core/physics_world.hpp"
#include "scripted_random.hpp"

using Components::HoleKind;
using Kind = LevelEvent::Kind;

namespace {

HoleSpec spec(HoleKind kind, double x, double y) {
    HoleSpec s;
    s.kind = kind;
    s.position = Position(x, y);
    s.radius = 15.0;
    return s;
}

} // namespace

class LevelDirectorTest : public ::testing::Test {
protected:
    LevelDirector director{ScriptedRandomSource::make()};
    PhysicsWorld world;
    LevelLayout layout;

    void SetUp() override {
        layout.id = 7;
        layout.name = "test";
        layout.holes = {
            spec(HoleKind::Goal, 100.0, 100.0),
            spec(HoleKind::Standard, 200.0, 300.0),
            spec(HoleKind::PowerUp, 300.0, 300.0)
        };
        director.loadLayout(layout, 0.0);

        world.addBody(PhysicsWorld::createBody("ball", Position(180.0, 500.0), 12.0, 1.0, 0.8, 0.2));
        world.setPossessionOracle(&director);
    }

    void TearDown() override {
        world.setPossessionOracle(nullptr);
    }

    LevelEvent moveBallAndUpdate(const Position& pos, double nowMs) {
        world.resetBody("ball", pos);
        return director.update(nowMs, world, "ball", 12.0);
    }
};

TEST_F(LevelDirectorTest, NothingHappensInOpenSpace) {
    EXPECT_EQ(moveBallAndUpdate(Position(180.0, 500.0), 0.0).kind, Kind::None);
    EXPECT_EQ(director.requiredGoals(), 1u);
    EXPECT_FALSE(director.isComplete());
}

TEST_F(LevelDirectorTest, MissingBallIsIgnored) {
    EXPECT_EQ(director.update(0.0, world, "nobody", 12.0).kind, Kind::None);
}

TEST_F(LevelDirectorTest, LastGoalCompletesLevel) {
    LevelEvent event = moveBallAndUpdate(Position(105.0, 100.0), 0.0);
    EXPECT_EQ(event.kind, Kind::LevelComplete);
    EXPECT_TRUE(director.isComplete());

    director.reset();
    EXPECT_FALSE(director.isComplete());
}

TEST_F(LevelDirectorTest, GoalReachedBeforeAllRequired) {
    layout.holes.push_back(spec(HoleKind::Goal, 300.0, 100.0));
    director.loadLayout(layout, 0.0);
    ASSERT_EQ(director.requiredGoals(), 2u);

    EXPECT_EQ(moveBallAndUpdate(Position(100.0, 100.0), 0.0).kind, Kind::GoalReached);
    EXPECT_EQ(moveBallAndUpdate(Position(300.0, 100.0), 10.0).kind, Kind::LevelComplete);
}

TEST_F(LevelDirectorTest, FallsIntoStandardHole) {
    LevelEvent event = moveBallAndUpdate(Position(200.0, 300.0), 0.0);
    EXPECT_EQ(event.kind, Kind::FellInHole);
    EXPECT_EQ(event.holeId, "standard-hole-7-0");
}

TEST_F(LevelDirectorTest, FallsOffTheBoard) {
    EXPECT_EQ(moveBallAndUpdate(Position(180.0, 700.0), 0.0).kind, Kind::FellOffBoard);
}

TEST_F(LevelDirectorTest, SaucerCapturesHoldsAndKicks) {
    LevelEvent captured = moveBallAndUpdate(Position(300.0, 300.0), 0.0);
    EXPECT_EQ(captured.kind, Kind::SaucerCaptured);
    EXPECT_EQ(captured.holeId, "powerup-hole-7-0");

    EXPECT_TRUE(director.isBodyHeld("ball"));
    EXPECT_EQ(director.getHeldTarget("ball").value_or(Position()), Position(300.0, 300.0));
    EXPECT_FALSE(director.getHeldTarget("other").has_value());

    // Held: position checks are suspended, even over a hole
    EXPECT_EQ(moveBallAndUpdate(Position(200.0, 300.0), 100.0).kind, Kind::None);

    // Sink, wait 3000 ms, eject for 200 ms
    EXPECT_EQ(director.update(600.0, world, "ball", 12.0).kind, Kind::None);
    EXPECT_EQ(director.update(3600.0, world, "ball", 12.0).kind, Kind::None);

    LevelEvent ejected = director.update(3800.0, world, "ball", 12.0);
    EXPECT_EQ(ejected.kind, Kind::SaucerEjected);
    EXPECT_EQ(ejected.holeId, "powerup-hole-7-0");
    ASSERT_TRUE(ejected.kick.has_value());

    auto ball = world.getBody("ball");
    ASSERT_TRUE(ball.has_value());
    Vector const expected = ejected.kick->direction * ejected.kick->force;
    EXPECT_NEAR(ball->velocity.x, expected.x, 1e-9);
    EXPECT_NEAR(ball->velocity.y, expected.y, 1e-9);
    EXPECT_LT(ball->velocity.y, 0.0);

    EXPECT_FALSE(director.isBodyHeld("ball"));
    EXPECT_FALSE(director.holes().findHole("powerup-hole-7-0").has_value());
}

TEST_F(LevelDirectorTest, WorldSteersCapturedBall) {
    ASSERT_EQ(moveBallAndUpdate(Position(295.0, 300.0), 0.0).kind, Kind::SaucerCaptured);

    world.step(1000.0 / 60.0);
    auto ball = world.getBody("ball");
    ASSERT_TRUE(ball.has_value());
    // One smoothing step toward the saucer center, no velocity
    EXPECT_NEAR(ball->position.x, 295.5, 1e-9);
    EXPECT_NEAR(ball->position.y, 300.0, 1e-9);
    EXPECT_NEAR(ball->velocity.length(), 0.0, 1e-12);
}
