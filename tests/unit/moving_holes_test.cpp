#include <gtest/gtest.h>
#include "tiltball/holes/hole_field.hpp"
#include "scripted_random.hpp"

using Components::MovementAxis;
using Components::MovePhase;

class MovingHolesTest : public ::testing::Test {
protected:
    HoleField field{ScriptedRandomSource::make()};

    HoleState hole(const std::string& id) {
        auto state = field.findHole(id);
        EXPECT_TRUE(state.has_value());
        return state.value_or(HoleState{});
    }
};

TEST_F(MovingHolesTest, StartsAtMinWithSwappedBounds) {
    field.addMovingHole("m", Position(0.0, 300.0), 10.0, MovementAxis::X, 200.0, 100.0, 0.0);

    HoleState state = hole("m");
    EXPECT_EQ(state.kind, Components::HoleKind::Moving);
    EXPECT_TRUE(state.isActive);
    EXPECT_EQ(state.position, Position(100.0, 300.0));
    ASSERT_TRUE(state.moving.has_value());
    EXPECT_DOUBLE_EQ(state.moving->min, 100.0);
    EXPECT_DOUBLE_EQ(state.moving->max, 200.0);
    EXPECT_EQ(state.moving->direction, 1);
}

TEST_F(MovingHolesTest, TraversalEasesAndPausesAtBounds) {
    field.addMovingHole("m", Position(0.0, 300.0), 10.0, MovementAxis::X, 100.0, 200.0, 0.0);

    // 100 units of travel: halfway between the slow and fast durations
    field.advanceAnimatedHoles(1175.0);
    HoleState state = hole("m");
    EXPECT_DOUBLE_EQ(state.moving->duration, 2350.0);
    EXPECT_NEAR(state.position.x, 150.0, 1e-9);
    EXPECT_DOUBLE_EQ(state.position.y, 300.0);

    field.advanceAnimatedHoles(2350.0);
    state = hole("m");
    EXPECT_NEAR(state.position.x, 200.0, 1e-9);
    EXPECT_EQ(state.moving->phase, MovePhase::Stopping);
    EXPECT_EQ(state.moving->direction, -1);
    EXPECT_TRUE(state.isActive);

    // Still pausing
    field.advanceAnimatedHoles(2700.0);
    EXPECT_EQ(hole("m").moving->phase, MovePhase::Stopping);
    EXPECT_NEAR(hole("m").position.x, 200.0, 1e-9);

    field.advanceAnimatedHoles(2800.0);
    EXPECT_EQ(hole("m").moving->phase, MovePhase::Moving);

    // Heading back toward min
    field.advanceAnimatedHoles(3975.0);
    EXPECT_NEAR(hole("m").position.x, 150.0, 1e-9);
}

TEST_F(MovingHolesTest, VerticalAxis) {
    field.addMovingHole("v", Position(80.0, 0.0), 10.0, MovementAxis::Y, 150.0, 350.0, 0.0);
    EXPECT_EQ(hole("v").position, Position(80.0, 150.0));

    // 200 units of travel uses the fast duration
    field.advanceAnimatedHoles(600.0);
    HoleState state = hole("v");
    EXPECT_DOUBLE_EQ(state.moving->duration, 1200.0);
    EXPECT_NEAR(state.position.y, 250.0, 1e-9);
    EXPECT_DOUBLE_EQ(state.position.x, 80.0);
}

TEST_F(MovingHolesTest, ReversesInsteadOfCrowdingAnotherHole) {
    field.addMovingHole("m", Position(0.0, 300.0), 10.0, MovementAxis::X, 100.0, 200.0, 0.0);
    field.addStaticHole("s", Position(200.0, 300.0), 10.0);

    field.advanceAnimatedHoles(1175.0);
    EXPECT_NEAR(hole("m").position.x, 150.0, 1e-9);

    // The next position would come within r + r + 10 of the static hole
    field.advanceAnimatedHoles(1762.5);
    HoleState state = hole("m");
    EXPECT_NEAR(state.position.x, 150.0, 1e-9);
    EXPECT_EQ(state.moving->phase, MovePhase::Stopping);
    EXPECT_EQ(state.moving->direction, -1);
    EXPECT_NEAR(state.moving->progress, 0.5, 1e-12);
}

TEST_F(MovingHolesTest, InactiveHolesDoNotBlock) {
    field.addMovingHole("m", Position(0.0, 300.0), 10.0, MovementAxis::X, 100.0, 200.0, 0.0);
    field.addStaticHole("s", Position(200.0, 300.0), 10.0);
    field.deactivateHole("s");

    field.advanceAnimatedHoles(1175.0);
    field.advanceAnimatedHoles(1762.5);
    EXPECT_GT(hole("m").position.x, 150.0);
    EXPECT_EQ(hole("m").moving->phase, MovePhase::Moving);
}

TEST_F(MovingHolesTest, DeactivatedHoleKeepsMovingButStaysInactive) {
    field.addMovingHole("m", Position(0.0, 300.0), 10.0, MovementAxis::X, 100.0, 200.0, 0.0);
    field.deactivateHole("m");

    field.advanceAnimatedHoles(1175.0);
    HoleState state = hole("m");
    EXPECT_FALSE(state.isActive);
    EXPECT_NEAR(state.position.x, 150.0, 1e-9);
    EXPECT_FALSE(field.checkHoleFallIn(state.position, 12.0, "ball").has_value());

    field.reset();
    EXPECT_TRUE(hole("m").isActive);
}
