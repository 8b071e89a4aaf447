#include <gtest/gtest.h>
#include "tiltball/systems/velocity.hpp"
#include "tiltball/components/basic.hpp"

using namespace Systems;

class VelocityTest : public ::testing::Test {
protected:
    entt::registry registry;
    VelocitySystem system;

    entt::entity createBody(const Position& pos, const Position& prev) {
        auto entity = registry.create();
        registry.emplace<Components::Position>(entity, pos);
        registry.emplace<Components::PreviousPosition>(entity, prev);
        registry.emplace<Components::Velocity>(entity, 0.0, 0.0);
        return entity;
    }
};

TEST_F(VelocityTest, ConvertsTickDisplacementToUnitsPerSecond) {
    auto body = createBody(Position(10.0, 5.0), Position(9.0, 7.0));
    system.update(registry);

    const auto& vel = registry.get<Components::Velocity>(body);
    EXPECT_NEAR(vel.x, 60.0, 1e-9);
    EXPECT_NEAR(vel.y, -120.0, 1e-9);
}

TEST_F(VelocityTest, UsesSimulatorStateTick) {
    auto state = registry.create();
    registry.emplace<Components::SimulatorState>(state, 0.5, 0.0);

    auto body = createBody(Position(1.0, 0.0), Position(0.0, 0.0));
    system.update(registry);

    EXPECT_DOUBLE_EQ(registry.get<Components::Velocity>(body).x, 2.0);
}

TEST_F(VelocityTest, NonPositiveStateFallsBackToNominalTick) {
    auto state = registry.create();
    registry.emplace<Components::SimulatorState>(state, 0.0, 0.0);

    EXPECT_DOUBLE_EQ(tickSeconds(registry, system.getSystemConfig()), 1.0 / 60.0);
}
