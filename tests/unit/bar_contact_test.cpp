#include <gtest/gtest.h>
#include <string>
#include "tiltball/systems/bar_contact.hpp"
#include "tiltball/components/basic.hpp"
#include "tiltball/geometry/tilting_bar.hpp"

using namespace Systems;

class BarContactTest : public ::testing::Test {
protected:
    entt::registry registry;
    BarContactSystem system;
    TiltingBar bar;   // flat at y = 590, thickness 12, friction 0.3

    entt::entity createBall(const Position& pos, const Position& prev, double restitution = 0.8) {
        auto entity = registry.create();
        registry.emplace<Components::BodyId>(entity, std::string("ball"));
        registry.emplace<Components::Position>(entity, pos);
        registry.emplace<Components::PreviousPosition>(entity, prev);
        registry.emplace<Components::Radius>(entity, 12.0);
        registry.emplace<Components::Mass>(entity, 1.0, 1.0);
        registry.emplace<Components::Material>(entity, restitution, 0.2);
        return entity;
    }

    Vector implicitVelocity(entt::entity e) {
        return registry.get<Components::Position>(e) - registry.get<Components::PreviousPosition>(e);
    }

    void SetUp() override {
        system.setBar(&bar);
    }
};

TEST_F(BarContactTest, NoBarNoContact) {
    system.setBar(nullptr);
    auto ball = createBall(Position(180.0, 575.0), Position(180.0, 565.0));
    system.update(registry);

    EXPECT_EQ(registry.get<Components::Position>(ball), Position(180.0, 575.0));
}

TEST_F(BarContactTest, BodyAboveBarIsUntouched) {
    auto ball = createBall(Position(180.0, 560.0), Position(180.0, 555.0));
    system.update(registry);

    EXPECT_EQ(registry.get<Components::Position>(ball), Position(180.0, 560.0));
    EXPECT_FALSE(registry.all_of<Components::RollingOnBar>(ball));
}

TEST_F(BarContactTest, FastApproachBounces) {
    auto ball = createBall(Position(180.0, 575.0), Position(180.0, 565.0));

    int bounces = 0;
    double reportedSpeed = 0.0;
    system.setSoundSink([&](const std::string& id, double speed, CollisionType type) {
        EXPECT_EQ(id, "ball");
        EXPECT_EQ(type, CollisionType::Bounce);
        ++bounces;
        reportedSpeed = speed;
    });

    system.update(registry);

    // Resting on the surface: 590 - thickness/2 - radius
    EXPECT_NEAR(registry.get<Components::Position>(ball).y, 572.0, 1e-9);

    // Reflected with restitution 0.8 * 0.8
    Vector v = implicitVelocity(ball);
    EXPECT_NEAR(v.y, -6.4, 1e-9);
    EXPECT_NEAR(v.x, 0.0, 1e-9);

    EXPECT_EQ(bounces, 1);
    EXPECT_NEAR(reportedSpeed, 600.0, 1e-6);
    EXPECT_FALSE(registry.all_of<Components::RollingOnBar>(ball));
}

TEST_F(BarContactTest, BounceDampsTangentialMotion) {
    auto ball = createBall(Position(180.0, 575.0), Position(176.0, 565.0));
    system.update(registry);

    // Tangential part scaled by restitution * 0.8 * (1 - bar friction)
    Vector v = implicitVelocity(ball);
    EXPECT_NEAR(v.x, 4.0 * 0.64 * 0.7, 1e-9);
    EXPECT_NEAR(v.y, -6.4, 1e-9);
}

TEST_F(BarContactTest, SlowContactRolls) {
    auto ball = createBall(Position(180.0, 572.5), Position(178.0, 572.5));
    system.update(registry);

    EXPECT_NEAR(registry.get<Components::Position>(ball).y, 572.0, 1e-9);
    EXPECT_TRUE(registry.all_of<Components::RollingOnBar>(ball));

    // Normal motion discarded, tangential slowed by friction and rolling resistance
    Vector v = implicitVelocity(ball);
    double const speed = 120.0;
    double const expected = (speed - (0.01 + 0.3) * speed / 60.0) / 60.0;
    EXPECT_NEAR(v.x, expected, 1e-9);
    EXPECT_NEAR(v.y, 0.0, 1e-9);
}

TEST_F(BarContactTest, RollingFollowsSlope) {
    SystemConfig config;
    config.GravityX = 0.0;
    config.GravityY = 400.0;
    system.setSystemConfig(config);

    bar.setLeftHeight(490.0);   // left side up, slope runs down to the right

    BarEndpoints ends = bar.getEndpoints();
    Position const mid((ends.start.x + ends.end.x) / 2.0, (ends.start.y + ends.end.y) / 2.0);
    // Slightly inside contact distance, at rest before the integrator's gravity step
    double const dt = 1.0 / 60.0;
    Position const start = mid + bar.getNormal() * 17.5;
    auto ball = createBall(start + Vector(0.0, 400.0) * (dt * dt), start);

    system.update(registry);

    EXPECT_TRUE(registry.all_of<Components::RollingOnBar>(ball));
    Vector v = implicitVelocity(ball);
    // One tick of slope gravity, counted once
    double const slopeGravity = Vector(0.0, 400.0).dotProduct(bar.getTangent());
    EXPECT_GT(slopeGravity, 0.0);
    EXPECT_NEAR(v.dotProduct(bar.getTangent()), slopeGravity * dt * dt, 1e-9);
    EXPECT_NEAR(v.dotProduct(bar.getNormal()), 0.0, 1e-9);
}

TEST_F(BarContactTest, HeldAndStaticBodiesAreSkipped) {
    auto held = createBall(Position(180.0, 575.0), Position(180.0, 565.0));
    registry.emplace<Components::Held>(held);
    auto fixed = createBall(Position(100.0, 575.0), Position(100.0, 565.0));
    registry.emplace<Components::Static>(fixed);

    system.update(registry);

    EXPECT_EQ(registry.get<Components::Position>(held), Position(180.0, 575.0));
    EXPECT_EQ(registry.get<Components::Position>(fixed), Position(100.0, 575.0));
}
