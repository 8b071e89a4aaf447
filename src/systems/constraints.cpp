/**
 * @file constraints.cpp
 * @brief Distance, position and angle constraints, one pass per tick
 */

#include <cmath>

#include "tiltball/core/debug.hpp"
#include "tiltball/core/profile.hpp"
#include "tiltball/systems/constraints.hpp"
#include "tiltball/components/basic.hpp"

namespace Systems {

namespace {

bool isBody(const entt::registry& registry, entt::entity e) {
    return e != entt::null && registry.valid(e)
        && registry.all_of<Components::Position, Components::Mass>(e);
}

double movableInverseMass(const entt::registry& registry, entt::entity e) {
    if (registry.any_of<Components::Static, Components::Held>(e)) {
        return 0.0;
    }
    return registry.get<Components::Mass>(e).inverse;
}

} // namespace

void ConstraintSolverSystem::addConstraint(Constraint constraint) {
    constraint.stiffness = clampValue(constraint.stiffness, 0.0, 1.0);
    constraints.push_back(constraint);
    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[Constraints] added constraint #" << constraints.size()
              << " (kind " << constraint.kind.index() << ")\n");
}

void ConstraintSolverSystem::clearConstraints() {
    constraints.clear();
}

void ConstraintSolverSystem::update(entt::registry& registry) {
    PROFILE_SCOPE("ConstraintSolverSystem");

    for (const auto& constraint : constraints) {
        double const stiffness = constraint.stiffness;
        std::visit([&](const auto& c) { solve(registry, c, stiffness); }, constraint.kind);
    }
}

void ConstraintSolverSystem::solve(entt::registry& registry, const DistanceConstraint& c, double stiffness) {
    if (!isBody(registry, c.bodyA) || !isBody(registry, c.bodyB) || c.bodyA == c.bodyB) {
        return;
    }

    auto& posA = registry.get<Components::Position>(c.bodyA);
    auto& posB = registry.get<Components::Position>(c.bodyB);

    Vector const delta = posB - posA;
    double const dist = delta.length();
    if (dist <= EPSILON) {
        return;
    }

    // Half the error goes to each side, weighted by inverse mass
    double const percent = (c.distance - dist) / dist / 2.0;
    Vector const offset = delta * (percent * stiffness);

    posA -= offset * movableInverseMass(registry, c.bodyA);
    posB += offset * movableInverseMass(registry, c.bodyB);
}

void ConstraintSolverSystem::solve(entt::registry& registry, const PositionConstraint& c, double stiffness) {
    if (!isBody(registry, c.body) || movableInverseMass(registry, c.body) == 0.0) {
        return;
    }

    auto& pos = registry.get<Components::Position>(c.body);
    pos += (c.target - pos) * stiffness;
}

void ConstraintSolverSystem::solve(entt::registry& registry, const AngleConstraint& c, double stiffness) {
    if (!isBody(registry, c.bodyA) || !isBody(registry, c.bodyB) || c.bodyA == c.bodyB) {
        return;
    }

    auto& posA = registry.get<Components::Position>(c.bodyA);
    auto& posB = registry.get<Components::Position>(c.bodyB);

    Vector const arm = posB - posA;
    double const length = arm.length();
    if (length <= EPSILON) {
        return;
    }

    double const wA = movableInverseMass(registry, c.bodyA);
    double const wB = movableInverseMass(registry, c.bodyB);
    double const wSum = wA + wB;
    if (wSum <= 0.0) {
        return;
    }

    // Shortest signed angular error in (-pi, pi]
    double error = c.angle - std::atan2(arm.y, arm.x);
    error = std::atan2(std::sin(error), std::cos(error));

    // Rotate the arm about its midpoint weighted by inverse mass. B swings
    // toward the target heading, A swings the opposite way.
    Vector const rotated = arm.rotateByAngle(error * stiffness);
    Vector const correction = rotated - arm;

    posB += correction * (wB / wSum);
    posA -= correction * (wA / wSum);
}

} // namespace Systems
