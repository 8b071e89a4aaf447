/**
 * @file body_collision.cpp
 * @brief Implementation of the body-body collision pipeline
 */

#include <algorithm>
#include <cmath>

#include "tiltball/core/profile.hpp"
#include "tiltball/systems/collision/body_collision.hpp"
#include "tiltball/components/basic.hpp"

namespace {

double movableInverseMass(const entt::registry& registry, entt::entity e) {
    if (registry.any_of<Components::Static, Components::Held>(e)) {
        return 0.0;
    }
    return registry.get<Components::Mass>(e).inverse;
}

} // namespace

namespace BodyCollision {

std::vector<CandidatePair> broadPhase(entt::registry& registry, double buffer) {
    PROFILE_SCOPE("BodyCollision::broadPhase");

    std::vector<entt::entity> bodies;
    auto view = registry.view<Components::Position, Components::Radius, Components::Mass>();
    for (auto entity : view) {
        bodies.push_back(entity);
    }

    std::vector<CandidatePair> pairs;
    for (size_t i = 0; i < bodies.size(); ++i) {
        entt::entity const a = bodies[i];
        const auto& posA = view.get<Components::Position>(a);
        double const rA = view.get<Components::Radius>(a).value;
        bool const aMovable = movableInverseMass(registry, a) > 0.0;

        for (size_t j = i + 1; j < bodies.size(); ++j) {
            entt::entity const b = bodies[j];
            if (!aMovable && movableInverseMass(registry, b) <= 0.0) {
                continue;
            }
            double const reach = rA + view.get<Components::Radius>(b).value + buffer;
            if (posA.distSquared(view.get<Components::Position>(b)) < reach * reach) {
                pairs.push_back({a, b});
            }
        }
    }
    return pairs;
}

bool detect(entt::registry& registry, entt::entity a, entt::entity b, CollisionInfo& out) {
    const auto& posA = registry.get<Components::Position>(a);
    const auto& posB = registry.get<Components::Position>(b);
    double const rA = registry.get<Components::Radius>(a).value;
    double const rB = registry.get<Components::Radius>(b).value;

    Vector const delta = posB - posA;
    double const dist = delta.length();
    double const minDist = rA + rB;
    if (dist >= minDist) {
        return false;
    }

    out.a = a;
    out.b = b;
    out.normal = dist > EPSILON ? delta / dist : Vector(1.0, 0.0);
    out.penetration = minDist - dist;
    out.contactPoint = posA + out.normal * rA;
    return true;
}

CollisionManifold narrowPhase(entt::registry& registry, const std::vector<CandidatePair>& pairs) {
    PROFILE_SCOPE("BodyCollision::narrowPhase");

    CollisionManifold manifold;
    for (const auto& pair : pairs) {
        CollisionInfo info{};
        if (detect(registry, pair.eA, pair.eB, info)) {
            manifold.collisions.push_back(info);
        }
    }
    return manifold;
}

} // namespace BodyCollision

namespace Systems {

void BodyCollisionSystem::update(entt::registry& registry) {
    PROFILE_SCOPE("BodyCollisionSystem");
    using namespace BodyCollision;

    manifold.clear();

    auto candidatePairs = broadPhase(registry, specificConfig.broadPhaseBuffer);
    if (candidatePairs.empty()) {
        return;
    }

    double const dt = tickSeconds(registry, sysConfig);

    // Detect and resolve pair by pair, so later pairs see the corrected positions
    for (const auto& pair : candidatePairs) {
        CollisionInfo info{};
        if (!detect(registry, pair.eA, pair.eB, info)) {
            continue;
        }
        manifold.collisions.push_back(info);
        resolve(registry, info, dt);
    }
}

void BodyCollisionSystem::resolve(entt::registry& registry, const CollisionInfo& info, double dt) {
    double const wA = movableInverseMass(registry, info.a);
    double const wB = movableInverseMass(registry, info.b);
    double const wSum = wA + wB;
    if (wSum <= 0.0) {
        return;
    }
    double const shareA = wA / wSum;
    double const shareB = wB / wSum;

    auto& posA  = registry.get<Components::Position>(info.a);
    auto& prevA = registry.get<Components::PreviousPosition>(info.a);
    auto& posB  = registry.get<Components::Position>(info.b);
    auto& prevB = registry.get<Components::PreviousPosition>(info.b);

    // Implicit velocities before any correction
    Vector const velA = posA - prevA;
    Vector const velB = posB - prevB;

    // Separate by the full penetration; previous positions move along so the
    // separation itself adds no velocity
    Vector const correction = info.normal * info.penetration;
    posA -= correction * shareA;
    prevA -= correction * shareA;
    posB += correction * shareB;
    prevB += correction * shareB;

    double const velAlongNormal = (velB - velA).dotProduct(info.normal);
    if (velAlongNormal >= 0.0) {
        return; // separating
    }

    double const restitution = std::min(registry.get<Components::Material>(info.a).restitution,
                                        registry.get<Components::Material>(info.b).restitution)
                               * specificConfig.stabilityFactor;
    double const impulse = -(1.0 + restitution) * velAlongNormal;

    prevA += info.normal * (impulse * shareA);
    prevB -= info.normal * (impulse * shareB);

    if (soundSink && velAlongNormal < specificConfig.impactThreshold && dt > 0.0) {
        double const speed = std::abs(velAlongNormal) / dt;
        if (const auto* id = registry.try_get<Components::BodyId>(info.a)) {
            soundSink(id->value, speed, CollisionType::Impact);
        }
        if (const auto* id = registry.try_get<Components::BodyId>(info.b)) {
            soundSink(id->value, speed, CollisionType::Impact);
        }
    }
}

} // namespace Systems
