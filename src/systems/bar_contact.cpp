/**
 * @file bar_contact.cpp
 * @brief Implementation of bar bounce and rolling contact
 */

#include "tiltball/core/profile.hpp"
#include "tiltball/systems/bar_contact.hpp"
#include "tiltball/components/basic.hpp"
#include "tiltball/geometry/tilting_bar.hpp"

namespace Systems {

void BarContactSystem::update(entt::registry& registry) {
    PROFILE_SCOPE("BarContactSystem");

    if (bar == nullptr) {
        return;
    }

    double const dt = tickSeconds(registry, sysConfig);
    BarEndpoints const ends = bar->getEndpoints();
    Vector const normal = bar->getNormal();
    Vector const tangent = bar->getTangent();
    double const halfThickness = bar->thickness() / 2.0;
    double const barFriction = bar->friction();
    Vector const gravity(sysConfig.GravityX, sysConfig.GravityY);

    auto view = registry.view<Components::Position, Components::PreviousPosition,
                              Components::Radius, Components::Material>(
        entt::exclude<Components::Static, Components::Held>);

    for (auto [entity, pos, prev, radius, material] : view.each()) {
        Position const closest = closestPointOnSegment(ends.start, ends.end, pos);
        if (pos.dist(closest) >= radius.value + halfThickness) {
            continue;
        }

        Vector const velocity = pos - prev;

        // Rest the body on the surface, on the upper side of the bar
        Position const surfacePoint = closest + normal * halfThickness;
        pos = surfacePoint + normal * radius.value;

        double const alongNormal = velocity.dotProduct(normal);
        double const alongTangent = velocity.dotProduct(tangent);

        if (alongNormal < specificConfig.bounceThreshold) {
            double const restitution = material.restitution * specificConfig.bounceStability;
            Vector const reflected = tangent * (alongTangent * restitution * (1.0 - barFriction))
                                   + normal * (-alongNormal * restitution);
            prev = pos - reflected;

            if (soundSink && dt > 0.0) {
                if (const auto* id = registry.try_get<Components::BodyId>(entity)) {
                    soundSink(id->value, velocity.length() / dt, CollisionType::Bounce);
                }
            }
            continue;
        }

        // Rolling: tangential speed in units/s, normal motion discarded.
        // This tick's gravity is already in the displacement; it is re-applied
        // below along the slope only.
        double const slopeGravity = gravity.dotProduct(tangent);
        double tangentSpeed = dt > 0.0 ? (alongTangent - slopeGravity * dt * dt) / dt : 0.0;
        double const slopeAcceleration = slopeGravity
            - (specificConfig.rollingResistance + barFriction) * tangentSpeed;
        tangentSpeed += slopeAcceleration * dt;

        prev = pos - tangent * (tangentSpeed * dt);
        registry.emplace_or_replace<Components::RollingOnBar>(entity);
    }
}

} // namespace Systems
