/**
 * @file integration.cpp
 * @brief Implementation of the Verlet integrator
 */

#include "tiltball/core/profile.hpp"
#include "tiltball/systems/integration.hpp"
#include "tiltball/components/basic.hpp"

namespace Systems {

void VerletIntegrationSystem::update(entt::registry& registry) {
    PROFILE_SCOPE("VerletIntegrationSystem");

    double const dt = tickSeconds(registry, sysConfig);
    Vector const gravityStep = Vector(sysConfig.GravityX, sysConfig.GravityY) * (dt * dt);

    // Held bodies: follow the target, never accumulate velocity
    auto heldView = registry.view<Components::Position, Components::PreviousPosition, Components::Held>(
        entt::exclude<Components::Static>);
    for (auto [entity, pos, prev, held] : heldView.each()) {
        if (held.target) {
            pos += (*held.target - pos) * specificConfig.heldSmoothing;
        }
        prev = pos;
    }

    auto view = registry.view<Components::Position, Components::PreviousPosition>(
        entt::exclude<Components::Static, Components::Held>);
    for (auto [entity, pos, prev] : view.each()) {
        Vector const implicitVelocity = pos - prev;
        prev = pos;
        pos += implicitVelocity * sysConfig.AirResistance + gravityStep;
    }
}

} // namespace Systems
