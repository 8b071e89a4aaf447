/**
 * @file velocity.hpp
 * @brief Rebuilds each body's cached velocity from its Verlet state
 *
 * Runs last in the tick: Velocity = (Position - PreviousPosition) / dt, in
 * units per second. Static bodies are included and come out at zero.
 */

#pragma once

#include <entt/entt.hpp>
#include "tiltball/systems/i_system.hpp"

namespace Systems {

class VelocitySystem : public ISystem {
public:
    VelocitySystem() = default;
    ~VelocitySystem() override = default;

    void update(entt::registry& registry) override;
};

} // namespace Systems
