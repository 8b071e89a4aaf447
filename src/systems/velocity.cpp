#include "tiltball/systems/velocity.hpp"
#include "tiltball/components/basic.hpp"
#include "tiltball/core/profile.hpp"

namespace Systems {

void VelocitySystem::update(entt::registry& registry) {
    PROFILE_SCOPE("VelocitySystem");

    double const dt = tickSeconds(registry, sysConfig);

    auto view = registry.view<Components::Position, Components::PreviousPosition, Components::Velocity>();
    for (auto [entity, pos, prev, vel] : view.each()) {
        vel = (pos - prev) / dt;
    }
}

} // namespace Systems
