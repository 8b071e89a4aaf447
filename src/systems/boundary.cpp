#include "tiltball/systems/boundary.hpp"
#include "tiltball/components/basic.hpp"
#include "tiltball/core/profile.hpp"

namespace Systems {

namespace {

// Clamps one axis to limit. If the body was moving past the limit its
// velocity on that axis is reflected and scaled by restitution, otherwise it
// is kept as it was.
void clampAxis(double& pos, double& prev, double limit, double restitution, bool movingOut) {
    double const velocity = pos - prev;
    pos = limit;
    if (movingOut) {
        prev = pos + velocity * restitution;
    } else {
        prev = pos - velocity;
    }
}

} // namespace

void BoundarySystem::update(entt::registry& registry) {
    PROFILE_SCOPE("BoundarySystem");

    const double width = sysConfig.BoundsWidth;
    const double height = sysConfig.BoundsHeight;

    auto view = registry.view<Components::Position, Components::PreviousPosition,
                              Components::Radius, Components::Material>(
        entt::exclude<Components::Static, Components::Held>);

    for (auto [entity, pos, prev, radius, material] : view.each()) {
        const double r = radius.value;
        const double restitution = material.restitution;

        // Floor
        if (pos.y + r > height) {
            clampAxis(pos.y, prev.y, height - r, restitution, pos.y - prev.y > 0.0);
        }

        // Left wall
        if (pos.x - r < 0.0) {
            clampAxis(pos.x, prev.x, r, restitution, pos.x - prev.x < 0.0);
        }
        // Right wall
        else if (pos.x + r > width) {
            clampAxis(pos.x, prev.x, width - r, restitution, pos.x - prev.x > 0.0);
        }
    }
}

} // namespace Systems
