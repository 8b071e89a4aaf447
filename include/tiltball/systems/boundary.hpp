/**
 * @file boundary.hpp
 * @brief System for keeping bodies inside the playfield
 *
 * This system handles:
 * - Clamping bodies against the left wall, right wall and floor
 * - Reflecting the velocity on the clamped axis, damped by the body's restitution
 *
 * The top of the playfield is open.
 *
 * Required components:
 * - Position, PreviousPosition (to modify)
 * - Radius, Material (to read)
 *
 * Optional components:
 * - Static, Held (skipped)
 */

#ifndef TILTBALL_BOUNDARY_HPP
#define TILTBALL_BOUNDARY_HPP

#include <entt/entt.hpp>
#include "tiltball/systems/i_system.hpp"

namespace Systems {

/**
 * @class BoundarySystem
 * @brief Handles wall and floor clamping against SystemConfig bounds
 */
class BoundarySystem : public ISystem {
public:
    BoundarySystem() = default;
    ~BoundarySystem() override = default;

    /**
     * @brief Clamps bodies that left the playfield and reflects their velocity
     * @param registry EnTT registry containing entities and components
     */
    void update(entt::registry& registry) override;
};

} // namespace Systems

#endif
