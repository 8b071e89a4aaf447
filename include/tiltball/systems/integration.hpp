/**
 * @file integration.hpp
 * @brief Verlet position integration with the possession override
 *
 * This system handles:
 * - Advancing free bodies: pos += (pos - prev) * airResistance + gravity * dt²
 * - Steering held bodies toward their target and zeroing their inferred velocity
 *
 * Required components:
 * - Position, PreviousPosition (to modify)
 *
 * Optional components:
 * - Static (skipped)
 * - Held (steered instead of integrated)
 */

#pragma once

#include <entt/entt.hpp>
#include "tiltball/systems/i_system.hpp"

namespace Systems {

/**
 * @struct IntegrationConfig
 * @brief Configuration parameters specific to the integration system
 */
struct IntegrationConfig {
    // Fraction of the remaining gap to the held target closed per tick
    double heldSmoothing = 0.1;
};

class VerletIntegrationSystem : public ConfigurableSystem<IntegrationConfig> {
public:
    VerletIntegrationSystem() = default;
    ~VerletIntegrationSystem() override = default;

    void update(entt::registry& registry) override;
};

} // namespace Systems
