/**
 * @file body_collision.hpp
 * @brief Circle-circle collision detection and resolution between bodies
 *
 * This module runs the body-body part of a tick:
 * 1. Broad phase: squared-distance rejection with a small buffer
 * 2. Narrow phase: exact circle overlap, producing the tick's manifold
 * 3. Resolution: positional separation and a damped normal velocity response
 *
 * Resolution is a single lossy pass. Restitution is the lesser of the two
 * bodies' values scaled by a stability factor, trading accuracy for
 * tick-to-tick stability.
 *
 * Required components:
 * - Position, PreviousPosition (to modify)
 * - Radius, Mass, Material (to read)
 *
 * Optional components:
 * - Static, Held (immovable: inverse mass treated as 0)
 */

#ifndef TILTBALL_BODY_COLLISION_HPP
#define TILTBALL_BODY_COLLISION_HPP

#include <vector>

#include <entt/entt.hpp>
#include "tiltball/systems/i_system.hpp"
#include "tiltball/systems/collision/collision_data.hpp"
#include "tiltball/systems/collision_audio.hpp"

namespace BodyCollision {

/**
 * @brief Pairs whose centers lie within r_a + r_b + buffer
 *
 * Pairs in which neither body can move are not reported.
 */
std::vector<CandidatePair> broadPhase(entt::registry& registry, double buffer);

/**
 * @brief Exact overlap test for the candidate pairs
 *
 * Coincident centers use the normal (1,0).
 */
CollisionManifold narrowPhase(entt::registry& registry, const std::vector<CandidatePair>& pairs);

/**
 * @brief Exact overlap test for one pair; false when the circles do not overlap
 */
bool detect(entt::registry& registry, entt::entity a, entt::entity b, CollisionInfo& out);

} // namespace BodyCollision

namespace Systems {

/**
 * @struct BodyCollisionConfig
 * @brief Configuration parameters specific to body-body collisions
 */
struct BodyCollisionConfig {
    // Extra distance added to r_a + r_b in the broad phase
    double broadPhaseBuffer = 5.0;

    // Multiplier on min(restitution) for the normal response
    double stabilityFactor = 0.8;

    // Per-tick approach velocity along the normal below which an impact sound is reported
    double impactThreshold = -0.5;
};

class BodyCollisionSystem : public ConfigurableSystem<BodyCollisionConfig> {
public:
    BodyCollisionSystem() = default;
    ~BodyCollisionSystem() override = default;

    void update(entt::registry& registry) override;

    /**
     * @brief Contacts found by the last update
     */
    const CollisionManifold& getManifold() const { return manifold; }
    void clearManifold() { manifold.clear(); }

    void setSoundSink(ContactSoundSink sink) { soundSink = std::move(sink); }

private:
    CollisionManifold manifold;
    ContactSoundSink soundSink;

    void resolve(entt::registry& registry, const CollisionInfo& info, double dt);
};

} // namespace Systems

#endif // TILTBALL_BODY_COLLISION_HPP
