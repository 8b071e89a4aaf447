#ifndef TILTBALL_COLLISION_DATA_HPP
#define TILTBALL_COLLISION_DATA_HPP

#include <vector>

#include <entt/entt.hpp>

#include "tiltball/math/vector_math.hpp"

// CandidatePair produced by the broad phase
struct CandidatePair {
    entt::entity eA;
    entt::entity eB;
};

// One detected overlap between two circles
struct CollisionInfo {
    entt::entity a;
    entt::entity b;
    Vector normal;        // unit, from a to b
    double penetration;   // >= 0
    Position contactPoint;
};

// All contacts of the current tick; never carried into the next one
struct CollisionManifold {
    std::vector<CollisionInfo> collisions;
    void clear() { collisions.clear(); }
};

/**
 * @brief Kind of contact reported to the audio hook
 */
enum class CollisionType {
    Bounce, ///< Ball bounced off the bar
    Impact  ///< Two bodies struck each other
};

#endif
