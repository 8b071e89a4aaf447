#pragma once

#include <string>
#include "tiltball/math/vector_math.hpp"

/**
 * @struct PhysicsBody
 * @brief Value description of one circular body
 *
 * Used to hand a body to PhysicsWorld::addBody and as the read-only snapshot
 * returned by PhysicsWorld::getBody. Inside the world the body lives as an
 * entity with the components from components/basic.hpp.
 *
 * Build descriptions with PhysicsWorld::createBody. previousPosition is Verlet
 * state: a hand-filled description whose previousPosition is left at the
 * origin enters the world moving by its whole position vector per tick.
 */
struct PhysicsBody {
    std::string id;
    Position position;
    Position previousPosition;
    Vector velocity;          // units per second, as of the last step
    double radius = 1.0;
    double mass = 1.0;
    double inverseMass = 1.0; // 0 for static bodies
    double restitution = 0.7;
    double friction = 0.3;
    bool isStatic = false;
    bool isRollingOnBar = false;
};
