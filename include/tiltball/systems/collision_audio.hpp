#pragma once

#include <functional>
#include <map>
#include <string>
#include <utility>
#include "tiltball/systems/collision/collision_data.hpp"

/**
 * @class CollisionAudioLimiter
 * @brief Rate limit for collision sounds, per (body, collision type)
 *
 * Time is the simulation clock in milliseconds, so behaviour under test does
 * not depend on the wall clock.
 */
class CollisionAudioLimiter {
public:
    explicit CollisionAudioLimiter(double cooldownMs = 150.0);

    /**
     * @brief True if a sound may play now; records the play when it may
     */
    bool tryFire(const std::string& bodyId, CollisionType type, double nowMs);

    void reset();

    double cooldown() const { return cooldownMs; }

private:
    double cooldownMs;
    std::map<std::pair<std::string, CollisionType>, double> lastFired;
};

/**
 * @brief Where bar and body contact systems report sound-worthy contacts
 *
 * speed is the contact speed in units per second.
 */
using ContactSoundSink = std::function<void(const std::string& bodyId, double speed, CollisionType type)>;
