#include "tiltball/systems/collision_audio.hpp"

#include <algorithm>

CollisionAudioLimiter::CollisionAudioLimiter(double cooldown)
    : cooldownMs(std::max(0.0, cooldown))
{
}

bool CollisionAudioLimiter::tryFire(const std::string& bodyId, CollisionType type, double nowMs) {
    auto key = std::make_pair(bodyId, type);
    auto it = lastFired.find(key);
    if (it != lastFired.end() && nowMs - it->second < cooldownMs) {
        return false;
    }
    lastFired[key] = nowMs;
    return true;
}

void CollisionAudioLimiter::reset() {
    lastFired.clear();
}
