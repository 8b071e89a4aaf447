/**
 * @file moving_holes.cpp
 * @brief Back-and-forth motion of moving holes
 */

#include "tiltball/holes/hole_field.hpp"

#include <algorithm>
#include <cmath>

#include "tiltball/core/debug.hpp"
#include "tiltball/core/profile.hpp"
#include "tiltball/math/easing.hpp"

namespace {

Position alongAxis(Position base, Components::MovementAxis axis, double value) {
    if (axis == Components::MovementAxis::X) {
        base.x = value;
    } else {
        base.y = value;
    }
    return base;
}

} // namespace

bool HoleField::crowdsActiveHole(entt::entity self, const Position& candidate, double radius) {
    for (auto other : holeOrder) {
        if (other == self) {
            continue;
        }
        const auto& hole = registry.get<Components::Hole>(other);
        if (!hole.isActive) {
            continue;
        }
        double const minSeparation = radius + hole.radius + config.separationBuffer;
        if (candidate.distSquared(hole.position) < minSeparation * minSeparation) {
            return true;
        }
    }
    return false;
}

void HoleField::advanceMovingHoles(double nowMs) {
    PROFILE_SCOPE("HoleField::advanceMovingHoles");

    for (auto entity : holeOrder) {
        auto* moving = registry.try_get<Components::MovingHole>(entity);
        if (moving == nullptr) {
            continue;
        }
        auto& hole = registry.get<Components::Hole>(entity);

        double const dt = std::max(1.0, nowMs - moving->lastUpdate);
        moving->lastUpdate = nowMs;

        // Short paths take longer per unit distance so every hole looks equally lively
        double const travel = std::abs(moving->max - moving->min);
        double const reach = config.movingReferenceDistance > 0.0
            ? clampValue(travel / config.movingReferenceDistance, 0.0, 1.0)
            : 1.0;
        moving->duration = lerp(config.movingMaxDurationMs, config.movingMinDurationMs, reach);

        if (moving->phase == Components::MovePhase::Moving) {
            double const t = moving->progress + (dt / moving->duration) * moving->direction;
            double const clamped = clampValue(t, 0.0, 1.0);
            Position const candidate = alongAxis(hole.position, moving->axis,
                                                 lerp(moving->min, moving->max, Easing::easeInOut(clamped)));

            if (crowdsActiveHole(entity, candidate, hole.radius)) {
                moving->phase = Components::MovePhase::Stopping;
                moving->stopTime = nowMs;
                moving->direction = -moving->direction;
                DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[HoleField] '" << hole.id
                          << "' would crowd another hole, reversing to " << moving->direction << "\n");
            } else {
                hole.position = candidate;
                moving->progress = clamped;

                if (t >= 1.0 || t <= 0.0) {
                    moving->phase = Components::MovePhase::Stopping;
                    moving->stopTime = nowMs;
                    moving->direction = -moving->direction;
                    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[HoleField] '" << hole.id
                              << "' reached its bound, reversing to " << moving->direction << "\n");
                }
            }
        } else if (nowMs - moving->stopTime > config.movingPauseMs) {
            moving->phase = Components::MovePhase::Moving;
            moving->lastUpdate = nowMs;
            DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[HoleField] '" << hole.id << "' moving again\n");
        }
    }
}
