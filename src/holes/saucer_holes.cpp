/**
 * @file saucer_holes.cpp
 * @brief Capture, hold and ejection of a ball by a power-up hole
 */

#include "tiltball/holes/hole_field.hpp"

#include <algorithm>
#include <cmath>

#include "tiltball/core/debug.hpp"
#include "tiltball/core/profile.hpp"
#include "tiltball/math/easing.hpp"

void HoleField::startSaucerCapture(const std::string& holeId, const std::string& ballId, double nowMs) {
    entt::entity const entity = find(holeId);
    if (entity == entt::null) {
        return;
    }
    const auto& hole = registry.get<Components::Hole>(entity);
    if (hole.kind != Components::HoleKind::PowerUp
        || registry.any_of<Components::SaucerHole, Components::MovingHole, Components::AnimatedHole>(entity)) {
        return;
    }

    // Everything random about this capture is decided now
    double const angle = config.kickAngle + (random->uniform() - 0.5) * 2.0 * config.kickAngleSpread;

    Components::SaucerHole saucer;
    saucer.ballId = ballId;
    saucer.startTime = nowMs;
    saucer.phase = Components::SaucerPhase::Sinking;
    saucer.sinkDuration = config.saucerSinkMs;
    saucer.waitDuration = random->uniform(config.saucerWaitMinMs, config.saucerWaitMaxMs);
    // y grows downward, so "up" is -sin
    saucer.kickDirection = Vector(std::cos(angle), -std::sin(angle));
    saucer.kickForce = random->uniform(config.kickForceMin, config.kickForceMax);
    saucer.sinkDepth = 0.0;
    registry.emplace<Components::SaucerHole>(entity, saucer);

    DEBUG_MSG(DEBUG_LEVEL_BASIC, "[HoleField] '" << holeId << "' captured ball '" << ballId
              << "', waiting " << saucer.waitDuration << " ms\n");
}

std::optional<SaucerKick> HoleField::advanceSaucerStates(double nowMs) {
    PROFILE_SCOPE("HoleField::advanceSaucerStates");

    using Components::SaucerPhase;

    for (auto entity : holeOrder) {
        auto* saucer = registry.try_get<Components::SaucerHole>(entity);
        if (saucer == nullptr) {
            continue;
        }
        const auto& hole = registry.get<Components::Hole>(entity);
        double const elapsed = nowMs - saucer->startTime;

        switch (saucer->phase) {
        case SaucerPhase::Sinking: {
            double const progress = saucer->sinkDuration > 0.0
                ? std::min(std::max(elapsed, 0.0) / saucer->sinkDuration, 1.0)
                : 1.0;
            // Slow start, then drops fast
            double const eased = Easing::smoothstep(progress);
            saucer->sinkDepth = eased * eased;
            if (progress >= 1.0) {
                saucer->phase = SaucerPhase::Waiting;
                saucer->startTime = nowMs;
                saucer->sinkDepth = 1.0;
                DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[HoleField] '" << hole.id << "' ball fully sunk\n");
            }
            break;
        }

        case SaucerPhase::Waiting:
            if (elapsed >= saucer->waitDuration) {
                saucer->phase = SaucerPhase::Ejecting;
                saucer->startTime = nowMs;
                DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[HoleField] '" << hole.id << "' ejecting\n");
            }
            break;

        case SaucerPhase::Ejecting:
            if (elapsed >= config.saucerEjectMs) {
                SaucerKick kick{saucer->ballId, saucer->kickDirection, saucer->kickForce, hole.id};
                DEBUG_MSG(DEBUG_LEVEL_BASIC, "[HoleField] '" << hole.id << "' kicked ball '"
                          << kick.ballId << "' and is gone\n");
                destroyHole(entity);
                return kick;
            }
            break;
        }
    }
    return std::nullopt;
}

std::optional<Position> HoleField::getSaucerBallPosition(const std::string& holeId) const {
    entt::entity const entity = find(holeId);
    if (entity == entt::null || !registry.all_of<Components::SaucerHole>(entity)) {
        return std::nullopt;
    }
    // The ball sits centered on the saucer in every phase
    return registry.get<Components::Hole>(entity).position;
}

std::optional<std::string> HoleField::saucerHoleForBall(const std::string& ballId) const {
    for (auto entity : holeOrder) {
        if (const auto* saucer = registry.try_get<Components::SaucerHole>(entity);
            saucer != nullptr && saucer->ballId == ballId) {
            return registry.get<Components::Hole>(entity).id;
        }
    }
    return std::nullopt;
}

bool HoleField::isBallInSaucer(const std::string& ballId) const {
    return saucerHoleForBall(ballId).has_value();
}
