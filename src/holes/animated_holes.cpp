/**
 * @file animated_holes.cpp
 * @brief Phase cycle of animated holes
 */

#include "tiltball/holes/hole_field.hpp"

#include <algorithm>

#include "tiltball/core/debug.hpp"
#include "tiltball/core/profile.hpp"
#include "tiltball/math/easing.hpp"

void HoleField::playSound(HoleSoundEffect effect, const std::string& holeId) const {
    if (soundHook) {
        soundHook(effect, holeId);
    }
}

void HoleField::advanceCyclingHoles(double nowMs) {
    PROFILE_SCOPE("HoleField::advanceCyclingHoles");

    using Components::AnimationPhase;

    for (auto entity : holeOrder) {
        auto* anim = registry.try_get<Components::AnimatedHole>(entity);
        if (anim == nullptr) {
            continue;
        }
        auto& hole = registry.get<Components::Hole>(entity);

        double const elapsed = nowMs - anim->startTime;

        // Start delay still running
        if (elapsed < 0.0) {
            hole.isActive = false;
            continue;
        }

        switch (anim->phase) {
        case AnimationPhase::AnimatingIn: {
            double const progress = std::min(elapsed / anim->inDuration, 1.0);
            anim->currentScale = Easing::easeOutBack(progress);
            if (elapsed >= anim->inDuration) {
                anim->phase = AnimationPhase::Idle;
                anim->startTime = nowMs;
                anim->currentScale = 1.0;
                DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[HoleField] '" << hole.id << "' idle\n");
            }
            break;
        }

        case AnimationPhase::Idle:
            anim->currentScale = 1.0;
            if (elapsed >= anim->idleDuration) {
                anim->phase = AnimationPhase::AnimatingOut;
                anim->startTime = nowMs;
                playSound(HoleSoundEffect::Disappear, hole.id);
                DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[HoleField] '" << hole.id << "' animating out\n");
            }
            break;

        case AnimationPhase::AnimatingOut: {
            double const progress = std::min(elapsed / anim->outDuration, 1.0);
            anim->currentScale = 1.0 - Easing::easeInBack(progress);
            if (elapsed >= anim->outDuration) {
                anim->phase = AnimationPhase::Hidden;
                anim->startTime = nowMs;
                anim->currentScale = 0.0;
                DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[HoleField] '" << hole.id << "' hidden\n");
            }
            break;
        }

        case AnimationPhase::Hidden:
            anim->currentScale = 0.0;
            if (elapsed >= anim->hiddenDuration) {
                anim->phase = AnimationPhase::AnimatingIn;
                anim->startTime = nowMs;
                // New cycle, new rhythm
                anim->idleDuration = random->uniform(config.idleMinMs, config.idleMaxMs);
                anim->hiddenDuration = random->uniform(config.hiddenMinMs, config.hiddenMaxMs);
                playSound(HoleSoundEffect::Appear, hole.id);
                DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[HoleField] '" << hole.id << "' animating in, next idle "
                          << anim->idleDuration << " ms\n");
            }
            break;
        }

        hole.isActive = anim->phase == AnimationPhase::Idle;
    }
}
