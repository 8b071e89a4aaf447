#include "tiltball/level/level_director.hpp"

#include "tiltball/core/debug.hpp"
#include "tiltball/core/physics_world.hpp"
#include "tiltball/core/profile.hpp"

LevelDirector::LevelDirector() = default;

LevelDirector::LevelDirector(std::unique_ptr<IRandomSource> random, const HoleFieldConfig& config)
    : holeField(std::move(random), config)
{
}

void LevelDirector::loadLayout(const LevelLayout& layout, double nowMs) {
    populateHoleField(holeField, layout, nowMs);
    currentLayout = layout;
}

size_t LevelDirector::requiredGoals() const {
    return currentLayout ? currentLayout->effectiveRequiredGoals() : 0;
}

bool LevelDirector::isComplete() const {
    return currentLayout.has_value() && holeField.areAllGoalsCompleted(requiredGoals());
}

bool LevelDirector::isBodyHeld(const std::string& bodyId) const {
    return holeField.isBallInSaucer(bodyId);
}

std::optional<Position> LevelDirector::getHeldTarget(const std::string& bodyId) const {
    auto holeId = holeField.saucerHoleForBall(bodyId);
    if (!holeId) {
        return std::nullopt;
    }
    return holeField.getSaucerBallPosition(*holeId);
}

LevelEvent LevelDirector::update(double nowMs, PhysicsWorld& world, const std::string& ballId, double ballRadius) {
    PROFILE_SCOPE("LevelDirector::update");

    LevelEvent event;

    holeField.advanceAnimatedHoles(nowMs);

    if (auto kick = holeField.advanceSaucerStates(nowMs)) {
        world.setBodyVelocity(kick->ballId, kick->direction * kick->force);
        event.kind = LevelEvent::Kind::SaucerEjected;
        event.holeId = kick->holeId;
        event.kick = kick;
        return event;
    }

    auto ball = world.getBody(ballId);
    if (!ball || holeField.isBallInSaucer(ballId)) {
        return event;
    }

    const SystemConfig& config = world.getSystemConfig();
    if (holeField.checkBoundaryFallOff(ball->position, Vector(config.BoundsWidth, config.BoundsHeight))) {
        event.kind = LevelEvent::Kind::FellOffBoard;
        DEBUG_MSG(DEBUG_LEVEL_BASIC, "[Level] ball '" << ballId << "' fell off the board\n");
        return event;
    }

    if (holeField.checkGoalReached(ball->position, ballRadius)) {
        event.kind = isComplete() ? LevelEvent::Kind::LevelComplete : LevelEvent::Kind::GoalReached;
        DEBUG_MSG(DEBUG_LEVEL_BASIC, "[Level] goal " << holeField.completedGoalCount() << "/"
                  << requiredGoals() << "\n");
        return event;
    }

    if (auto hole = holeField.checkHoleFallIn(ball->position, ballRadius, ballId)) {
        event.holeId = hole->id;
        if (hole->kind == Components::HoleKind::PowerUp) {
            holeField.startSaucerCapture(hole->id, ballId, nowMs);
            event.kind = LevelEvent::Kind::SaucerCaptured;
        } else {
            event.kind = LevelEvent::Kind::FellInHole;
        }
    }

    return event;
}

void LevelDirector::reset() {
    holeField.reset();
}
