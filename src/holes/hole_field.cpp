/**
 * @file hole_field.cpp
 * @brief Hole creation, snapshots and ball-against-hole queries
 */

#include "tiltball/holes/hole_field.hpp"

#include <algorithm>

#include "tiltball/core/debug.hpp"

HoleField::HoleField()
    : HoleField(std::make_unique<MersenneRandomSource>())
{
}

HoleField::HoleField(std::unique_ptr<IRandomSource> randomSource, const HoleFieldConfig& cfg)
    : config(cfg)
    , random(std::move(randomSource))
{
    if (!random) {
        random = std::make_unique<MersenneRandomSource>();
    }
}

entt::entity HoleField::find(const std::string& id) const {
    auto it = holesById.find(id);
    return it == holesById.end() ? entt::entity{entt::null} : it->second;
}

entt::entity HoleField::createHole(const std::string& id, const Position& position, double radius,
                                   Components::HoleKind kind, bool isGoal, bool isActive)
{
    if (find(id) != entt::null) {
        DEBUG_MSG(DEBUG_LEVEL_BASIC, "[HoleField] replacing hole '" << id << "'\n");
        removeHole(id);
    }

    double const r = radius > 0.0 ? radius : config.defaultRadius;
    auto entity = registry.create();
    registry.emplace<Components::Hole>(entity, id, position, r, isGoal, isActive, kind);
    holeOrder.push_back(entity);
    holesById[id] = entity;
    return entity;
}

entt::entity HoleField::addStaticHole(const std::string& id, const Position& position, double radius) {
    return createHole(id, position, radius, Components::HoleKind::Standard, false, true);
}

entt::entity HoleField::addGoalHole(const std::string& id, const Position& position, double radius) {
    return createHole(id, position, radius, Components::HoleKind::Goal, true, true);
}

entt::entity HoleField::addPowerUpHole(const std::string& id, const Position& position, double radius) {
    return createHole(id, position, radius, Components::HoleKind::PowerUp, false, true);
}

entt::entity HoleField::addMovingHole(const std::string& id, const Position& position, double radius,
                                      Components::MovementAxis axis, double min, double max, double nowMs)
{
    if (max < min) {
        std::swap(min, max);
    }

    Position start = position;
    if (axis == Components::MovementAxis::X) {
        start.x = min;
    } else {
        start.y = min;
    }

    auto entity = createHole(id, start, radius, Components::HoleKind::Moving, false, true);

    Components::MovingHole moving;
    moving.axis = axis;
    moving.min = min;
    moving.max = max;
    moving.lastUpdate = nowMs;
    registry.emplace<Components::MovingHole>(entity, moving);
    return entity;
}

entt::entity HoleField::addAnimatedHole(const std::string& id, const Position& position, double radius,
                                        double nowMs, double startDelayMs)
{
    auto entity = createHole(id, position, radius, Components::HoleKind::Animated, false, false);

    Components::AnimatedHole animated;
    animated.phase = Components::AnimationPhase::Hidden;
    animated.startTime = nowMs + std::max(0.0, startDelayMs);
    animated.inDuration = config.animateInMs;
    animated.outDuration = config.animateOutMs;
    animated.idleDuration = random->uniform(config.idleMinMs, config.idleMaxMs);
    animated.hiddenDuration = random->uniform(config.hiddenMinMs, config.hiddenMaxMs);
    animated.currentScale = 0.0;
    registry.emplace<Components::AnimatedHole>(entity, animated);

    DEBUG_MSG(DEBUG_LEVEL_BASIC, "[HoleField] animated hole '" << id << "' hidden for "
              << animated.hiddenDuration << " ms\n");
    return entity;
}

void HoleField::destroyHole(entt::entity entity) {
    const auto& hole = registry.get<Components::Hole>(entity);
    holesById.erase(hole.id);
    holeOrder.erase(std::remove(holeOrder.begin(), holeOrder.end(), entity), holeOrder.end());
    registry.destroy(entity);
}

bool HoleField::removeHole(const std::string& id) {
    entt::entity const entity = find(id);
    if (entity == entt::null) {
        return false;
    }
    destroyHole(entity);
    return true;
}

void HoleField::clear() {
    for (auto entity : holeOrder) {
        registry.destroy(entity);
    }
    holeOrder.clear();
    holesById.clear();
    completedGoals.clear();
}

HoleState HoleField::snapshot(entt::entity entity) const {
    const auto& hole = registry.get<Components::Hole>(entity);

    HoleState state;
    state.id = hole.id;
    state.position = hole.position;
    state.radius = hole.radius;
    state.isGoal = hole.isGoal;
    state.isActive = hole.isActive;
    state.kind = hole.kind;
    if (const auto* moving = registry.try_get<Components::MovingHole>(entity)) {
        state.moving = *moving;
    }
    if (const auto* animated = registry.try_get<Components::AnimatedHole>(entity)) {
        state.animated = *animated;
    }
    if (const auto* saucer = registry.try_get<Components::SaucerHole>(entity)) {
        state.saucer = *saucer;
    }
    return state;
}

std::vector<HoleState> HoleField::getHoles() const {
    std::vector<HoleState> holes;
    holes.reserve(holeOrder.size());
    for (auto entity : holeOrder) {
        holes.push_back(snapshot(entity));
    }
    return holes;
}

std::optional<HoleState> HoleField::findHole(const std::string& id) const {
    entt::entity const entity = find(id);
    if (entity == entt::null) {
        return std::nullopt;
    }
    return snapshot(entity);
}

std::vector<HoleState> HoleField::getAnimatedHoles() const {
    std::vector<HoleState> holes;
    for (auto entity : holeOrder) {
        if (registry.all_of<Components::AnimatedHole>(entity)) {
            holes.push_back(snapshot(entity));
        }
    }
    return holes;
}

void HoleField::advanceAnimatedHoles(double nowMs) {
    advanceMovingHoles(nowMs);
    advanceCyclingHoles(nowMs);
}

bool HoleField::checkGoalReached(const Position& ballPosition, double /*ballRadius*/) {
    for (auto entity : holeOrder) {
        const auto& hole = registry.get<Components::Hole>(entity);
        if (!hole.isGoal || completedGoals.count(hole.id) != 0) {
            continue;
        }
        // The ball center has to cross the rim
        if (ballPosition.dist(hole.position) <= hole.radius) {
            completedGoals.insert(hole.id);
            DEBUG_MSG(DEBUG_LEVEL_BASIC, "[HoleField] goal '" << hole.id << "' reached ("
                      << completedGoals.size() << " completed)\n");
            return true;
        }
    }
    return false;
}

std::optional<HoleState> HoleField::checkHoleFallIn(const Position& ballPosition, double /*ballRadius*/,
                                                    const std::string& /*ballId*/) const
{
    for (auto entity : holeOrder) {
        const auto& hole = registry.get<Components::Hole>(entity);
        if (!hole.isActive) {
            continue;
        }
        if (hole.isGoal && completedGoals.count(hole.id) != 0) {
            continue;
        }
        if (registry.all_of<Components::SaucerHole>(entity)) {
            continue;
        }
        if (ballPosition.dist(hole.position) <= hole.radius) {
            DEBUG_MSG(DEBUG_LEVEL_BASIC, "[HoleField] ball fell into '" << hole.id << "'\n");
            return snapshot(entity);
        }
    }
    return std::nullopt;
}

bool HoleField::checkBoundaryFallOff(const Position& ballPosition, const Vector& bounds) const {
    return ballPosition.y > bounds.y + config.fallOffMargin;
}

bool HoleField::areAllGoalsCompleted(size_t requiredGoals) const {
    return completedGoals.size() >= requiredGoals;
}

bool HoleField::isGoalCompleted(const std::string& holeId) const {
    return completedGoals.count(holeId) != 0;
}

void HoleField::deactivateHole(const std::string& holeId) {
    entt::entity const entity = find(holeId);
    if (entity == entt::null || registry.all_of<Components::AnimatedHole>(entity)) {
        return;
    }
    registry.get<Components::Hole>(entity).isActive = false;
    DEBUG_MSG(DEBUG_LEVEL_BASIC, "[HoleField] deactivated '" << holeId << "'\n");
}

void HoleField::reset() {
    completedGoals.clear();
    registry.clear<Components::SaucerHole>();
    for (auto entity : holeOrder) {
        if (!registry.all_of<Components::AnimatedHole>(entity)) {
            registry.get<Components::Hole>(entity).isActive = true;
        }
    }
    DEBUG_MSG(DEBUG_LEVEL_BASIC, "[HoleField] reset " << holeOrder.size() << " holes\n");
}
