/**
 * @file physics_world.cpp
 * @brief Body store, setters and the per-tick pipeline
 */

#include "tiltball/core/physics_world.hpp"

#include <algorithm>
#include <cmath>

#include "tiltball/components/basic.hpp"
#include "tiltball/core/constants.hpp"
#include "tiltball/core/debug.hpp"
#include "tiltball/core/profile.hpp"
#include "tiltball/geometry/tilting_bar.hpp"

namespace {

PhysicsBody sanitize(PhysicsBody body) {
    if (!(body.mass > 0.0) || !std::isfinite(body.mass)) {
        body.mass = 1.0;
    }
    body.radius = std::max(0.0, body.radius);
    body.restitution = clampValue(body.restitution, 0.0, 1.0);
    body.friction = clampValue(body.friction, 0.0, 1.0);
    body.inverseMass = body.isStatic ? 0.0 : 1.0 / body.mass;
    body.isRollingOnBar = false;
    return body;
}

} // namespace

PhysicsWorld::PhysicsWorld()
    : PhysicsWorld(SystemConfig{})
{
}

PhysicsWorld::PhysicsWorld(const SystemConfig& config)
    : sysConfig(config)
    , possessionOracle(&defaultOracle)
    , audioLimiter(TiltConstants::AudioCooldownMilliseconds)
{
    sysConfig.AirResistance = clampValue(sysConfig.AirResistance, EPSILON, 1.0);
    sysConfig.BoundsWidth = std::max(0.0, sysConfig.BoundsWidth);
    sysConfig.BoundsHeight = std::max(0.0, sysConfig.BoundsHeight);

    stateEntity = registry.create();
    registry.emplace<Components::SimulatorState>(stateEntity, sysConfig.SecondsPerTick, 0.0);

    pipeline = {
        &integrationSystem,
        &constraintSystem,
        &bodyCollisionSystem,
        &barContactSystem,
        &boundarySystem,
        &velocitySystem
    };
    propagateConfig();

    auto sink = [this](const std::string& bodyId, double speed, CollisionType type) {
        reportContactSound(bodyId, speed, type);
    };
    bodyCollisionSystem.setSoundSink(sink);
    barContactSystem.setSoundSink(sink);
}

void PhysicsWorld::propagateConfig() {
    for (auto* system : pipeline) {
        system->setSystemConfig(sysConfig);
    }
}

PhysicsBody PhysicsWorld::createBody(const std::string& id,
                                     const Position& position,
                                     double radius,
                                     double mass,
                                     double restitution,
                                     double friction,
                                     bool isStatic)
{
    PhysicsBody body;
    body.id = id;
    body.position = position;
    body.previousPosition = position;
    body.velocity = Vector(0.0, 0.0);
    body.radius = radius;
    body.mass = mass;
    body.restitution = restitution;
    body.friction = friction;
    body.isStatic = isStatic;
    return sanitize(body);
}

entt::entity PhysicsWorld::addBody(const PhysicsBody& description) {
    PhysicsBody const body = sanitize(description);

    if (bodiesById.count(body.id) != 0) {
        DEBUG_MSG(DEBUG_LEVEL_BASIC, "[PhysicsWorld] replacing body '" << body.id << "'\n");
        removeBody(body.id);
    }

    auto entity = registry.create();
    registry.emplace<Components::BodyId>(entity, body.id);
    registry.emplace<Components::Position>(entity, body.position);
    registry.emplace<Components::PreviousPosition>(entity, body.previousPosition);
    registry.emplace<Components::Velocity>(entity, body.velocity);
    registry.emplace<Components::Radius>(entity, body.radius);
    registry.emplace<Components::Mass>(entity, body.mass, body.inverseMass);
    registry.emplace<Components::Material>(entity, body.restitution, body.friction);
    if (body.isStatic) {
        registry.emplace<Components::Static>(entity);
    }

    bodiesById[body.id] = entity;
    DEBUG_MSG(DEBUG_LEVEL_BASIC, "[PhysicsWorld] added body '" << body.id << "' r=" << body.radius
              << (body.isStatic ? " (static)" : "") << "\n");
    return entity;
}

void PhysicsWorld::removeBody(const std::string& id) {
    auto it = bodiesById.find(id);
    if (it == bodiesById.end()) {
        return;
    }
    registry.destroy(it->second);
    bodiesById.erase(it);
    DEBUG_MSG(DEBUG_LEVEL_BASIC, "[PhysicsWorld] removed body '" << id << "'\n");
}

entt::entity PhysicsWorld::findBody(const std::string& id) const {
    auto it = bodiesById.find(id);
    return it == bodiesById.end() ? entt::entity{entt::null} : it->second;
}

std::optional<PhysicsBody> PhysicsWorld::getBody(const std::string& id) const {
    entt::entity const entity = findBody(id);
    if (entity == entt::null) {
        return std::nullopt;
    }

    PhysicsBody body;
    body.id = id;
    body.position = registry.get<Components::Position>(entity);
    body.previousPosition = registry.get<Components::PreviousPosition>(entity);
    body.velocity = registry.get<Components::Velocity>(entity);
    body.radius = registry.get<Components::Radius>(entity).value;
    const auto& mass = registry.get<Components::Mass>(entity);
    body.mass = mass.value;
    body.inverseMass = mass.inverse;
    const auto& material = registry.get<Components::Material>(entity);
    body.restitution = material.restitution;
    body.friction = material.friction;
    body.isStatic = registry.all_of<Components::Static>(entity);
    body.isRollingOnBar = registry.all_of<Components::RollingOnBar>(entity);
    return body;
}

std::vector<PhysicsBody> PhysicsWorld::getBodies() const {
    std::vector<PhysicsBody> bodies;
    bodies.reserve(bodiesById.size());
    for (const auto& [id, entity] : bodiesById) {
        if (auto body = getBody(id)) {
            bodies.push_back(*body);
        }
    }
    std::sort(bodies.begin(), bodies.end(),
              [](const PhysicsBody& a, const PhysicsBody& b) { return a.id < b.id; });
    return bodies;
}

bool PhysicsWorld::resetBody(const std::string& id, const Position& position) {
    entt::entity const entity = findBody(id);
    if (entity == entt::null) {
        return false;
    }
    registry.get<Components::Position>(entity) = position;
    registry.get<Components::PreviousPosition>(entity) = position;
    registry.get<Components::Velocity>(entity) = Vector(0.0, 0.0);
    registry.remove<Components::RollingOnBar>(entity);
    return true;
}

bool PhysicsWorld::setBodyVelocity(const std::string& id, const Vector& velocity) {
    entt::entity const entity = findBody(id);
    if (entity == entt::null || registry.all_of<Components::Static>(entity)) {
        return false;
    }
    double const dt = Systems::tickSeconds(registry, sysConfig);
    const auto& pos = registry.get<Components::Position>(entity);
    registry.get<Components::PreviousPosition>(entity) = pos - velocity * dt;
    registry.get<Components::Velocity>(entity) = velocity;
    return true;
}

void PhysicsWorld::addConstraint(const Constraint& constraint) {
    constraintSystem.addConstraint(constraint);
}

void PhysicsWorld::clearConstraints() {
    constraintSystem.clearConstraints();
}

const std::vector<Constraint>& PhysicsWorld::getConstraints() const {
    return constraintSystem.getConstraints();
}

void PhysicsWorld::prepareTick() {
    bodyCollisionSystem.clearManifold();
    registry.clear<Components::RollingOnBar>();
    registry.clear<Components::Held>();

    for (const auto& [id, entity] : bodiesById) {
        if (registry.all_of<Components::Static>(entity) || !possessionOracle->isBodyHeld(id)) {
            continue;
        }
        registry.emplace<Components::Held>(entity, possessionOracle->getHeldTarget(id));
    }
}

void PhysicsWorld::step(double dtMs) {
    PROFILE_SCOPE("PhysicsWorld::step");

    if (!(dtMs > 0.0) || !std::isfinite(dtMs)) {
        DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[PhysicsWorld] ignoring step of " << dtMs << " ms\n");
        return;
    }

    auto& state = registry.get<Components::SimulatorState>(stateEntity);
    state.secondsPerTick = dtMs / 1000.0;
    state.elapsedMilliseconds += dtMs;

    prepareTick();

    for (auto* system : pipeline) {
        system->update(registry);
    }
}

void PhysicsWorld::setGravity(double x, double y) {
    sysConfig.GravityX = std::isfinite(x) ? x : 0.0;
    sysConfig.GravityY = std::isfinite(y) ? y : 0.0;
    propagateConfig();
    DEBUG_MSG(DEBUG_LEVEL_BASIC, "[PhysicsWorld] gravity (" << sysConfig.GravityX << ", "
              << sysConfig.GravityY << ")\n");
}

void PhysicsWorld::setAirResistance(double resistance) {
    double const requested = std::isfinite(resistance) ? resistance : 1.0;
    sysConfig.AirResistance = clampValue(requested, EPSILON, 1.0);
    propagateConfig();
    DEBUG_MSG(DEBUG_LEVEL_BASIC, "[PhysicsWorld] air resistance " << sysConfig.AirResistance << "\n");
}

void PhysicsWorld::setBounds(double width, double height) {
    sysConfig.BoundsWidth = std::isfinite(width) ? std::max(0.0, width) : 0.0;
    sysConfig.BoundsHeight = std::isfinite(height) ? std::max(0.0, height) : 0.0;
    propagateConfig();
    DEBUG_MSG(DEBUG_LEVEL_BASIC, "[PhysicsWorld] bounds " << sysConfig.BoundsWidth << "x"
              << sysConfig.BoundsHeight << "\n");
}

void PhysicsWorld::setIntegrationConfig(const Systems::IntegrationConfig& config) {
    integrationSystem.setSpecificConfig(config);
}

void PhysicsWorld::setBodyCollisionConfig(const Systems::BodyCollisionConfig& config) {
    bodyCollisionSystem.setSpecificConfig(config);
}

void PhysicsWorld::setBarContactConfig(const Systems::BarContactConfig& config) {
    barContactSystem.setSpecificConfig(config);
}

void PhysicsWorld::setSurfaceActuator(const TiltingBar* bar) {
    barContactSystem.setBar(bar);
}

const TiltingBar* PhysicsWorld::getSurfaceActuator() const {
    return barContactSystem.getBar();
}

bool PhysicsWorld::isBodyOnBar(const std::string& id) const {
    const TiltingBar* bar = barContactSystem.getBar();
    entt::entity const entity = findBody(id);
    if (bar == nullptr || entity == entt::null) {
        return false;
    }
    return bar->isPointNearBar(registry.get<Components::Position>(entity),
                               registry.get<Components::Radius>(entity).value);
}

void PhysicsWorld::setCollisionAudioHook(CollisionAudioHook hook) {
    audioHook = std::move(hook);
    audioLimiter.reset();
}

void PhysicsWorld::reportContactSound(const std::string& bodyId, double speed, CollisionType type) {
    if (!audioHook) {
        return;
    }
    if (audioLimiter.tryFire(bodyId, type, elapsedMilliseconds())) {
        audioHook(speed, type);
    }
}

void PhysicsWorld::setPossessionOracle(const IPossessionOracle* oracle) {
    possessionOracle = oracle != nullptr ? oracle : &defaultOracle;
}

const CollisionManifold& PhysicsWorld::getCollisionManifold() const {
    return bodyCollisionSystem.getManifold();
}

double PhysicsWorld::elapsedMilliseconds() const {
    return registry.get<Components::SimulatorState>(stateEntity).elapsedMilliseconds;
}
