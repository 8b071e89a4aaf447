/**
 * @file physics_world.hpp
 * @brief Body store and fixed-timestep driver of the simulation
 *
 * The world owns an EnTT registry holding one entity per body plus one
 * SimulatorState entity, and a fixed pipeline of systems. step(dt) runs:
 *
 *  1. clear the previous tick's manifold, RollingOnBar and Held tags, then
 *     tag the bodies the possession oracle reports as held
 *  2. VerletIntegrationSystem
 *  3. ConstraintSolverSystem (one pass)
 *  4. BodyCollisionSystem
 *  5. BarContactSystem
 *  6. BoundarySystem
 *  7. VelocitySystem
 *
 * The caller owns fixed-timestep accumulation and calls step once per slice.
 * Nothing here throws during a step; bad input is clamped or ignored.
 */

#ifndef TILTBALL_PHYSICS_WORLD_HPP
#define TILTBALL_PHYSICS_WORLD_HPP

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <entt/entt.hpp>

#include "tiltball/core/physics_body.hpp"
#include "tiltball/core/possession.hpp"
#include "tiltball/core/system_config.hpp"
#include "tiltball/systems/bar_contact.hpp"
#include "tiltball/systems/boundary.hpp"
#include "tiltball/systems/collision/body_collision.hpp"
#include "tiltball/systems/collision_audio.hpp"
#include "tiltball/systems/constraints.hpp"
#include "tiltball/systems/integration.hpp"
#include "tiltball/systems/velocity.hpp"

class TiltingBar;

/**
 * @brief Observer for collision sounds: contact speed in units/s and the kind of contact
 */
using CollisionAudioHook = std::function<void(double speed, CollisionType type)>;

class PhysicsWorld {
public:
    PhysicsWorld();
    explicit PhysicsWorld(const SystemConfig& config);

    PhysicsWorld(const PhysicsWorld&) = delete;
    PhysicsWorld& operator=(const PhysicsWorld&) = delete;

    /**
     * @brief Builds a body description with its invariants applied
     *
     * Mass <= 0 falls back to 1, restitution and friction are clamped to
     * [0,1], a negative radius becomes 0 and a static body gets inverse mass 0.
     * The body starts at rest.
     */
    static PhysicsBody createBody(const std::string& id,
                                  const Position& position,
                                  double radius,
                                  double mass = 1.0,
                                  double restitution = 0.7,
                                  double friction = 0.3,
                                  bool isStatic = false);

    /**
     * @brief Adds a body to the simulation
     *
     * The invariants of createBody are re-applied. A body with the same id
     * already in the world is replaced. previousPosition is taken as given,
     * so the implicit velocity is position - previousPosition; use createBody
     * (or resetBody afterwards) for a body at rest.
     *
     * @return The entity now representing the body
     */
    entt::entity addBody(const PhysicsBody& body);

    // Unknown ids are ignored
    void removeBody(const std::string& id);

    entt::entity findBody(const std::string& id) const;
    std::optional<PhysicsBody> getBody(const std::string& id) const;
    std::vector<PhysicsBody> getBodies() const;
    size_t bodyCount() const { return bodiesById.size(); }

    /**
     * @brief Moves a body and brings it to rest
     * @return false if the id is unknown
     */
    bool resetBody(const std::string& id, const Position& position);

    /**
     * @brief Re-encodes the Verlet state so the next implicit velocity is @p velocity
     *
     * @param velocity Units per second
     * @return false if the id is unknown or the body is static
     */
    bool setBodyVelocity(const std::string& id, const Vector& velocity);

    /**
     * @brief Adds a constraint; its stiffness is clamped to [0,1]
     */
    void addConstraint(const Constraint& constraint);
    void clearConstraints();
    const std::vector<Constraint>& getConstraints() const;

    /**
     * @brief Advances the simulation by one fixed slice
     *
     * @param dtMs Slice length in milliseconds; a non-positive or non-finite
     *             value leaves the world untouched
     */
    void step(double dtMs);

    void setGravity(double x, double y);
    void setAirResistance(double resistance);  // clamped to (0,1]
    void setBounds(double width, double height); // clamped to >= 0
    const SystemConfig& getSystemConfig() const { return sysConfig; }

    void setIntegrationConfig(const Systems::IntegrationConfig& config);
    void setBodyCollisionConfig(const Systems::BodyCollisionConfig& config);
    void setBarContactConfig(const Systems::BarContactConfig& config);

    /**
     * @brief Installs the bar used for bar contact; nullptr removes it
     *
     * The world does not own the bar. The caller keeps it alive and may move
     * its sides between steps.
     */
    void setSurfaceActuator(const TiltingBar* bar);
    const TiltingBar* getSurfaceActuator() const;

    /**
     * @brief True if the body is within touching distance of the bar (2 unit tolerance)
     */
    bool isBodyOnBar(const std::string& id) const;

    /**
     * @brief Installs the collision sound observer; an empty function removes it
     *
     * Calls are limited to one per 150 ms of simulation time per
     * (body, collision type).
     */
    void setCollisionAudioHook(CollisionAudioHook hook);

    /**
     * @brief Installs the possession oracle; nullptr restores the default
     *
     * Not owned; must outlive the world or be replaced before it dies.
     */
    void setPossessionOracle(const IPossessionOracle* oracle);

    /**
     * @brief Body-body contacts of the last step
     */
    const CollisionManifold& getCollisionManifold() const;

    double elapsedMilliseconds() const;

    entt::registry& getRegistry() { return registry; }

private:
    entt::registry registry;
    entt::entity stateEntity;
    SystemConfig sysConfig;

    std::unordered_map<std::string, entt::entity> bodiesById;

    NullPossessionOracle defaultOracle;
    const IPossessionOracle* possessionOracle;

    CollisionAudioHook audioHook;
    CollisionAudioLimiter audioLimiter;

    Systems::VerletIntegrationSystem integrationSystem;
    Systems::ConstraintSolverSystem constraintSystem;
    Systems::BodyCollisionSystem bodyCollisionSystem;
    Systems::BarContactSystem barContactSystem;
    Systems::BoundarySystem boundarySystem;
    Systems::VelocitySystem velocitySystem;

    std::vector<Systems::ISystem*> pipeline;

    void prepareTick();
    void propagateConfig();
    void reportContactSound(const std::string& bodyId, double speed, CollisionType type);
};

#endif // TILTBALL_PHYSICS_WORLD_HPP
