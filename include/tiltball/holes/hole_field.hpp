/**
 * @file hole_field.hpp
 * @brief The holes of a level and their lifecycles
 *
 * Holes live in their own EnTT registry, separate from the physics bodies.
 * Every hole has a Components::Hole; moving, animated and captured power-up
 * holes additionally carry exactly one behaviour component:
 *
 * - MovingHole: eased back-and-forth motion along one axis, pausing at the
 *   ends and whenever the next position would crowd another active hole
 * - AnimatedHole: hidden -> animating in -> idle -> animating out -> hidden,
 *   active for collisions only while idle
 * - SaucerHole: added to a power-up hole when it captures a ball; sinking ->
 *   waiting -> ejecting, after which the hole is removed for good
 *
 * All times are milliseconds on the caller's clock. Lifecycles advance only
 * when the caller asks (advanceAnimatedHoles, advanceSaucerStates).
 */

#ifndef TILTBALL_HOLE_FIELD_HPP
#define TILTBALL_HOLE_FIELD_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <entt/entt.hpp>

#include "tiltball/components/hole.hpp"
#include "tiltball/core/random_source.hpp"
#include "tiltball/math/vector_math.hpp"

/**
 * @struct HoleFieldConfig
 * @brief Timings and distances of the hole lifecycles
 */
struct HoleFieldConfig {
    double defaultRadius = 14.0;

    // Moving holes: traversal time shrinks from max to min as the path grows to the reference distance
    double movingMinDurationMs = 1200.0;
    double movingMaxDurationMs = 3500.0;
    double movingReferenceDistance = 200.0;
    double movingPauseMs = 400.0;
    double separationBuffer = 10.0;

    // Animated holes
    double animateInMs = 500.0;
    double animateOutMs = 500.0;
    double idleMinMs = 3000.0;
    double idleMaxMs = 10000.0;
    double hiddenMinMs = 5000.0;
    double hiddenMaxMs = 20000.0;

    // Saucers
    double saucerSinkMs = 600.0;
    double saucerWaitMinMs = 1000.0;
    double saucerWaitMaxMs = 5000.0;
    double saucerEjectMs = 200.0;
    double kickForceMin = 200.0;
    double kickForceMax = 350.0;
    double kickAngle = 0.75 * 3.14159265358979323846;   // 135 degrees, up and to the left
    double kickAngleSpread = 3.14159265358979323846 / 12.0; // +/- 15 degrees

    // A ball this far below the playfield has fallen off
    double fallOffMargin = 50.0;
};

/**
 * @brief Read-only copy of one hole and its behaviour state
 */
struct HoleState {
    std::string id;
    Position position;
    double radius = 0.0;
    bool isGoal = false;
    bool isActive = false;
    Components::HoleKind kind = Components::HoleKind::Standard;
    std::optional<Components::MovingHole> moving;
    std::optional<Components::AnimatedHole> animated;
    std::optional<Components::SaucerHole> saucer;
};

/**
 * @brief Returned once when a saucer finishes ejecting
 */
struct SaucerKick {
    std::string ballId;
    Vector direction;   // unit
    double force;       // units/s
    std::string holeId;
};

enum class HoleSoundEffect {
    Appear,
    Disappear
};

using HoleSoundHook = std::function<void(HoleSoundEffect effect, const std::string& holeId)>;

class HoleField {
public:
    HoleField();
    explicit HoleField(std::unique_ptr<IRandomSource> random,
                       const HoleFieldConfig& config = HoleFieldConfig{});

    HoleField(const HoleField&) = delete;
    HoleField& operator=(const HoleField&) = delete;

    // Factories. An id already in use replaces the old hole. A radius <= 0
    // uses HoleFieldConfig::defaultRadius.
    entt::entity addStaticHole(const std::string& id, const Position& position, double radius = 0.0);
    entt::entity addGoalHole(const std::string& id, const Position& position, double radius = 0.0);
    entt::entity addPowerUpHole(const std::string& id, const Position& position, double radius = 0.0);

    /**
     * @brief Adds a hole that travels between min and max along one axis
     *
     * The hole starts at min (progress 0) heading toward max. The other
     * coordinate is taken from @p position. Bounds given in reverse are swapped.
     */
    entt::entity addMovingHole(const std::string& id, const Position& position, double radius,
                               Components::MovementAxis axis, double min, double max, double nowMs);

    /**
     * @brief Adds a cycling hole; it starts hidden and inactive
     *
     * @param startDelayMs Extra time before the first hidden period starts counting
     */
    entt::entity addAnimatedHole(const std::string& id, const Position& position, double radius,
                                 double nowMs, double startDelayMs = 0.0);

    bool removeHole(const std::string& id);

    // Removes every hole and forgets completed goals
    void clear();

    // Snapshots in insertion order
    std::vector<HoleState> getHoles() const;
    std::optional<HoleState> findHole(const std::string& id) const;
    std::vector<HoleState> getAnimatedHoles() const;
    size_t holeCount() const { return holeOrder.size(); }

    /**
     * @brief Advances moving and animated holes to @p nowMs
     */
    void advanceAnimatedHoles(double nowMs);

    /**
     * @brief Captures a ball in a power-up hole
     *
     * Draws the kick direction, kick force and wait time once. Ignored unless
     * the hole is a power-up hole that has not captured a ball yet.
     */
    void startSaucerCapture(const std::string& holeId, const std::string& ballId, double nowMs);

    /**
     * @brief Advances every saucer by at most one phase
     *
     * @return The kick of the first saucer that finished ejecting; that hole
     *         has been removed
     */
    std::optional<SaucerKick> advanceSaucerStates(double nowMs);

    /**
     * @brief Marks an unfinished goal hole containing the ball center as completed
     *
     * Completion is permanent until reset().
     */
    bool checkGoalReached(const Position& ballPosition, double ballRadius);

    /**
     * @brief First active hole whose rim the ball center has crossed
     *
     * Skips completed goals and saucers.
     */
    std::optional<HoleState> checkHoleFallIn(const Position& ballPosition, double ballRadius,
                                             const std::string& ballId) const;

    /**
     * @brief True once the ball center is more than fallOffMargin below the bounds
     */
    bool checkBoundaryFallOff(const Position& ballPosition, const Vector& bounds) const;

    std::optional<Position> getSaucerBallPosition(const std::string& holeId) const;
    bool isBallInSaucer(const std::string& ballId) const;
    std::optional<std::string> saucerHoleForBall(const std::string& ballId) const;

    size_t completedGoalCount() const { return completedGoals.size(); }
    bool areAllGoalsCompleted(size_t requiredGoals) const;
    bool isGoalCompleted(const std::string& holeId) const;

    /**
     * @brief Takes a hole out of collision testing
     *
     * Animated holes are not affected; their activity follows their phase.
     * A deactivated moving hole keeps moving until reset().
     */
    void deactivateHole(const std::string& holeId);

    /**
     * @brief Forgets completed goals, releases captured balls and reactivates
     *        every hole that is not animated
     */
    void reset();

    void setSoundEffectHook(HoleSoundHook hook) { soundHook = std::move(hook); }

    const HoleFieldConfig& getConfig() const { return config; }

private:
    entt::registry registry;
    HoleFieldConfig config;
    std::unique_ptr<IRandomSource> random;
    HoleSoundHook soundHook;

    std::vector<entt::entity> holeOrder;
    std::unordered_map<std::string, entt::entity> holesById;
    std::unordered_set<std::string> completedGoals;

    entt::entity createHole(const std::string& id, const Position& position, double radius,
                            Components::HoleKind kind, bool isGoal, bool isActive);
    entt::entity find(const std::string& id) const;
    HoleState snapshot(entt::entity entity) const;
    void destroyHole(entt::entity entity);

    // moving_holes.cpp
    void advanceMovingHoles(double nowMs);
    bool crowdsActiveHole(entt::entity self, const Position& candidate, double radius);

    // animated_holes.cpp
    void advanceCyclingHoles(double nowMs);
    void playSound(HoleSoundEffect effect, const std::string& holeId) const;
};

#endif // TILTBALL_HOLE_FIELD_HPP
