/**
 * @file level_director.hpp
 * @brief Game-side coordinator between a level's holes and the physics world
 *
 * The director owns the HoleField of the current level and answers the
 * world's possession queries: a ball is held while a saucer has it, and is
 * steered to the saucer center. Once per frame the game calls update() with
 * the world; the director keeps no reference to it.
 *
 * @code
 * LevelDirector director;
 * director.loadLayout(*LevelLayouts::builtin(1), nowMs);
 * world.setPossessionOracle(&director);
 *
 * world.step(TiltConstants::StepMilliseconds);
 * LevelEvent event = director.update(nowMs, world, "ball", TiltConstants::BallRadius);
 * @endcode
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "tiltball/core/possession.hpp"
#include "tiltball/holes/hole_field.hpp"
#include "tiltball/level/level_layout.hpp"

class PhysicsWorld;

/**
 * @brief What happened to the ball during one director update
 */
struct LevelEvent {
    enum class Kind {
        None,
        GoalReached,     ///< a goal was completed; more are required
        LevelComplete,   ///< a goal was completed and it was the last one required
        FellInHole,      ///< the ball dropped into a hole
        FellOffBoard,    ///< the ball left the bottom of the playfield
        SaucerCaptured,  ///< a power-up hole caught the ball
        SaucerEjected    ///< a saucer kicked the ball back out
    };

    Kind kind = Kind::None;
    std::string holeId;
    std::optional<SaucerKick> kick;
};

class LevelDirector : public IPossessionOracle {
public:
    LevelDirector();
    explicit LevelDirector(std::unique_ptr<IRandomSource> random,
                           const HoleFieldConfig& config = HoleFieldConfig{});
    ~LevelDirector() override = default;

    /**
     * @brief Replaces the holes with those of @p layout
     */
    void loadLayout(const LevelLayout& layout, double nowMs);

    /**
     * @brief Runs hole lifecycles and checks the ball against the holes
     *
     * Order: moving and animated holes, saucers (a finished saucer kicks the
     * ball through PhysicsWorld::setBodyVelocity), then fall-off, goal and
     * hole checks for a ball that is not held. At most one event is reported.
     */
    LevelEvent update(double nowMs, PhysicsWorld& world, const std::string& ballId, double ballRadius);

    // IPossessionOracle
    bool isBodyHeld(const std::string& bodyId) const override;
    std::optional<Position> getHeldTarget(const std::string& bodyId) const override;

    /**
     * @brief Forgets goal progress and releases captured balls; holes stay
     */
    void reset();

    HoleField& holes() { return holeField; }
    const HoleField& holes() const { return holeField; }

    const std::optional<LevelLayout>& layout() const { return currentLayout; }
    size_t requiredGoals() const;
    bool isComplete() const;

private:
    HoleField holeField;
    std::optional<LevelLayout> currentLayout;
};
