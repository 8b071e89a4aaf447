/**
 * @file constraints.hpp
 * @brief Single-pass positional constraint solver
 *
 * Constraints are solved once per tick in insertion order. The result is not
 * converged; a stiff chain of constraints settles over several ticks.
 *
 * Required components:
 * - Position (to modify)
 * - Mass (inverse mass splits corrections)
 *
 * Optional components:
 * - Static, Held (treated as immovable)
 */

#ifndef TILTBALL_CONSTRAINTS_HPP
#define TILTBALL_CONSTRAINTS_HPP

#include <variant>
#include <vector>

#include <entt/entt.hpp>
#include "tiltball/math/vector_math.hpp"
#include "tiltball/systems/i_system.hpp"

/**
 * @brief Keeps two bodies a fixed distance apart
 */
struct DistanceConstraint {
    entt::entity bodyA = entt::null;
    entt::entity bodyB = entt::null;
    double distance = 0.0;
};

/**
 * @brief Pulls one body toward a pinned point
 */
struct PositionConstraint {
    entt::entity body = entt::null;
    Position target;
};

/**
 * @brief Keeps the heading from A to B at a fixed angle (radians, atan2 convention)
 */
struct AngleConstraint {
    entt::entity bodyA = entt::null;
    entt::entity bodyB = entt::null;
    double angle = 0.0;
};

struct Constraint {
    std::variant<DistanceConstraint, PositionConstraint, AngleConstraint> kind;
    double stiffness = 1.0; // [0,1], clamped when added
};

namespace Systems {

class ConstraintSolverSystem : public ISystem {
public:
    ConstraintSolverSystem() = default;
    ~ConstraintSolverSystem() override = default;

    void update(entt::registry& registry) override;

    void addConstraint(Constraint constraint);
    void clearConstraints();
    const std::vector<Constraint>& getConstraints() const { return constraints; }

private:
    std::vector<Constraint> constraints;

    void solve(entt::registry& registry, const DistanceConstraint& c, double stiffness);
    void solve(entt::registry& registry, const PositionConstraint& c, double stiffness);
    void solve(entt::registry& registry, const AngleConstraint& c, double stiffness);
};

} // namespace Systems

#endif // TILTBALL_CONSTRAINTS_HPP
