#ifndef TILTBALL_COMPONENTS_BASIC_HPP
#define TILTBALL_COMPONENTS_BASIC_HPP

#include <optional>
#include <string>
#include "tiltball/math/vector_math.hpp" // for Position, Vector

namespace Components {

    // Use the Position and Vector classes from vector_math.hpp
    using Position = ::Position;

    // Cached velocity in units per second, recomputed at the end of every tick
    using Velocity = ::Vector;

    // Verlet state: the implicit per-tick velocity is Position - PreviousPosition
    struct PreviousPosition : public ::Position {
        PreviousPosition() = default;
        PreviousPosition(double x, double y) : ::Position(x, y) {}
        PreviousPosition(const ::Position& p) : ::Position(p) {}
    };

    struct BodyId {
        std::string value;
    };

    struct Radius {
        double value;
    };

    // inverse is 0 for static bodies
    struct Mass {
        double value;
        double inverse;
    };

    struct Material {
        double restitution; // [0,1]
        double friction;    // [0,1]
    };

    // Tags
    struct Static {};
    struct RollingOnBar {}; // transient, recomputed every tick

    // Present while the possession oracle reports the body as held
    struct Held {
        std::optional<::Position> target;
    };

    struct SimulatorState {
        double secondsPerTick = 1.0 / 60.0;
        double elapsedMilliseconds = 0.0;

        SimulatorState(double spt = 1.0 / 60.0, double elapsed = 0.0)
            : secondsPerTick(spt)
            , elapsedMilliseconds(elapsed) {}
    };

} // namespace Components

#endif
