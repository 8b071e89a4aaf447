#ifndef TILTBALL_COMPONENTS_HOLE_HPP
#define TILTBALL_COMPONENTS_HOLE_HPP

#include <string>
#include "tiltball/math/vector_math.hpp"

namespace Components {

    enum class HoleKind {
        Standard,
        Goal,
        PowerUp,
        Moving,
        Animated
    };

    // Every hole carries this; behaviour is added by at most one of the
    // components below
    struct Hole {
        std::string id;
        Position position;
        double radius;
        bool isGoal;
        bool isActive;
        HoleKind kind;
    };

    enum class MovementAxis {
        X,
        Y
    };

    enum class MovePhase {
        Moving,
        Stopping
    };

    // Oscillates along one axis between min and max
    struct MovingHole {
        MovementAxis axis = MovementAxis::X;
        double min = 0.0;
        double max = 0.0;
        int direction = 1;           // +1 toward max, -1 toward min
        MovePhase phase = MovePhase::Moving;
        double progress = 0.0;       // [0,1] along min..max, before easing
        double lastUpdate = 0.0;     // ms
        double duration = 0.0;       // ms for a full traversal
        double stopTime = 0.0;       // ms, when the current pause began
    };

    enum class AnimationPhase {
        AnimatingIn,
        Idle,
        AnimatingOut,
        Hidden
    };

    // Appears, stays, disappears, stays hidden, repeats
    struct AnimatedHole {
        AnimationPhase phase = AnimationPhase::Hidden;
        double startTime = 0.0;      // ms, start of the current phase
        double inDuration = 500.0;
        double idleDuration = 0.0;
        double outDuration = 500.0;
        double hiddenDuration = 0.0;
        double currentScale = 0.0;   // 0..1, overshoots slightly while animating in
    };

    enum class SaucerPhase {
        Sinking,
        Waiting,
        Ejecting
    };

    // A power-up hole that has captured a ball
    struct SaucerHole {
        std::string ballId;
        double startTime = 0.0;      // ms, start of the current phase
        SaucerPhase phase = SaucerPhase::Sinking;
        double sinkDuration = 600.0;
        double waitDuration = 0.0;
        Vector kickDirection;        // unit
        double kickForce = 0.0;      // units/s
        double sinkDepth = 0.0;      // 0..1
    };

} // namespace Components

#endif
