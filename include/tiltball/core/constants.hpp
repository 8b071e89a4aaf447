#ifndef TILTBALL_CONSTANTS_HPP
#define TILTBALL_CONSTANTS_HPP

namespace TiltConstants {

    // Truly global constants
    extern const double Pi;

    // Fixed simulation slice (one tick at 60 Hz)
    extern const double StepMilliseconds;

    // Playfield
    extern const double PlayfieldWidth;
    extern const double PlayfieldHeight;

    // The player's ball
    extern const double BallRadius;
    extern const double BallMass;
    extern const double BallRestitution;
    extern const double BallFriction;

    // Collision audio rate limit per (body, collision type)
    extern const double AudioCooldownMilliseconds;
}

#endif // TILTBALL_CONSTANTS_HPP
