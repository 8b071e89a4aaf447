#include "tiltball/core/constants.hpp"

namespace TiltConstants {

    const double Pi = 3.14159265358979323846;

    const double StepMilliseconds = 1000.0 / 60.0;

    const double PlayfieldWidth  = 360.0;
    const double PlayfieldHeight = 640.0;

    const double BallRadius      = 12.0;
    const double BallMass        = 1.0;
    const double BallRestitution = 0.8;
    const double BallFriction    = 0.2;

    const double AudioCooldownMilliseconds = 150.0;

} // namespace TiltConstants
