#include "tiltball/math/easing.hpp"

namespace Easing {

namespace {
    // Standard "back" overshoot constant (~10% overshoot)
    constexpr double BackOvershoot = 1.70158;
}

double easeInOut(double t) {
    return t < 0.5 ? 2.0 * t * t : -1.0 + (4.0 - 2.0 * t) * t;
}

double easeOutBack(double t) {
    const double c3 = BackOvershoot + 1.0;
    const double u = t - 1.0;
    return 1.0 + c3 * u * u * u + BackOvershoot * u * u;
}

double easeInBack(double t) {
    const double c3 = BackOvershoot + 1.0;
    return c3 * t * t * t - BackOvershoot * t * t;
}

double smoothstep(double t) {
    return t * t * (3.0 - 2.0 * t);
}

} // namespace Easing
