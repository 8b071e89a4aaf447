/**
 * @file easing.hpp
 * @brief Easing curves used by hole motion and hole pop-in / pop-out
 *
 * All curves take a normalized progress t in [0,1].
 */

#pragma once

namespace Easing {

/// Quadratic ease-in-out, symmetric around t = 0.5.
double easeInOut(double t);

/// Overshoots past 1 before settling (pop-in).
double easeOutBack(double t);

/// Dips below 0 before accelerating toward 1 (pop-out).
double easeInBack(double t);

/// Hermite smoothstep t*t*(3-2t).
double smoothstep(double t);

} // namespace Easing
