#pragma once

/**
 * @struct SystemConfig
 * @brief World-level parameters shared by every system in the tick pipeline.
 *
 * Units: playfield units (pixels) and seconds. Gravity is an acceleration in
 * units/s², y pointing down.
 */
struct SystemConfig {
    double GravityX = 0.0;
    double GravityY = 400.0;

    // Per-tick multiplier on the inferred Verlet velocity, in (0,1]
    double AirResistance = 0.999;

    double BoundsWidth = 360.0;
    double BoundsHeight = 640.0;

    // Nominal slice; the actual slice of a tick arrives through step(dt)
    double SecondsPerTick = 1.0 / 60.0;
};
