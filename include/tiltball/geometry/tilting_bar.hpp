/**
 * @file tilting_bar.hpp
 * @brief The player-controlled bar the ball rolls and bounces on
 *
 * The bar is a segment between two endpoints at fixed x (centerX ± width/2)
 * whose y values (the "side heights") move independently. Heights are
 * absolute playfield y values, so a smaller height is higher on screen.
 * Rotation is never integrated: it is recomputed from the two heights.
 */

#ifndef TILTBALL_TILTING_BAR_HPP
#define TILTBALL_TILTING_BAR_HPP

#include "tiltball/math/vector_math.hpp"

/**
 * @struct TiltingBarConfig
 * @brief Geometry and actuation limits of the bar
 */
struct TiltingBarConfig {
    double centerX = 180.0;
    double width = 300.0;

    // Clamp range for each side height (y grows downward)
    double minHeight = 50.0;
    double maxHeight = 590.0;

    // Rotation reached when one side is at minHeight and the other at maxHeight
    double maxRotation = 3.14159265358979323846 / 6.0;

    // Units per second a side moves under full input
    double sideSpeed = 100.0;

    // Surface friction applied to tangential motion on contact, [0,1]
    double friction = 0.3;

    // Collision thickness; contact happens within radius + thickness/2
    double thickness = 12.0;
};

/**
 * @struct BarEndpoints
 * @brief Left (start) and right (end) end of the bar's center segment
 */
struct BarEndpoints {
    Position start;
    Position end;
};

class TiltingBar {
public:
    TiltingBar();
    explicit TiltingBar(const TiltingBarConfig& config);

    /**
     * @brief Moves the left side under player input
     *
     * @param input +1 raises the side, -1 lowers it, 0 leaves it
     * @param dtSeconds Duration of the input
     */
    void moveLeftSide(double input, double dtSeconds);
    void moveRightSide(double input, double dtSeconds);

    // Direct placement, clamped to [minHeight, maxHeight]
    void setLeftHeight(double height);
    void setRightHeight(double height);

    double leftHeight() const { return leftSideHeight; }
    double rightHeight() const { return rightSideHeight; }

    /**
     * @brief Bar angle in radians, (right - left) / (max - min) * maxRotation
     */
    double rotation() const;

    /**
     * @brief rotation() / maxRotation, in [-1,1]
     */
    double tiltPercentage() const;

    BarEndpoints getEndpoints() const;

    /**
     * @brief Unit surface normal pointing up (y <= 0)
     *
     * A zero-length segment yields (0,-1).
     */
    Vector getNormal() const;

    /**
     * @brief Unit direction from the left end to the right end
     *
     * A zero-length segment yields (1,0).
     */
    Vector getTangent() const;

    /**
     * @brief Distance from a point to the bar's center segment
     */
    double distanceToBar(const Position& point) const;

    /**
     * @brief True if a circle of the given radius touches the bar, with a 2 unit tolerance
     */
    bool isPointNearBar(const Position& point, double radius) const;

    // Both sides back to maxHeight (flat, at the bottom)
    void reset();

    const TiltingBarConfig& getConfig() const { return config; }
    double thickness() const { return config.thickness; }
    double friction() const { return config.friction; }

private:
    TiltingBarConfig config;
    double leftSideHeight;
    double rightSideHeight;

    double clampHeight(double height) const;
};

#endif // TILTBALL_TILTING_BAR_HPP
