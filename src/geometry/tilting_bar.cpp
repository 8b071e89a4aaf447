#include "tiltball/geometry/tilting_bar.hpp"
#include "tiltball/core/debug.hpp"

#include <algorithm>
#include <cmath>

TiltingBar::TiltingBar()
    : TiltingBar(TiltingBarConfig{})
{
}

TiltingBar::TiltingBar(const TiltingBarConfig& cfg)
    : config(cfg)
{
    if (config.maxHeight < config.minHeight) {
        std::swap(config.maxHeight, config.minHeight);
    }
    config.friction = clampValue(config.friction, 0.0, 1.0);
    config.thickness = std::max(0.0, config.thickness);
    leftSideHeight = config.maxHeight;
    rightSideHeight = config.maxHeight;
}

double TiltingBar::clampHeight(double height) const {
    return clampValue(height, config.minHeight, config.maxHeight);
}

void TiltingBar::moveLeftSide(double input, double dtSeconds) {
    if (input == 0.0) {
        return;
    }
    // Raising means moving toward smaller y
    leftSideHeight = clampHeight(leftSideHeight - input * config.sideSpeed * dtSeconds);
}

void TiltingBar::moveRightSide(double input, double dtSeconds) {
    if (input == 0.0) {
        return;
    }
    rightSideHeight = clampHeight(rightSideHeight - input * config.sideSpeed * dtSeconds);
}

void TiltingBar::setLeftHeight(double height) {
    leftSideHeight = clampHeight(height);
}

void TiltingBar::setRightHeight(double height) {
    rightSideHeight = clampHeight(height);
}

double TiltingBar::rotation() const {
    double const range = config.maxHeight - config.minHeight;
    if (range <= EPSILON) {
        return 0.0;
    }
    return (rightSideHeight - leftSideHeight) / range * config.maxRotation;
}

double TiltingBar::tiltPercentage() const {
    if (std::abs(config.maxRotation) <= EPSILON) {
        return 0.0;
    }
    return rotation() / config.maxRotation;
}

BarEndpoints TiltingBar::getEndpoints() const {
    double const halfWidth = config.width / 2.0;
    return {
        Position(config.centerX - halfWidth, leftSideHeight),
        Position(config.centerX + halfWidth, rightSideHeight)
    };
}

Vector TiltingBar::getNormal() const {
    BarEndpoints const ends = getEndpoints();
    Vector const along = ends.end - ends.start;
    if (along.length() <= EPSILON) {
        return Vector(0.0, -1.0);
    }
    Vector normal = along.perp().normalized();
    if (normal.y > 0.0) {
        normal = -normal;
    }
    return normal;
}

Vector TiltingBar::getTangent() const {
    BarEndpoints const ends = getEndpoints();
    return (ends.end - ends.start).normalized(Vector(1.0, 0.0));
}

double TiltingBar::distanceToBar(const Position& point) const {
    BarEndpoints const ends = getEndpoints();
    return distanceToSegment(ends.start, ends.end, point);
}

bool TiltingBar::isPointNearBar(const Position& point, double radius) const {
    return distanceToBar(point) <= radius + config.thickness / 2.0 + 2.0;
}

void TiltingBar::reset() {
    leftSideHeight = config.maxHeight;
    rightSideHeight = config.maxHeight;
    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[TiltingBar] reset to height " << config.maxHeight << "\n");
}
