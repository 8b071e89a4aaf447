#include "tiltball/level/level_layout.hpp"

#include <algorithm>
#include <map>

#include "tiltball/core/debug.hpp"
#include "tiltball/holes/hole_field.hpp"

using Components::HoleKind;
using Components::MovementAxis;

size_t LevelLayout::goalCount() const {
    return static_cast<size_t>(std::count_if(holes.begin(), holes.end(),
        [](const HoleSpec& spec) { return spec.kind == HoleKind::Goal; }));
}

size_t LevelLayout::effectiveRequiredGoals() const {
    return requiredGoals > 0 ? requiredGoals : goalCount();
}

std::string holeKindName(HoleKind kind) {
    switch (kind) {
        case HoleKind::Standard: return "standard";
        case HoleKind::Goal:     return "goal";
        case HoleKind::PowerUp:  return "powerup";
        case HoleKind::Moving:   return "moving";
        case HoleKind::Animated: return "animated";
        default: return "unknown";
    }
}

void populateHoleField(HoleField& field, const LevelLayout& layout, double nowMs) {
    field.clear();

    std::map<HoleKind, int> nextIndex;
    for (const auto& spec : layout.holes) {
        int const index = nextIndex[spec.kind]++;
        std::string const id = holeKindName(spec.kind) + "-hole-" + std::to_string(layout.id)
                             + "-" + std::to_string(index);

        switch (spec.kind) {
            case HoleKind::Standard:
                field.addStaticHole(id, spec.position, spec.radius);
                break;
            case HoleKind::Goal:
                field.addGoalHole(id, spec.position, spec.radius);
                break;
            case HoleKind::PowerUp:
                field.addPowerUpHole(id, spec.position, spec.radius);
                break;
            case HoleKind::Moving:
                field.addMovingHole(id, spec.position, spec.radius, spec.axis, spec.min, spec.max, nowMs);
                break;
            case HoleKind::Animated:
                field.addAnimatedHole(id, spec.position, spec.radius, nowMs, spec.startDelayMs);
                break;
        }
    }

    DEBUG_MSG(DEBUG_LEVEL_BASIC, "[Level] layout " << layout.id << " '" << layout.name << "' with "
              << field.holeCount() << " holes\n");
}

namespace LevelLayouts {

namespace {

HoleSpec hole(HoleKind kind, double x, double y) {
    HoleSpec spec;
    spec.kind = kind;
    spec.position = Position(x, y);
    return spec;
}

HoleSpec movingHole(double x, double y, MovementAxis axis, double min, double max) {
    HoleSpec spec = hole(HoleKind::Moving, x, y);
    spec.axis = axis;
    spec.min = min;
    spec.max = max;
    return spec;
}

HoleSpec animatedHole(double x, double y, double startDelayMs) {
    HoleSpec spec = hole(HoleKind::Animated, x, y);
    spec.startDelayMs = startDelayMs;
    return spec;
}

LevelLayout base(int id, const std::string& name) {
    LevelLayout layout;
    layout.id = id;
    layout.name = name;
    layout.ballStart = Position(343.0, 584.0);
    layout.bonusMultiplier = 1.0 + (id - 1) * 0.2;
    return layout;
}

} // namespace

std::vector<int> builtinIds() {
    return {1, 2, 3};
}

std::optional<LevelLayout> builtin(int id) {
    switch (id) {
        case 1: {
            LevelLayout layout = base(1, "Training");
            layout.holes = {
                hole(HoleKind::Standard, 90.0, 420.0),
                hole(HoleKind::Standard, 270.0, 330.0),
                hole(HoleKind::Standard, 120.0, 220.0),
                hole(HoleKind::Goal, 180.0, 120.0)
            };
            return layout;
        }
        case 2: {
            LevelLayout layout = base(2, "Moving lanes");
            layout.holes = {
                movingHole(0.0, 440.0, MovementAxis::X, 60.0, 300.0),
                movingHole(0.0, 300.0, MovementAxis::X, 120.0, 220.0),
                hole(HoleKind::Standard, 60.0, 200.0),
                animatedHole(280.0, 200.0, 1000.0),
                hole(HoleKind::Goal, 100.0, 100.0),
                hole(HoleKind::Goal, 260.0, 100.0)
            };
            return layout;
        }
        case 3: {
            LevelLayout layout = base(3, "Power ups");
            layout.holes = {
                hole(HoleKind::PowerUp, 80.0, 460.0),
                hole(HoleKind::Standard, 200.0, 400.0),
                animatedHole(140.0, 300.0, 0.0),
                animatedHole(260.0, 260.0, 2500.0),
                movingHole(180.0, 0.0, MovementAxis::Y, 150.0, 230.0),
                hole(HoleKind::PowerUp, 300.0, 340.0),
                hole(HoleKind::Goal, 60.0, 90.0),
                hole(HoleKind::Goal, 300.0, 90.0)
            };
            layout.requiredGoals = 2;
            return layout;
        }
        default:
            return std::nullopt;
    }
}

} // namespace LevelLayouts
