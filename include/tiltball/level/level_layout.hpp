/**
 * @file level_layout.hpp
 * @brief Static description of a level and how it becomes a HoleField
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "tiltball/components/hole.hpp"
#include "tiltball/math/vector_math.hpp"

class HoleField;

/**
 * @struct HoleSpec
 * @brief One hole of a layout
 *
 * axis/min/max are used by moving holes, startDelayMs by animated holes.
 */
struct HoleSpec {
    Components::HoleKind kind = Components::HoleKind::Standard;
    Position position;
    double radius = 0.0; // <= 0: HoleFieldConfig::defaultRadius
    Components::MovementAxis axis = Components::MovementAxis::X;
    double min = 0.0;
    double max = 0.0;
    double startDelayMs = 0.0;
};

struct LevelLayout {
    int id = 0;
    std::string name;
    Position ballStart;
    size_t requiredGoals = 0; // 0: every goal hole in the layout
    double bonusMultiplier = 1.0;
    std::vector<HoleSpec> holes;

    size_t goalCount() const;

    /**
     * @brief requiredGoals, or the number of goal holes when it is 0
     */
    size_t effectiveRequiredGoals() const;
};

/**
 * @brief Replaces the contents of @p field with the holes of @p layout
 *
 * Hole ids are "<kind>-hole-<level>-<index>", with kind one of standard,
 * goal, powerup, moving, animated and the index counted per kind.
 */
void populateHoleField(HoleField& field, const LevelLayout& layout, double nowMs);

/**
 * @brief Prefix used in hole ids for a kind of hole
 */
std::string holeKindName(Components::HoleKind kind);

namespace LevelLayouts {

/**
 * @brief Ids of the built-in layouts, ascending
 */
std::vector<int> builtinIds();

/**
 * @brief A built-in layout, or nothing for an unknown id
 */
std::optional<LevelLayout> builtin(int id);

} // namespace LevelLayouts
