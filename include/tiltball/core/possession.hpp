/**
 * @file possession.hpp
 * @brief Query hooks that let game logic take a body away from the integrator
 *
 * The world asks, the level director answers: at the start of every tick the
 * world queries the installed oracle for each body and tags held bodies. A
 * held body is steered toward its target instead of being integrated, and is
 * skipped by bar contact and boundary handling.
 */

#pragma once

#include <optional>
#include <string>
#include "tiltball/math/vector_math.hpp"

class IPossessionOracle {
public:
    virtual ~IPossessionOracle() = default;

    virtual bool isBodyHeld(const std::string& bodyId) const = 0;

    /**
     * @brief Where a held body should be steered to, if anywhere
     *
     * A held body without a target stays where it is.
     */
    virtual std::optional<Position> getHeldTarget(const std::string& bodyId) const = 0;
};

/**
 * @brief Oracle installed by default: nothing is ever held
 */
class NullPossessionOracle : public IPossessionOracle {
public:
    bool isBodyHeld(const std::string&) const override { return false; }
    std::optional<Position> getHeldTarget(const std::string&) const override { return std::nullopt; }
};
