/**
 * @file bar_contact.hpp
 * @brief Contact between bodies and the tilting bar: bounce or roll
 *
 * A body touches the bar when its center is closer than radius + thickness/2
 * to the bar's center segment. On contact the body is placed on the bar
 * surface and one of two responses applies, chosen by the velocity along
 * the surface normal:
 * - bounce (faster than the threshold into the bar): reflect, damp the normal
 *   part by restitution * stability and the tangential part additionally by
 *   the bar friction
 * - roll (otherwise): keep only the tangential velocity, accelerated by
 *   gravity along the slope and slowed by resistance proportional to speed
 *
 * The threshold has no hysteresis, so a ball whose normal speed hovers around
 * it can alternate between the two responses on consecutive ticks.
 *
 * Required components:
 * - Position, PreviousPosition (to modify)
 * - Radius, Material (to read)
 *
 * Optional components:
 * - Static, Held (skipped)
 * - RollingOnBar (set while rolling)
 */

#pragma once

#include <entt/entt.hpp>
#include "tiltball/systems/i_system.hpp"
#include "tiltball/systems/collision_audio.hpp"

class TiltingBar;

namespace Systems {

/**
 * @struct BarContactConfig
 * @brief Configuration parameters specific to bar contact
 */
struct BarContactConfig {
    // Per-tick velocity along the normal below which the body bounces
    double bounceThreshold = -0.5;

    // Extra energy loss on every bounce, multiplied into restitution
    double bounceStability = 0.8;

    // Rolling drag coefficient, added to the bar friction (1/s)
    double rollingResistance = 0.01;
};

class BarContactSystem : public ConfigurableSystem<BarContactConfig> {
public:
    BarContactSystem() = default;
    ~BarContactSystem() override = default;

    void update(entt::registry& registry) override;

    /**
     * @brief Installs the bar; nullptr disables bar contact
     *
     * The bar is not owned and must outlive its use by this system.
     */
    void setBar(const TiltingBar* bar) { this->bar = bar; }
    const TiltingBar* getBar() const { return bar; }

    void setSoundSink(ContactSoundSink sink) { soundSink = std::move(sink); }

private:
    const TiltingBar* bar = nullptr;
    ContactSoundSink soundSink;
};

} // namespace Systems
