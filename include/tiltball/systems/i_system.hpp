/**
 * @file i_system.hpp
 * @brief Interface for the systems that make up one physics tick
 */

#pragma once

#include <entt/entt.hpp>
#include "tiltball/core/system_config.hpp"

namespace Systems {

/**
 * @class ISystem
 * @brief Base interface for all ECS systems
 *
 * The world runs its systems in a fixed order once per tick. Every system
 * shares the world-level SystemConfig.
 */
class ISystem {
protected:
    SystemConfig sysConfig;  // Common configuration all systems have

public:
    virtual ~ISystem() = default;

    /**
     * @brief Runs the system for one simulation tick
     *
     * @param registry EnTT registry holding the bodies and the SimulatorState entity
     */
    virtual void update(entt::registry& registry) = 0;

    virtual void setSystemConfig(const SystemConfig& config) {
        sysConfig = config;
    }

    virtual const SystemConfig& getSystemConfig() const {
        return sysConfig;
    }
};

/**
 * @brief Base for systems carrying their own tunables on top of SystemConfig
 */
template<typename SpecificConfig>
class ConfigurableSystem : public ISystem {
protected:
    SpecificConfig specificConfig;

public:
    void setSpecificConfig(const SpecificConfig& config) {
        specificConfig = config;
    }

    const SpecificConfig& getSpecificConfig() const {
        return specificConfig;
    }
};

/**
 * @brief Seconds covered by the current tick, read from the SimulatorState entity
 *
 * Falls back to the nominal SecondsPerTick when no state entity exists.
 */
double tickSeconds(entt::registry& registry, const SystemConfig& config);

} // namespace Systems
