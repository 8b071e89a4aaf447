#include "tiltball/systems/i_system.hpp"
#include "tiltball/components/basic.hpp"

namespace Systems {

double tickSeconds(entt::registry& registry, const SystemConfig& config) {
    auto stateView = registry.view<Components::SimulatorState>();
    if (stateView.begin() == stateView.end()) {
        return config.SecondsPerTick;
    }
    const auto& state = registry.get<Components::SimulatorState>(stateView.front());
    return state.secondsPerTick > 0.0 ? state.secondsPerTick : config.SecondsPerTick;
}

} // namespace Systems
