#include "contagion/systems/movement.hpp"
#include "contagion/core/cell.hpp"
#include "contagion/core/debug.hpp"
#include "contagion/core/profile.hpp"

namespace Systems {

void MovementSystem::setWorldConfig(const WorldConfig& config) {
    worldConfig = config;
}

void MovementSystem::update(entt::registry& registry, const Population& population) {
    PROFILE_SCOPE("MovementSystem");

    for (auto entity : population) {
        auto& cell = registry.get<Cell>(entity);

        bool const wasInfected = cell.isInfected();
        cell.tick(worldConfig.RecoveryPeriod);

        if (wasInfected && cell.isImmune()) {
            EpidemicStats::recordRecovery();
        }
    }
}

} // namespace Systems
