#include "contagion/systems/contact.hpp"
#include "contagion/core/cell.hpp"
#include "contagion/core/debug.hpp"
#include "contagion/core/profile.hpp"

#include <cstddef>

namespace Systems {

void ContactSystem::setWorldConfig(const WorldConfig& config) {
    worldConfig = config;
}

void ContactSystem::update(entt::registry& registry, const Population& population) {
    PROFILE_SCOPE("ContactSystem");

    const double radius = worldConfig.CellRadius;

    for (std::size_t i = 0; i < population.size(); ++i) {
        auto& first = registry.get<Cell>(population[i]);

        for (std::size_t j = i + 1; j < population.size(); ++j) {
            auto& second = registry.get<Cell>(population[j]);

            if (first.location.distance(second.location) >= radius) {
                continue;
            }

            EpidemicStats::recordContact();
            if (first.contactWith(second) != Cell::ContactResult::None) {
                EpidemicStats::recordInfection();
            }
        }
    }
}

} // namespace Systems
