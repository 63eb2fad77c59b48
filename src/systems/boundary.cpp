#include "contagion/systems/boundary.hpp"
#include "contagion/core/cell.hpp"
#include "contagion/core/profile.hpp"

namespace Systems {

void BoundarySystem::setWorldConfig(const WorldConfig& config) {
    worldConfig = config;
}

void BoundarySystem::update(entt::registry& registry, const Population& population) {
    PROFILE_SCOPE("BoundarySystem");

    for (auto entity : population) {
        enforceBounds(registry.get<Cell>(entity), worldConfig);
    }
}

bool BoundarySystem::enforceBounds(Cell& cell, const WorldConfig& config) {
    auto& pos = cell.location;
    auto& dir = cell.direction;
    bool bounced = false;

    if (pos.x > config.MaxX) {
        pos.x = config.MaxX;
        dir.x = -dir.x;
        bounced = true;
    }
    if (pos.x < config.MinX) {
        pos.x = config.MinX;
        dir.x = -dir.x;
        bounced = true;
    }

    if (pos.y > config.MaxY) {
        pos.y = config.MaxY;
        dir.y = -dir.y;
        bounced = true;
    }
    if (pos.y < config.MinY) {
        pos.y = config.MinY;
        dir.y = -dir.y;
        bounced = true;
    }

    return bounced;
}

} // namespace Systems
