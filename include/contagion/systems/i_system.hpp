/**
 * @file i_system.hpp
 * @brief Interface for the per-tick systems driven by the Model
 */

#pragma once

#include <vector>

#include <entt/entt.hpp>
#include "contagion/core/world_config.hpp"

namespace Systems {

/**
 * @brief Cell entities in creation order.
 *
 * Systems that need a deterministic order walk this instead of a registry view.
 */
using Population = std::vector<entt::entity>;

/**
 * @class ISystem
 * @brief Base interface for all systems
 *
 * Each tick the Model calls update() on its systems in a fixed order.
 */
class ISystem {
public:
    virtual ~ISystem() = default;

    /**
     * @brief Updates the system for one simulation step
     *
     * @param registry EnTT registry holding a Cell component per entity
     * @param population The same entities in creation order
     */
    virtual void update(entt::registry& registry, const Population& population) = 0;

    /**
     * @brief Sets the world configuration
     *
     * @param config World bounds, contact radius and recovery period
     */
    virtual void setWorldConfig(const WorldConfig& config) = 0;
};

} // namespace Systems
