/**
 * @file boundary.hpp
 * @brief System for handling world boundary collisions
 *
 * This system handles:
 * - Checking if cells are outside the world bounds
 * - Clamping them back onto the violated edge
 * - Reflecting the direction component normal to that edge
 *
 * Required components:
 * - Cell (to read/modify location and direction)
 */

#ifndef BOUNDARY_SYSTEM_HPP
#define BOUNDARY_SYSTEM_HPP

#include "contagion/systems/i_system.hpp"

class Cell;

namespace Systems {

/**
 * @class BoundarySystem
 * @brief Elastic reflection off the four world edges
 *
 * Each axis is checked on its own, so a cell past a corner is clamped
 * and reflected on both axes in the same call. Reflection does not
 * dampen speed.
 */
class BoundarySystem : public ISystem {
public:
    BoundarySystem() = default;
    ~BoundarySystem() override = default;

    /**
     * @brief Enforces bounds on every cell
     */
    void update(entt::registry& registry, const Population& population) override;

    void setWorldConfig(const WorldConfig& config) override;

    /**
     * @brief Enforces bounds on a single cell
     * @param cell Cell to clamp and reflect
     * @param config World whose edges apply
     * @return true if the cell touched any edge
     */
    static bool enforceBounds(Cell& cell, const WorldConfig& config);

private:
    WorldConfig worldConfig;
};

} // namespace Systems

#endif
