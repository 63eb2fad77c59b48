/**
 * @file movement.hpp
 * @brief System for advancing every cell by one tick
 *
 * This system handles:
 * - Position updates using each cell's direction
 * - Infection progress and recovery of infected cells
 *
 * Required components:
 * - Cell (to modify)
 */

#ifndef MOVEMENT_SYSTEM_HPP
#define MOVEMENT_SYSTEM_HPP

#include "contagion/systems/i_system.hpp"

namespace Systems {

/**
 * @brief Calls Cell::tick on every cell in population order
 */
class MovementSystem : public ISystem {
public:
    MovementSystem() = default;
    ~MovementSystem() override = default;

    void update(entt::registry& registry, const Population& population) override;
    void setWorldConfig(const WorldConfig& config) override;

private:
    WorldConfig worldConfig;
};

} // namespace Systems

#endif
