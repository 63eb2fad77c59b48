/**
 * @file contact.hpp
 * @brief System for resolving infections between cells in contact
 *
 * Every unordered pair (i, j), i < j in population order, is checked once
 * per tick. Pairs closer than WorldConfig::CellRadius are handed to
 * Cell::contactWith. The scan is quadratic in the population size; there
 * is no spatial index.
 *
 * Required components:
 * - Cell (to read location, modify health)
 */

#ifndef CONTACT_SYSTEM_HPP
#define CONTACT_SYSTEM_HPP

#include "contagion/systems/i_system.hpp"

namespace Systems {

class ContactSystem : public ISystem {
public:
    ContactSystem() = default;
    ~ContactSystem() override = default;

    void update(entt::registry& registry, const Population& population) override;
    void setWorldConfig(const WorldConfig& config) override;

private:
    WorldConfig worldConfig;
};

} // namespace Systems

#endif
