/**
 * @file model.hpp
 * @brief The state of one simulation run: population, clock and systems.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <vector>

#include <entt/entt.hpp>
#include "contagion/core/cell.hpp"
#include "contagion/core/world_config.hpp"
#include "contagion/systems/i_system.hpp"

/**
 * @brief Number of cells in each health state at one instant
 */
struct Census {
    int vulnerable = 0;
    int infected = 0;
    int immune = 0;

    int total() const { return vulnerable + infected + immune; }
};

/**
 * @class Model
 * @brief Owns a fixed population of cells and advances it tick by tick.
 *
 * Cells live as components in an EnTT registry. The Model keeps their
 * entities in creation order and runs its systems over them on every tick:
 * movement, boundary reflection, then the pairwise contact scan. The Model
 * never stops itself; drivers poll isComplete().
 */
class Model {
public:
    /**
     * @brief Seeds a new population.
     *
     * The first infectedCount cells start infected, the next immuneCount
     * start immune and the rest are vulnerable. Locations are uniform over
     * the world bounds and headings uniform over [0, 2*pi), scaled by speed.
     *
     * @param populationSize Number of cells, fixed for the run
     * @param speed Distance each cell moves per tick
     * @param infectedCount Cells infected at start, 0 < n < populationSize
     * @param immuneCount Cells immune at start, 0 <= n < populationSize
     * @param config World bounds, contact radius and recovery period
     * @param seed Seed for the location and heading draws
     * @throws InvalidConfiguration if the counts or the world are inconsistent
     */
    Model(int populationSize, double speed, int infectedCount, int immuneCount = 0,
          const WorldConfig& config = WorldConfig(),
          uint32_t seed = std::random_device{}());

    Model(const Model&) = delete;
    Model& operator=(const Model&) = delete;

    /**
     * @brief Advances the simulation by one step.
     *
     * All cells move and reflect before any contact is checked.
     */
    void tick();

    /**
     * @brief Clamps a cell back into the world and reflects its direction.
     */
    void enforceBounds(Cell& cell) const;

    /**
     * @brief Runs one pairwise contact scan over the current positions.
     */
    void checkContacts();

    /**
     * @brief True once no cell is infected.
     */
    bool isComplete() const;

    /** @brief Read-only view of the cells in creation order */
    std::vector<std::reference_wrapper<const Cell>> population() const;

    const Cell& cell(std::size_t index) const;
    Cell& cell(std::size_t index);
    std::size_t size() const { return cells.size(); }

    /** @brief Ticks elapsed since construction */
    int time() const { return currentTime; }

    Census census() const;

    const WorldConfig& config() const { return worldConfig; }

    entt::registry& getRegistry() { return registry; }
    const entt::registry& getRegistry() const { return registry; }

private:
    WorldConfig worldConfig;
    entt::registry registry;
    Systems::Population cells;
    std::vector<std::unique_ptr<Systems::ISystem>> systems;
    std::unique_ptr<Systems::ISystem> contactSystem;
    int currentTime = 0;
    std::mt19937 generator;

    static void validate(int populationSize, double speed, int infectedCount,
                         int immuneCount, const WorldConfig& config);

    void createSystems();
    void createCells(int populationSize, double speed, int infectedCount, int immuneCount);

    Point randomLocation();
    Point randomDirection(double speed);
};
