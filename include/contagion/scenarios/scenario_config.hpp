/**
 * @file scenario_config.hpp
 * @brief Configuration for a simulation scenario.
 */

#pragma once

#include "contagion/core/world_config.hpp"

/**
 * @brief Everything needed to seed a Model for one scenario.
 *
 * Holds the population size, the speed every cell starts with, how many
 * cells start infected or immune, and the world they move in.
 */
struct ScenarioConfig {
    int PopulationSize = 100;
    double CellSpeed = SimulatorConstants::DefaultCellSpeed;
    int InfectedCount = 1;
    int ImmuneCount = 0;

    WorldConfig world;
};
