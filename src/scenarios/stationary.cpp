#include "contagion/scenarios/stationary.hpp"
#include "contagion/core/constants.hpp"

std::string StationaryScenario::getName() const {
    return SimulatorConstants::getScenarioName(SimulatorConstants::SimulationType::STATIONARY);
}

ScenarioConfig StationaryScenario::getConfig() const {
    ScenarioConfig cfg;

    cfg.PopulationSize = 50;
    cfg.CellSpeed = 0.0;
    cfg.InfectedCount = 5;
    cfg.ImmuneCount = 0;

    // Shorter illness so a still crowd resolves quickly
    cfg.world.RecoveryPeriod = 30;

    return cfg;
}
