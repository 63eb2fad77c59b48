#include "contagion/scenarios/outbreak.hpp"
#include "contagion/core/constants.hpp"

std::string OutbreakScenario::getName() const {
    return SimulatorConstants::getScenarioName(SimulatorConstants::SimulationType::OUTBREAK);
}

ScenarioConfig OutbreakScenario::getConfig() const {
    ScenarioConfig cfg;

    cfg.PopulationSize = 100;
    cfg.CellSpeed = SimulatorConstants::DefaultCellSpeed;
    cfg.InfectedCount = 1;
    cfg.ImmuneCount = 0;

    return cfg;
}
