#include "contagion/scenarios/herd_immunity.hpp"
#include "contagion/core/constants.hpp"

std::string HerdImmunityScenario::getName() const {
    return SimulatorConstants::getScenarioName(SimulatorConstants::SimulationType::HERD_IMMUNITY);
}

ScenarioConfig HerdImmunityScenario::getConfig() const {
    ScenarioConfig cfg;

    cfg.PopulationSize = 100;
    cfg.CellSpeed = SimulatorConstants::DefaultCellSpeed;
    cfg.InfectedCount = 1;
    cfg.ImmuneCount = 60;

    return cfg;
}
