/**
 * @fileoverview scenario_manager.cpp
 * @brief Implementation of ScenarioManager.
 */

#include "contagion/core/scenario_manager.hpp"
#include "contagion/scenarios/herd_immunity.hpp"
#include "contagion/scenarios/outbreak.hpp"
#include "contagion/scenarios/stationary.hpp"

void ScenarioManager::buildScenarioList() {
  scenarioList.clear();
  for (auto s : SimulatorConstants::getAllScenarios()) {
    scenarioList.emplace_back(s, SimulatorConstants::getScenarioName(s));
  }
}

const std::vector<std::pair<SimulatorConstants::SimulationType, std::string>>&
ScenarioManager::getScenarioList() const {
  return scenarioList;
}

void ScenarioManager::setCurrentScenario(SimulatorConstants::SimulationType scenario) {
  currentScenario = scenario;
}

SimulatorConstants::SimulationType ScenarioManager::getCurrentScenario() const {
  return currentScenario;
}

std::unique_ptr<IScenario> ScenarioManager::createScenario(
    SimulatorConstants::SimulationType scenarioType) const {
  switch (scenarioType) {
    case SimulatorConstants::SimulationType::HERD_IMMUNITY:
      return std::make_unique<HerdImmunityScenario>();

    case SimulatorConstants::SimulationType::STATIONARY:
      return std::make_unique<StationaryScenario>();

    case SimulatorConstants::SimulationType::OUTBREAK:
    default:
      return std::make_unique<OutbreakScenario>();
  }
}

std::unique_ptr<Model> ScenarioManager::createModel(uint32_t seed) const {
  return createScenario(currentScenario)->createModel(seed);
}
