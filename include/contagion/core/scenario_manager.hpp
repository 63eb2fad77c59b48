/**
 * @fileoverview scenario_manager.hpp
 * @brief Manages scenario selection, maintains a list of available scenarios, and creates scenario objects.
 */

#ifndef SCENARIO_MANAGER_HPP
#define SCENARIO_MANAGER_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "contagion/core/constants.hpp"
#include "contagion/scenarios/i_scenario.hpp"

/**
 * @class ScenarioManager
 * @brief Catalog of available scenarios and a factory to create them.
 */
class ScenarioManager {
 public:
  /**
   * @brief Builds an internal list of all available scenarios.
   */
  void buildScenarioList();

  /**
   * @brief Returns the list of scenarios built by buildScenarioList().
   */
  const std::vector<std::pair<SimulatorConstants::SimulationType, std::string>>&
  getScenarioList() const;

  /**
   * @brief Sets the scenario that is considered current.
   */
  void setCurrentScenario(SimulatorConstants::SimulationType scenario);

  SimulatorConstants::SimulationType getCurrentScenario() const;

  /**
   * @brief Creates a new scenario object of the specified type.
   * @param scenarioType The chosen scenario type.
   * @return A unique_ptr to a newly constructed scenario.
   */
  std::unique_ptr<IScenario> createScenario(
      SimulatorConstants::SimulationType scenarioType) const;

  /**
   * @brief Seeds a Model for the current scenario.
   */
  std::unique_ptr<Model> createModel(uint32_t seed) const;

 private:
  std::vector<std::pair<SimulatorConstants::SimulationType, std::string>> scenarioList;
  SimulatorConstants::SimulationType currentScenario =
      SimulatorConstants::SimulationType::OUTBREAK;
};

#endif  // SCENARIO_MANAGER_HPP
