/**
 * @fileoverview sim_manager.hpp
 * @brief High-level controller for the interactive viewer.
 */

#pragma once

#include <cstdint>
#include <memory>

#include "contagion/arch/native/renderer_native.hpp"
#include "contagion/core/model.hpp"
#include "contagion/core/scenario_manager.hpp"

/**
 * @class SimManager
 * @brief Owns the window, the current Model and scenario selection, and runs the main loop.
 */
class SimManager {
 public:
  explicit SimManager(uint32_t seed);

  /**
   * @brief Opens the window and seeds the initial scenario.
   * @return true on success, false otherwise.
   */
  bool init();

  /**
   * @brief Runs until the window is closed.
   */
  void run();

  /**
   * @brief Processes window events for the current frame.
   * @return false if the application should quit, true otherwise.
   */
  bool handleEvents();

  /**
   * @brief Steps the model unless paused or already complete.
   */
  void tick();

  void render();

  void togglePause();

  /**
   * @brief Re-seeds the current scenario with the next seed.
   */
  void resetSimulator();

  /**
   * @brief Handles user selection of a new scenario.
   * @param scenario The chosen scenario type.
   */
  void selectScenario(SimulatorConstants::SimulationType scenario);

 private:
  Renderer renderer;
  ScenarioManager scenarioManager;
  std::unique_ptr<Model> model;

  uint32_t seed;
  bool running;
  bool paused;
  bool stepFrame;
};
