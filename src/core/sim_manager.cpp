/**
 * @file sim_manager.cpp
 * @brief Implementation of SimManager, which orchestrates the model, window and scenarios.
 */

#include <iostream>

#include <SFML/Window/Event.hpp>

#include "contagion/core/constants.hpp"
#include "contagion/core/profile.hpp"
#include "contagion/core/sim_manager.hpp"

SimManager::SimManager(uint32_t seed)
    : renderer(SimulatorConstants::ScreenLength, SimulatorConstants::ScreenLength)
    , scenarioManager()
    , model()
    , seed(seed)
    , running(true)
    , paused(false)
    , stepFrame(false)
{
}

bool SimManager::init()
{
    if (!renderer.init())
    {
        std::cerr << "Renderer initialization failed." << std::endl;
        return false;
    }

    scenarioManager.buildScenarioList();
    scenarioManager.setCurrentScenario(SimulatorConstants::SimulationType::OUTBREAK);
    model = scenarioManager.createModel(seed);

    return true;
}

void SimManager::run()
{
    while (running && renderer.getWindow().isOpen())
    {
        if (!handleEvents())
        {
            break;
        }
        tick();
        render();
    }
    renderer.getWindow().close();
}

bool SimManager::handleEvents()
{
    sf::RenderWindow& window = renderer.getWindow();

    sf::Event event;
    while (window.pollEvent(event))
    {
        if (event.type == sf::Event::Closed)
        {
            running = false;
        }
        else if (event.type == sf::Event::KeyPressed)
        {
            switch (event.key.code)
            {
                case sf::Keyboard::Escape:
                    running = false;
                    break;
                case sf::Keyboard::P:
                    togglePause();
                    break;
                case sf::Keyboard::Space: // Advance one tick if paused
                    if (paused)
                    {
                        stepFrame = true;
                    }
                    break;
                case sf::Keyboard::R:
                    resetSimulator();
                    break;
                case sf::Keyboard::Num1:
                    selectScenario(SimulatorConstants::SimulationType::OUTBREAK);
                    break;
                case sf::Keyboard::Num2:
                    selectScenario(SimulatorConstants::SimulationType::HERD_IMMUNITY);
                    break;
                case sf::Keyboard::Num3:
                    selectScenario(SimulatorConstants::SimulationType::STATIONARY);
                    break;
                default:
                    break;
            }
        }
    }

    return running;
}

void SimManager::tick()
{
    if (model->isComplete())
    {
        return;
    }
    if (!paused || stepFrame)
    {
        model->tick();
        stepFrame = false;
        if (model->isComplete())
        {
            Census const counts = model->census();
            std::cerr << "Outbreak over at t=" << model->time() << ": "
                      << counts.immune << " immune, " << counts.vulnerable
                      << " never infected.\n";
        }
    }
}

void SimManager::render()
{
    renderer.clear();
    renderer.renderCells(*model);
    renderer.renderStatus(*model,
                          SimulatorConstants::getScenarioName(scenarioManager.getCurrentScenario()),
                          paused);
    renderer.present();
}

void SimManager::togglePause()
{
    paused = !paused;
}

void SimManager::resetSimulator()
{
    seed += 1;
    model = scenarioManager.createModel(seed);
    paused = false;
}

void SimManager::selectScenario(SimulatorConstants::SimulationType scenario)
{
    scenarioManager.setCurrentScenario(scenario);
    model = scenarioManager.createModel(seed);
    paused = false;
}
