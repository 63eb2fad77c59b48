#ifndef CONTAGION_I_SCENARIO_HPP
#define CONTAGION_I_SCENARIO_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "contagion/core/model.hpp"
#include "contagion/scenarios/scenario_config.hpp"

/**
 * @brief Abstract base class for any simulation scenario
 *
 * Each scenario must provide:
 *  - getName() for logs and the window title
 *  - getConfig() returning ScenarioConfig
 */
class IScenario {
public:
    virtual ~IScenario() = default;

    virtual std::string getName() const = 0;

    /**
     * @brief Returns scenario configuration (population, speed, seed counts, world)
     */
    virtual ScenarioConfig getConfig() const = 0;

    /**
     * @brief Builds a fresh Model from getConfig()
     * @param seed Seed for the Model's random draws
     * @throws InvalidConfiguration if the scenario's counts are inconsistent
     */
    virtual std::unique_ptr<Model> createModel(uint32_t seed) const;
};

#endif // CONTAGION_I_SCENARIO_HPP
