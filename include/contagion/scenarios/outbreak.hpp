#ifndef CONTAGION_OUTBREAK_SCENARIO_HPP
#define CONTAGION_OUTBREAK_SCENARIO_HPP

#include "contagion/scenarios/i_scenario.hpp"

/**
 * @class OutbreakScenario
 *
 * A single infected cell released into a fully vulnerable population.
 */
class OutbreakScenario : public IScenario {
public:
    OutbreakScenario() = default;
    ~OutbreakScenario() override = default;

    std::string getName() const override;
    ScenarioConfig getConfig() const override;
};

#endif // CONTAGION_OUTBREAK_SCENARIO_HPP
