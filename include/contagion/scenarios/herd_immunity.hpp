#ifndef CONTAGION_HERD_IMMUNITY_SCENARIO_HPP
#define CONTAGION_HERD_IMMUNITY_SCENARIO_HPP

#include "contagion/scenarios/i_scenario.hpp"

/**
 * @class HerdImmunityScenario
 *
 * Same crowd as the outbreak, but most cells start immune and shield the
 * vulnerable minority.
 */
class HerdImmunityScenario : public IScenario {
public:
    HerdImmunityScenario() = default;
    ~HerdImmunityScenario() override = default;

    std::string getName() const override;
    ScenarioConfig getConfig() const override;
};

#endif // CONTAGION_HERD_IMMUNITY_SCENARIO_HPP
