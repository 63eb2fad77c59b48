#ifndef CONTAGION_STATIONARY_SCENARIO_HPP
#define CONTAGION_STATIONARY_SCENARIO_HPP

#include "contagion/scenarios/i_scenario.hpp"

// Nobody moves: infection only reaches cells seeded within range of a carrier.
class StationaryScenario : public IScenario {
public:
    StationaryScenario() = default;
    ~StationaryScenario() override = default;

    std::string getName() const override;
    ScenarioConfig getConfig() const override;
};

#endif // CONTAGION_STATIONARY_SCENARIO_HPP
