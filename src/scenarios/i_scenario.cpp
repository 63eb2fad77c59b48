#include "contagion/scenarios/i_scenario.hpp"

#include <iostream>

std::unique_ptr<Model> IScenario::createModel(uint32_t seed) const {
    const ScenarioConfig cfg = getConfig();

    std::cerr << "Creating " << getName() << " scenario...\n";
    auto model = std::make_unique<Model>(cfg.PopulationSize, cfg.CellSpeed,
                                         cfg.InfectedCount, cfg.ImmuneCount,
                                         cfg.world, seed);
    std::cerr << "...Created " << model->size() << " cells.\n";
    return model;
}
