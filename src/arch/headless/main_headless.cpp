/**
 * @file main_headless.cpp
 * @brief Runs a scenario to completion without a window.
 *
 * Usage: contagion_headless [scenario] [seed] [maxTicks]
 *
 * Prints one CSV census line per tick on stdout. Set CONTAGION_PROFILE in
 * the environment to print timing statistics on stderr at the end.
 */

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <memory>
#include <random>
#include <string>

#include "contagion/core/arguments.hpp"
#include "contagion/core/constants.hpp"
#include "contagion/core/errors.hpp"
#include "contagion/core/profile.hpp"
#include "contagion/core/scenario_manager.hpp"

namespace {

void printUsage() {
    std::cerr << "Usage: contagion_headless [scenario] [seed] [maxTicks]\n"
              << "Scenarios:";
    for (auto s : SimulatorConstants::getAllScenarios()) {
        std::cerr << " " << SimulatorConstants::getScenarioName(s);
    }
    std::cerr << "\n";
}

void printCensus(const Model& model) {
    Census const counts = model.census();
    std::cout << model.time() << ',' << counts.vulnerable << ','
              << counts.infected << ',' << counts.immune << '\n';
}

} // namespace

int main(int argc, char** argv) {
    auto scenario = SimulatorConstants::SimulationType::OUTBREAK;
    uint32_t seed = std::random_device{}();
    unsigned long maxTicks = 100000;

    if (argc > 4) {
        printUsage();
        return 1;
    }
    if (argc > 1) {
        auto named = SimulatorConstants::scenarioFromName(argv[1]);
        if (!named) {
            std::cerr << "Unknown scenario \"" << argv[1] << "\"\n";
            printUsage();
            return 1;
        }
        scenario = *named;
    }
    if (argc > 2) {
        auto parsed = Arguments::parseSeed(argv[2]);
        if (!parsed) {
            std::cerr << "Invalid seed \"" << argv[2] << "\": expected an integer in [0, "
                      << std::numeric_limits<uint32_t>::max() << "]\n";
            printUsage();
            return 1;
        }
        seed = *parsed;
    }
    if (argc > 3) {
        auto parsed = Arguments::parseUnsigned(argv[3], std::numeric_limits<unsigned long>::max());
        if (!parsed) {
            std::cerr << "Invalid tick limit \"" << argv[3] << "\": expected a non-negative integer\n";
            printUsage();
            return 1;
        }
        maxTicks = static_cast<unsigned long>(*parsed);
    }

    ScenarioManager scenarioManager;
    scenarioManager.buildScenarioList();
    scenarioManager.setCurrentScenario(scenario);

    std::unique_ptr<Model> model;
    try {
        model = scenarioManager.createModel(seed);
    } catch (const InvalidConfiguration& e) {
        std::cerr << "Invalid scenario configuration: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Seed " << seed << "\n";
    std::cout << "time,vulnerable,infected,immune\n";
    printCensus(*model);

    {
        PROFILE_SCOPE("run");
        while (!model->isComplete() &&
               static_cast<unsigned long>(model->time()) < maxTicks) {
            model->tick();
            printCensus(*model);
        }
    }

    if (!model->isComplete()) {
        std::cerr << "Stopped after " << maxTicks << " ticks with infections remaining.\n";
    }
    if (std::getenv("CONTAGION_PROFILE") != nullptr) {
        Profiling::Profiler::printStats(std::cerr);
    }

    return 0;
}
