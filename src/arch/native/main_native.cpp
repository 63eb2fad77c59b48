/**
 * @file main_native.cpp
 * @brief Main entry point for the interactive viewer.
 *
 * Usage: contagion [seed]
 */

#include <cstdint>
#include <iostream>
#include <limits>
#include <random>
#include <string>

#include "contagion/core/arguments.hpp"
#include "contagion/core/errors.hpp"
#include "contagion/core/sim_manager.hpp"

int main(int argc, char** argv) {
    uint32_t seed = std::random_device{}();
    if (argc > 1) {
        auto parsed = Arguments::parseSeed(argv[1]);
        if (!parsed) {
            std::cerr << "Invalid seed \"" << argv[1] << "\": expected an integer in [0, "
                      << std::numeric_limits<uint32_t>::max() << "]\n";
            return 1;
        }
        seed = *parsed;
    }

    try {
        SimManager simManager(seed);
        if (!simManager.init()) {
            return 1;
        }
        simManager.run();
    } catch (const InvalidConfiguration& e) {
        std::cerr << "Invalid scenario configuration: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
