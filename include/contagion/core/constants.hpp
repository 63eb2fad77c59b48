#ifndef SIMULATOR_CONSTANTS_H
#define SIMULATOR_CONSTANTS_H

#include <optional>
#include <string>
#include <vector>

namespace SimulatorConstants {

    /**
     * @brief The preset simulation scenarios.
     */
    enum class SimulationType {
        OUTBREAK,
        HERD_IMMUNITY,
        STATIONARY
    };

    // Truly global constants
    extern const double Pi;

    // Legacy integer encoding of a cell's health, used for export.
    // Infected cells report Infected + ticks since infection.
    extern const int Vulnerable;
    extern const int Infected;
    extern const int Immune;

    // Default world
    extern const double DefaultMaxX;
    extern const double DefaultMaxY;
    extern const double DefaultCellRadius;
    extern const int DefaultRecoveryPeriod;
    extern const double DefaultCellSpeed;

    // Display constants
    extern const unsigned int ScreenLength;
    extern const unsigned int StepsPerSecond;

    std::vector<SimulationType> getAllScenarios();
    std::string getScenarioName(SimulationType scenario);

    /**
     * @brief Looks up a scenario by the name getScenarioName() gives it.
     * @return The scenario, or std::nullopt if no scenario has that name.
     */
    std::optional<SimulationType> scenarioFromName(const std::string& name);
}

#endif // SIMULATOR_CONSTANTS_H
