#include "contagion/core/constants.hpp"

namespace SimulatorConstants {

    const double Pi = 3.14159265358979323846;

    const int Vulnerable = 0;
    const int Infected   = 1;
    const int Immune     = -1;

    const double DefaultMaxX           = 200.0;
    const double DefaultMaxY           = 200.0;
    const double DefaultCellRadius     = 15.0;
    const int    DefaultRecoveryPeriod = 90;
    const double DefaultCellSpeed      = 5.0;

    // Display
    const unsigned int ScreenLength   = 600;
    const unsigned int StepsPerSecond = 30;

    std::vector<SimulationType> getAllScenarios() {
        return {
            SimulationType::OUTBREAK,
            SimulationType::HERD_IMMUNITY,
            SimulationType::STATIONARY
        };
    }

    std::string getScenarioName(SimulationType scenario) {
        switch (scenario) {
            case SimulationType::OUTBREAK:      return "OUTBREAK";
            case SimulationType::HERD_IMMUNITY: return "HERD_IMMUNITY";
            case SimulationType::STATIONARY:    return "STATIONARY";
            default: return "UNKNOWN";
        }
    }

    std::optional<SimulationType> scenarioFromName(const std::string& name) {
        for (auto s : getAllScenarios()) {
            if (getScenarioName(s) == name) {
                return s;
            }
        }
        return std::nullopt;
    }

} // namespace SimulatorConstants
