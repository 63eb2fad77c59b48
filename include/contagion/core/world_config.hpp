#pragma once

#include "contagion/core/constants.hpp"

/**
 * @struct WorldConfig
 * @brief Immutable world parameters handed to the Model and every system.
 *
 * Defaults describe a 400x400 world centred on the origin.
 */
struct WorldConfig {
    double MinX = -SimulatorConstants::DefaultMaxX;
    double MaxX = SimulatorConstants::DefaultMaxX;
    double MinY = -SimulatorConstants::DefaultMaxY;
    double MaxY = SimulatorConstants::DefaultMaxY;

    // Two cells closer than this are in contact
    double CellRadius = SimulatorConstants::DefaultCellRadius;

    // Ticks an infected cell stays infected before the recovery check passes
    int RecoveryPeriod = SimulatorConstants::DefaultRecoveryPeriod;

    double boundsWidth() const { return MaxX - MinX; }
    double boundsHeight() const { return MaxY - MinY; }
};
