/**
 * @file coordinates.cpp
 * @brief Implementation of coordinate conversion utilities
 */

#include "contagion/core/coordinates.hpp"

#include <algorithm>

namespace Simulation {

Coordinates::Coordinates(const WorldConfig& config, unsigned int screenSize)
    : world(config)
    , screenSize(screenSize)
    , pixelsPerUnit(static_cast<double>(screenSize) /
                    std::max(config.boundsWidth(), config.boundsHeight()))
{
}

double Coordinates::worldToScreenX(double x) const {
    return (x - world.MinX) * pixelsPerUnit;
}

double Coordinates::worldToScreenY(double y) const {
    return (world.MaxY - y) * pixelsPerUnit;
}

double Coordinates::worldToPixels(double length) const {
    return length * pixelsPerUnit;
}

} // namespace Simulation
