/**
 * @file coordinates.hpp
 * @brief Conversion between world space and screen pixels
 *
 * The world is the rectangle [MinX, MaxX] x [MinY, MaxY] with y pointing
 * up. The screen is a square of screenSize pixels with y pointing down.
 * The larger world side is fitted to the screen.
 */
#pragma once

#include "contagion/core/constants.hpp"
#include "contagion/core/world_config.hpp"

namespace Simulation {

/**
 * @class Coordinates
 * @brief Maps world positions and lengths to pixels
 */
class Coordinates {
public:
    /**
     * @brief Construct a new Coordinates converter
     *
     * @param config World whose bounds fill the screen
     * @param screenSize Screen size in pixels (default: from SimulatorConstants)
     */
    explicit Coordinates(const WorldConfig& config,
                         unsigned int screenSize = SimulatorConstants::ScreenLength);

    /** @brief World x to pixel column */
    double worldToScreenX(double x) const;

    /** @brief World y to pixel row (flipped) */
    double worldToScreenY(double y) const;

    /** @brief World length to pixels */
    double worldToPixels(double length) const;

    double getPixelsPerUnit() const { return pixelsPerUnit; }

private:
    WorldConfig world;
    unsigned int screenSize;
    double pixelsPerUnit;
};

} // namespace Simulation
