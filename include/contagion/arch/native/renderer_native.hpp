/**
 * @file renderer_native.hpp
 * @brief Cell rendering using SFML
 *
 * Draws every cell as a filled circle coloured by its health tag, and
 * reports the tick count and census in the window title.
 */

#pragma once

#include <string>

#include <SFML/Graphics.hpp>

#include "contagion/core/coordinates.hpp"
#include "contagion/core/model.hpp"

/**
 * @class Renderer
 * @brief Owns the SFML window and draws a Model into it
 */
class Renderer {
public:
    /**
     * @brief Constructs renderer with given screen dimensions
     * @param screenWidth Width of the window
     * @param screenHeight Height of the window
     */
    Renderer(int screenWidth, int screenHeight);
    ~Renderer();

    /**
     * @brief Creates the SFML window
     * @return true if the window is open
     */
    bool init();

    /** Clears the screen to black */
    void clear();

    /** Presents the rendered frame to display */
    void present();

    /**
     * @brief Draws every cell of the model
     */
    void renderCells(const Model& model);

    /**
     * @brief Shows scenario, tick, census and run state in the title bar
     */
    void renderStatus(const Model& model, const std::string& scenarioName, bool paused);

    sf::RenderWindow& getWindow() { return window; }

private:
    sf::RenderWindow window;
    int screenWidth;
    int screenHeight;
};
