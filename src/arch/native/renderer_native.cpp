#include "contagion/arch/native/renderer_native.hpp"
#include "contagion/components/color.hpp"
#include "contagion/core/constants.hpp"
#include "contagion/core/profile.hpp"

#include <iostream>
#include <sstream>

Renderer::Renderer(int screenWidth, int screenHeight)
    : screenWidth(screenWidth)
    , screenHeight(screenHeight)
{
}

Renderer::~Renderer() = default;

bool Renderer::init() {
    window.create(sf::VideoMode(screenWidth, screenHeight), "Contagion");
    if (!window.isOpen()) {
        std::cerr << "Failed to open a " << screenWidth << "x" << screenHeight << " window\n";
        return false;
    }
    window.setFramerateLimit(SimulatorConstants::StepsPerSecond);
    return true;
}

void Renderer::clear() {
    window.clear(sf::Color::Black);
}

void Renderer::present() {
    window.display();
}

void Renderer::renderCells(const Model& model) {
    PROFILE_SCOPE("Renderer::renderCells");

    Simulation::Coordinates const coords(model.config(), SimulatorConstants::ScreenLength);

    // Contact happens when two of these circles overlap
    auto const radiusPixels = static_cast<float>(coords.worldToPixels(model.config().CellRadius * 0.5));

    sf::CircleShape circle(radiusPixels);
    circle.setOrigin(radiusPixels, radiusPixels);

    const auto& registry = model.getRegistry();
    auto view = registry.view<const Cell>();
    for (auto entity : view) {
        const auto& cell = view.get<const Cell>(entity);

        auto const px = static_cast<float>(coords.worldToScreenX(cell.location.x));
        auto const py = static_cast<float>(coords.worldToScreenY(cell.location.y));

        Components::Color const col = Components::colorFromTag(cell.color());
        circle.setFillColor(sf::Color(col.r, col.g, col.b));
        circle.setPosition(px, py);
        window.draw(circle);
    }
}

void Renderer::renderStatus(const Model& model, const std::string& scenarioName, bool paused) {
    Census const counts = model.census();

    std::ostringstream ss;
    ss << "Contagion - " << scenarioName
       << " | t=" << model.time()
       << " | vulnerable " << counts.vulnerable
       << " infected " << counts.infected
       << " immune " << counts.immune;
    if (model.isComplete()) {
        ss << " | complete";
    } else if (paused) {
        ss << " | paused";
    }
    window.setTitle(ss.str());
}
