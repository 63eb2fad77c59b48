/**
 * @fileoverview model.cpp
 * @brief Implementation of Model.
 */

#include "contagion/core/model.hpp"

#include <cmath>
#include <sstream>

#include "contagion/core/constants.hpp"
#include "contagion/core/debug.hpp"
#include "contagion/core/errors.hpp"
#include "contagion/core/profile.hpp"
#include "contagion/systems/boundary.hpp"
#include "contagion/systems/contact.hpp"
#include "contagion/systems/movement.hpp"

Model::Model(int populationSize, double speed, int infectedCount, int immuneCount,
             const WorldConfig& config, uint32_t seed)
    : worldConfig(config)
    , generator(seed)
{
    validate(populationSize, speed, infectedCount, immuneCount, worldConfig);
    createSystems();
    createCells(populationSize, speed, infectedCount, immuneCount);
}

void Model::validate(int populationSize, double speed, int infectedCount,
                     int immuneCount, const WorldConfig& config) {
    if (infectedCount <= 0 || infectedCount >= populationSize) {
        std::ostringstream msg;
        msg << "Some, but not all, cells must begin infected: got " << infectedCount
            << " infected of " << populationSize << " cells.";
        throw InvalidConfiguration(msg.str());
    }
    if (immuneCount < 0 || immuneCount >= populationSize) {
        std::ostringstream msg;
        msg << "Immune cell count must be in [0, " << populationSize
            << "): got " << immuneCount << ".";
        throw InvalidConfiguration(msg.str());
    }
    // infectedCount is in (0, populationSize) here, so the difference cannot overflow
    if (immuneCount >= populationSize - infectedCount) {
        std::ostringstream msg;
        msg << "At least one cell must begin vulnerable: " << infectedCount
            << " infected + " << immuneCount << " immune >= " << populationSize << " cells.";
        throw InvalidConfiguration(msg.str());
    }

    if (!std::isfinite(speed)) {
        throw InvalidConfiguration("Cell speed must be finite.");
    }
    if (!(config.MinX < config.MaxX) || !(config.MinY < config.MaxY)) {
        throw InvalidConfiguration("World bounds must have MinX < MaxX and MinY < MaxY.");
    }
    if (!(config.CellRadius > 0.0)) {
        throw InvalidConfiguration("Cell radius must be positive.");
    }
    if (config.RecoveryPeriod < 0) {
        throw InvalidConfiguration("Recovery period must not be negative.");
    }
}

void Model::createSystems() {
    systems.clear();

    // Movement must finish for every cell before bounds are enforced
    systems.push_back(std::make_unique<Systems::MovementSystem>());
    systems.push_back(std::make_unique<Systems::BoundarySystem>());
    contactSystem = std::make_unique<Systems::ContactSystem>();

    for (auto& system : systems) {
        system->setWorldConfig(worldConfig);
    }
    contactSystem->setWorldConfig(worldConfig);
}

void Model::createCells(int populationSize, double speed, int infectedCount, int immuneCount) {
    cells.reserve(static_cast<std::size_t>(populationSize));

    for (int i = 0; i < populationSize; ++i) {
        Point const location = randomLocation();
        Point const direction = randomDirection(speed);

        auto entity = registry.create();
        auto& cell = registry.emplace<Cell>(entity, location, direction);
        if (i < infectedCount) {
            cell.contractDisease();
        } else if (i < infectedCount + immuneCount) {
            cell.immunize();
        }
        cells.push_back(entity);
    }

    CONTAGION_DEBUG_MSG(CONTAGION_DEBUG_LEVEL_VERBOSE,
        "Seeded " << populationSize << " cells (" << infectedCount << " infected, "
        << immuneCount << " immune)\n");
}

Point Model::randomLocation() {
    std::uniform_real_distribution<double> xDist(worldConfig.MinX, worldConfig.MaxX);
    std::uniform_real_distribution<double> yDist(worldConfig.MinY, worldConfig.MaxY);
    double const x = xDist(generator);
    double const y = yDist(generator);
    return Point(x, y);
}

Point Model::randomDirection(double speed) {
    std::uniform_real_distribution<double> angleDist(0.0, 2.0 * SimulatorConstants::Pi);
    double const angle = angleDist(generator);
    return Point(std::cos(angle) * speed, std::sin(angle) * speed);
}

void Model::tick() {
    PROFILE_SCOPE("Model::tick");
    EpidemicStats::reset();

    currentTime += 1;
    for (auto& system : systems) {
        system->update(registry, cells);
    }
    checkContacts();

    EpidemicStats::printTickStats(currentTime);
}

void Model::enforceBounds(Cell& cell) const {
    Systems::BoundarySystem::enforceBounds(cell, worldConfig);
}

void Model::checkContacts() {
    contactSystem->update(registry, cells);
}

bool Model::isComplete() const {
    for (auto entity : cells) {
        if (registry.get<Cell>(entity).isInfected()) {
            return false;
        }
    }
    return true;
}

std::vector<std::reference_wrapper<const Cell>> Model::population() const {
    std::vector<std::reference_wrapper<const Cell>> view;
    view.reserve(cells.size());
    for (auto entity : cells) {
        view.emplace_back(registry.get<Cell>(entity));
    }
    return view;
}

const Cell& Model::cell(std::size_t index) const {
    return registry.get<Cell>(cells.at(index));
}

Cell& Model::cell(std::size_t index) {
    return registry.get<Cell>(cells.at(index));
}

Census Model::census() const {
    Census counts;
    for (auto entity : cells) {
        const auto& c = registry.get<Cell>(entity);
        if (c.isInfected()) {
            counts.infected++;
        } else if (c.isImmune()) {
            counts.immune++;
        } else {
            counts.vulnerable++;
        }
    }
    return counts;
}
