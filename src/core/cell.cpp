#include "contagion/core/cell.hpp"

#include <variant>

Cell::Cell(const Point& location, const Point& direction)
    : location(location)
    , direction(direction)
    , healthState(Components::Vulnerable{})
{
}

void Cell::tick(int recoveryPeriod) {
    location = location.add(direction);

    if (auto* infected = std::get_if<Components::Infected>(&healthState)) {
        infected->ticksSinceInfection += 1;
        if (infected->ticksSinceInfection > recoveryPeriod) {
            immunize();
        }
    }
}

std::string Cell::color() const {
    if (isInfected()) {
        return "red";
    }
    if (isImmune()) {
        return "green";
    }
    return "gray";
}

void Cell::contractDisease() {
    healthState = Components::Infected{0};
}

void Cell::immunize() {
    healthState = Components::Immune{};
}

bool Cell::isVulnerable() const {
    return std::holds_alternative<Components::Vulnerable>(healthState);
}

bool Cell::isInfected() const {
    return std::holds_alternative<Components::Infected>(healthState);
}

bool Cell::isImmune() const {
    return std::holds_alternative<Components::Immune>(healthState);
}

Cell::ContactResult Cell::contactWith(Cell& other) {
    if (isInfected() && other.isVulnerable()) {
        other.contractDisease();
        return ContactResult::OtherInfected;
    }
    if (other.isInfected() && isVulnerable()) {
        contractDisease();
        return ContactResult::SelfInfected;
    }
    return ContactResult::None;
}

std::optional<int> Cell::ticksSinceInfection() const {
    if (const auto* infected = std::get_if<Components::Infected>(&healthState)) {
        return infected->ticksSinceInfection;
    }
    return std::nullopt;
}

int Cell::sickness() const {
    if (const auto* infected = std::get_if<Components::Infected>(&healthState)) {
        return SimulatorConstants::Infected + infected->ticksSinceInfection;
    }
    if (isImmune()) {
        return SimulatorConstants::Immune;
    }
    return SimulatorConstants::Vulnerable;
}
