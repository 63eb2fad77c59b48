/**
 * @file cell.hpp
 * @brief A single simulated agent: position, velocity and health.
 */

#pragma once

#include <optional>
#include <string>

#include "contagion/components/health.hpp"
#include "contagion/core/constants.hpp"
#include "contagion/math/point.hpp"

/**
 * @class Cell
 * @brief An individual subject in the simulation.
 *
 * A cell moves ballistically by its direction each tick and carries a
 * health state that only advances forward (vulnerable, infected, immune).
 * Cells never interact directly; the Model decides which pairs are in
 * contact and calls contactWith() on them.
 */
class Cell {
public:
    /**
     * @brief Outcome of a contact between two cells
     */
    enum class ContactResult {
        None,           ///< Neither cell changed state
        SelfInfected,   ///< The receiving cell caught the disease
        OtherInfected   ///< The argument cell caught the disease
    };

    Point location;   ///< Current position in world space
    Point direction;  ///< Displacement applied every tick

    Cell(const Point& location, const Point& direction);

    /**
     * @brief Advances the cell by one tick.
     *
     * Moves by direction. An infected cell counts one more tick since
     * infection and becomes immune once that count exceeds recoveryPeriod.
     */
    void tick(int recoveryPeriod = SimulatorConstants::DefaultRecoveryPeriod);

    /**
     * @brief Display tag for the current health: "gray", "red" or "green".
     */
    std::string color() const;

    /**
     * @brief Infects the cell with a fresh infection.
     *
     * Only valid on a vulnerable cell (see contactWith()).
     */
    void contractDisease();

    /**
     * @brief Makes the cell immune. Used for immune-at-start seeding.
     */
    void immunize();

    bool isVulnerable() const;
    bool isInfected() const;
    bool isImmune() const;

    /**
     * @brief Applies the infection rule to a pair of cells in contact.
     *
     * An infected cell infects a vulnerable partner, whichever side of
     * the call either is on. At most one of the two cells changes.
     */
    ContactResult contactWith(Cell& other);

    /** @brief Ticks since infection, or std::nullopt if not infected */
    std::optional<int> ticksSinceInfection() const;

    /**
     * @brief Health in the legacy integer encoding (see SimulatorConstants).
     */
    int sickness() const;

    const Components::Health& health() const { return healthState; }

private:
    Components::Health healthState;
};
