#ifndef COMPONENTS_HEALTH_HPP
#define COMPONENTS_HEALTH_HPP

#include <variant>

namespace Components {

    struct Vulnerable {};

    struct Infected {
        int ticksSinceInfection = 0;
    };

    // Terminal state
    struct Immune {};

    // Health only ever moves forward: Vulnerable -> Infected -> Immune
    using Health = std::variant<Vulnerable, Infected, Immune>;

} // namespace Components

#endif
