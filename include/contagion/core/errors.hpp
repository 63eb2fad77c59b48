#pragma once

#include <stdexcept>

/**
 * @brief Raised when a Model is constructed with seed counts or world
 *        parameters it cannot honour.
 */
class InvalidConfiguration : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};
