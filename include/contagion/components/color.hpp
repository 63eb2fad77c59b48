#ifndef COMPONENTS_COLOR_HPP
#define COMPONENTS_COLOR_HPP

#include <cstdint>
#include <string>

namespace Components {

    struct Color {
        uint8_t r, g, b;
        Color(uint8_t r = 255, uint8_t g = 255, uint8_t b = 255)
            : r(r), g(g), b(b) {}

        bool operator==(const Color& other) const {
            return r == other.r && g == other.g && b == other.b;
        }
    };

    /**
     * @brief Maps a cell display tag ("gray", "red", "green") to RGB.
     *
     * Unknown tags map to white.
     */
    Color colorFromTag(const std::string& tag);

} // namespace Components

#endif
