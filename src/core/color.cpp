#include "contagion/components/color.hpp"

namespace Components {

Color colorFromTag(const std::string& tag) {
    if (tag == "gray") {
        return {128, 128, 128};
    }
    if (tag == "red") {
        return {220, 40, 40};
    }
    if (tag == "green") {
        return {40, 200, 80};
    }
    return {255, 255, 255};
}

} // namespace Components
