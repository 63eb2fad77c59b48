#include "contagion/core/arguments.hpp"

#include <limits>

namespace Arguments {

    std::optional<uint64_t> parseUnsigned(const std::string& text, uint64_t maxValue) {
        if (text.empty()) {
            return std::nullopt;
        }

        uint64_t value = 0;
        for (char ch : text) {
            if (ch < '0' || ch > '9') {
                return std::nullopt;
            }
            auto const digit = static_cast<uint64_t>(ch - '0');
            if (digit > maxValue || value > (maxValue - digit) / 10) {
                return std::nullopt;
            }
            value = value * 10 + digit;
        }
        return value;
    }

    std::optional<uint32_t> parseSeed(const std::string& text) {
        auto value = parseUnsigned(text, std::numeric_limits<uint32_t>::max());
        if (!value) {
            return std::nullopt;
        }
        return static_cast<uint32_t>(*value);
    }

}
