#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace Arguments {

    /**
     * @brief Parses a decimal command-line value no larger than maxValue.
     *
     * Only plain digits are accepted: a sign, whitespace, a trailing suffix or
     * a value above maxValue yields std::nullopt instead of wrapping.
     */
    std::optional<uint64_t> parseUnsigned(const std::string& text, uint64_t maxValue);

    // A random seed, which must fit in 32 bits
    std::optional<uint32_t> parseSeed(const std::string& text);

}
