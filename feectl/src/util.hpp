#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <chrono>

namespace util {
    std::string current_iso8601();
    int64_t current_timestamp_ms();
    std::string trim(const std::string& str);

    // "1.2" and "0.05" are decimal WAD values; "1200000000000000000" and
    // "1.2e18" are raw integers. Throws std::invalid_argument.
    Wad parse_wad(const std::string& text);
    std::string wad_to_string(const Wad& value);
    std::string wad_to_decimal(const Wad& value);
}
