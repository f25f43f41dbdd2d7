#pragma once

#include "types.hpp"
#include <map>
#include <string>
#include <nlohmann/json.hpp>

// Global sanity ranges a parameter set must satisfy before it is accepted
struct SanityBounds {
    uint64_t min_period_floor = 60;          // 1 minute
    uint64_t min_period_ceil = 30 * 86400;   // 30 days
    uint32_t max_lookback_days = 365;
    Wad min_ratio_tolerance = Wad(1000000000000000ULL);   // 0.1%
    Wad max_ratio_tolerance = WAD;                        // 100%
    Wad min_linear_slope = Wad(100000000000000000ULL);    // 0.1
    Wad max_linear_slope = WAD * 100;
    Wad min_side_factor = Wad(100000000000000000ULL);     // 0.1
    Wad max_side_factor = WAD * 10;
    Wad max_current_ratio_ceil = WAD * 1000000;
    Wad max_adjustment_rate = WAD * 10;
};

// Hard ceilings for the overridable upper bounds. With every parameter and
// ratio at or below these, no product in the fee math reaches 2^256.
inline const Wad BOUNDS_RATIO_CEIL_LIMIT = WAD * 1000000000000ULL;   // 1e12
inline const Wad BOUNDS_TOLERANCE_LIMIT = WAD * 100;
inline const Wad BOUNDS_FACTOR_LIMIT = WAD * 1000000;                // slope, side factor, rate

class ParamValidator {
public:
    // Lower limits not above upper limits, upper limits within the hard ceilings
    static void validate_bounds(const SanityBounds& bounds);

    // Throw InvalidParameter naming the offending field
    static void validate_params(const PoolParams& params, const SanityBounds& bounds);
    static void validate_adjustment_rate(const Wad& rate, const SanityBounds& bounds);
};

// Everything an operator configures: bounds, per-category params, global rate
struct FeeSettings {
    SanityBounds bounds;
    std::map<PoolCategory, PoolParams> categories;
    Wad max_adjustment_rate = WAD;

    static FeeSettings defaults();
    static FeeSettings from_json(const nlohmann::json& doc);
    static FeeSettings load_file(const std::string& path);
    void validate() const;
};

void to_json(nlohmann::json& j, const PoolParams& params);
void from_json(const nlohmann::json& j, PoolParams& params);
void to_json(nlohmann::json& j, const SanityBounds& bounds);
void from_json(const nlohmann::json& j, SanityBounds& bounds);

// Accepts a string (see util::parse_wad) or an unsigned JSON integer
Wad wad_from_json(const nlohmann::json& j, const std::string& field);
uint64_t uint_from_json(const nlohmann::json& j, const std::string& field, uint64_t max_value);
