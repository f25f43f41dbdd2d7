#pragma once

#include <cstdint>
#include <string>
#include <boost/multiprecision/cpp_int.hpp>

// 18-decimal fixed point, 1.0 == 1e18. Checked: overflow and negative
// results throw instead of wrapping.
using Wad = boost::multiprecision::checked_uint256_t;

inline const Wad WAD = Wad(1000000000000000000ULL);

// Fee units are parts-per-million of swap notional
constexpr uint32_t MAX_FEE = 1000000;

enum class PoolCategory {
    Stable,
    Standard,
    Volatile
};

std::string category_name(PoolCategory category);
PoolCategory parse_category(const std::string& name);

// Tunable parameter set, one per pool category
struct PoolParams {
    uint32_t min_fee = 0;
    uint32_t max_fee = 0;
    uint32_t base_max_fee_delta = 0;
    uint32_t lookback_period = 0;   // days
    uint64_t min_period = 0;        // seconds between committed updates
    Wad ratio_tolerance = 0;
    Wad linear_slope = 0;
    Wad max_current_ratio = 0;
    Wad lower_side_factor = 0;
    Wad upper_side_factor = 0;
};

bool operator==(const PoolParams& a, const PoolParams& b);

struct OobState {
    bool last_side_was_upper = false;
    uint32_t consecutive_hits = 0;
};

bool operator==(const OobState& a, const OobState& b);

struct PoolFeeState {
    uint32_t current_fee = 0;
    Wad current_target_ratio = 0;
    OobState oob;
    uint64_t last_update_ts = 0;    // seconds
    bool is_active = false;
};

// Result of one update computation; also what a commit reports back
struct FeeUpdate {
    uint32_t new_fee = 0;
    uint32_t old_fee = 0;
    Wad old_target = 0;
    Wad new_target = 0;
    OobState new_oob;
};
