#include "types.hpp"
#include "errors.hpp"

std::string category_name(PoolCategory category) {
    switch (category) {
        case PoolCategory::Stable: return "stable";
        case PoolCategory::Standard: return "standard";
        case PoolCategory::Volatile: return "volatile";
        default: return "unknown";
    }
}

PoolCategory parse_category(const std::string& name) {
    if (name == "stable") return PoolCategory::Stable;
    if (name == "standard") return PoolCategory::Standard;
    if (name == "volatile") return PoolCategory::Volatile;
    throw InvalidParameter("unknown pool category '" + name + "'");
}

bool operator==(const PoolParams& a, const PoolParams& b) {
    return a.min_fee == b.min_fee &&
           a.max_fee == b.max_fee &&
           a.base_max_fee_delta == b.base_max_fee_delta &&
           a.lookback_period == b.lookback_period &&
           a.min_period == b.min_period &&
           a.ratio_tolerance == b.ratio_tolerance &&
           a.linear_slope == b.linear_slope &&
           a.max_current_ratio == b.max_current_ratio &&
           a.lower_side_factor == b.lower_side_factor &&
           a.upper_side_factor == b.upper_side_factor;
}

bool operator==(const OobState& a, const OobState& b) {
    return a.last_side_was_upper == b.last_side_was_upper &&
           a.consecutive_hits == b.consecutive_hits;
}
