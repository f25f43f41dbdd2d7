#pragma once

#include "types.hpp"

struct BoundsCheck {
    bool is_upper;
    bool in_band;
};

// How the streak cap and the adjustment-rate cap are blended. The allowance
// is the smallest move an out-of-band observation makes, and is also added
// to the rate cap so a fee near zero can still leave it.
struct DeltaCapPolicy {
    uint32_t fee_delta_allowance = 1;
};

struct FeeDecision {
    uint32_t new_fee;
    OobState oob;
};

// Stateless fee arithmetic. Identical inputs always give identical outputs.
class FeeMath {
public:
    // Saturates to the nearer bound, never throws
    static uint32_t clamp_fee(const Wad& fee, uint32_t min_fee, uint32_t max_fee);

    // Tolerance band around target is inclusive on both ends
    static BoundsCheck within_bounds(const Wad& target, const Wad& tolerance,
                                     const Wad& current);

    // Single EMA step with alpha = 2 / (lookback_days + 1), capped at 1.0
    static Wad ema(const Wad& current, const Wad& previous, uint32_t lookback_days);

    static FeeDecision compute_new_fee(uint32_t current_fee,
                                       const Wad& current_ratio,
                                       const Wad& target_ratio,
                                       const Wad& max_adj_rate,
                                       const PoolParams& params,
                                       const OobState& oob_in,
                                       const DeltaCapPolicy& policy = DeltaCapPolicy());

private:
    static Wad deviation_from_band(const Wad& target, const Wad& tolerance,
                                   const Wad& current, bool is_upper);
};
