#include "fee_math.hpp"
#include <algorithm>
#include <limits>

uint32_t FeeMath::clamp_fee(const Wad& fee, uint32_t min_fee, uint32_t max_fee) {
    if (fee > max_fee) return max_fee;
    if (fee < min_fee) return min_fee;
    return fee.convert_to<uint32_t>();
}

BoundsCheck FeeMath::within_bounds(const Wad& target, const Wad& tolerance,
                                   const Wad& current) {
    if (target == 0) {
        return BoundsCheck{current > 0, current == 0};
    }

    Wad delta = target * tolerance / WAD;
    Wad lower_bound = delta >= target ? Wad(0) : Wad(target - delta);
    Wad upper_bound = target + delta;

    BoundsCheck result;
    result.in_band = current >= lower_bound && current <= upper_bound;
    result.is_upper = current > upper_bound;
    return result;
}

Wad FeeMath::ema(const Wad& current, const Wad& previous, uint32_t lookback_days) {
    Wad alpha = (WAD * 2) / (Wad(lookback_days) + 1);
    if (alpha > WAD) alpha = WAD;

    if (current >= previous) {
        Wad step = (current - previous) * alpha / WAD;
        return previous + step;
    }
    Wad step = (previous - current) * alpha / WAD;
    return previous - step;
}

Wad FeeMath::deviation_from_band(const Wad& target, const Wad& tolerance,
                                 const Wad& current, bool is_upper) {
    Wad delta = target * tolerance / WAD;
    if (is_upper) {
        return current - (target + delta);
    }
    Wad lower_bound = delta >= target ? Wad(0) : Wad(target - delta);
    return lower_bound - current;
}

FeeDecision FeeMath::compute_new_fee(uint32_t current_fee,
                                     const Wad& current_ratio,
                                     const Wad& target_ratio,
                                     const Wad& max_adj_rate,
                                     const PoolParams& params,
                                     const OobState& oob_in,
                                     const DeltaCapPolicy& policy) {
    FeeDecision decision;
    decision.oob = oob_in;

    if (target_ratio == 0) {
        decision.oob.consecutive_hits = 0;
        decision.new_fee = clamp_fee(current_fee, params.min_fee, params.max_fee);
        return decision;
    }

    BoundsCheck bounds = within_bounds(target_ratio, params.ratio_tolerance, current_ratio);
    if (bounds.in_band) {
        decision.oob.consecutive_hits = 0;
        decision.new_fee = clamp_fee(current_fee, params.min_fee, params.max_fee);
        return decision;
    }

    // Streak bookkeeping: a side flip (or first hit) restarts at 1
    bool upper = bounds.is_upper;
    if (oob_in.consecutive_hits == 0 || oob_in.last_side_was_upper != upper) {
        decision.oob.consecutive_hits = 1;
    } else if (oob_in.consecutive_hits < std::numeric_limits<uint32_t>::max()) {
        decision.oob.consecutive_hits = oob_in.consecutive_hits + 1;
    }
    decision.oob.last_side_was_upper = upper;

    // Deviation past the band edge, relative to target, scaled by slope
    Wad deviation = deviation_from_band(target_ratio, params.ratio_tolerance,
                                        current_ratio, upper);
    Wad normalized = deviation * WAD / target_ratio;
    Wad adjustment_rate = normalized * params.linear_slope / WAD;

    Wad fee = current_fee;
    Wad allowance = policy.fee_delta_allowance;
    Wad proposed = fee * adjustment_rate / WAD;

    Wad streak_cap = Wad(params.base_max_fee_delta) * decision.oob.consecutive_hits;
    Wad rate_cap = fee * max_adj_rate / WAD + allowance;
    Wad cap = std::min<Wad>(streak_cap, rate_cap);

    Wad fee_delta = std::min<Wad>(std::max<Wad>(proposed, allowance), cap);

    const Wad& side_factor = upper ? params.upper_side_factor : params.lower_side_factor;
    fee_delta = fee_delta * side_factor / WAD;

    Wad next_fee;
    if (upper) {
        next_fee = fee + fee_delta;
    } else {
        next_fee = fee_delta >= fee ? Wad(0) : Wad(fee - fee_delta);
    }

    decision.new_fee = clamp_fee(next_fee, params.min_fee, params.max_fee);
    return decision;
}
