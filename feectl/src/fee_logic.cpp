#include "fee_logic.hpp"
#include "errors.hpp"
#include "util.hpp"

FeeLogicV1::FeeLogicV1(const DeltaCapPolicy& policy) : policy_(policy) {}

FeeUpdate FeeLogicV1::compute_update(const PoolFeeState& state,
                                     const PoolParams& params,
                                     const Wad& max_adj_rate,
                                     const Wad& current_ratio) const {
    if (current_ratio == 0) {
        throw InvalidRatio("observed ratio is zero");
    }
    if (current_ratio > params.max_current_ratio) {
        throw InvalidRatio("observed ratio " + util::wad_to_decimal(current_ratio) +
                           " above max_current_ratio " +
                           util::wad_to_decimal(params.max_current_ratio));
    }

    FeeUpdate update;
    update.old_fee = state.current_fee;
    update.old_target = state.current_target_ratio;
    update.new_target = FeeMath::ema(current_ratio, state.current_target_ratio,
                                     params.lookback_period);
    if (update.new_target == 0) {
        throw InvalidRatio("smoothed target ratio would be zero");
    }

    // Deviation is measured against the target in force before this observation
    FeeDecision decision = FeeMath::compute_new_fee(state.current_fee,
                                                    current_ratio,
                                                    state.current_target_ratio,
                                                    max_adj_rate,
                                                    params,
                                                    state.oob,
                                                    policy_);
    update.new_fee = decision.new_fee;
    update.new_oob = decision.oob;
    return update;
}
