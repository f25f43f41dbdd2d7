#include "pool_controller.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <limits>
#include <utility>
#include <spdlog/spdlog.h>

PoolFeeController::PoolFeeController(std::string pool_id,
                                     PoolCategory category,
                                     const SanityBounds& bounds,
                                     const Wad& max_adj_rate,
                                     std::shared_ptr<const FeeLogic> logic,
                                     const Clock& clock)
    : pool_id_(std::move(pool_id))
    , category_(category)
    , bounds_(bounds)
    , max_adj_rate_(max_adj_rate)
    , logic_(std::move(logic))
    , clock_(clock)
{
    if (!logic_) {
        throw InvalidParameter("pool " + pool_id_ + " created without fee logic");
    }
}

void PoolFeeController::require_active() const {
    if (!state_.is_active) {
        throw NotActive(pool_id_);
    }
}

void PoolFeeController::check_initial_values(uint32_t fee, const Wad& target_ratio,
                                             const PoolParams& params) const {
    ParamValidator::validate_params(params, bounds_);

    if (fee < params.min_fee || fee > params.max_fee) {
        throw InvalidFee("fee " + std::to_string(fee) + " outside [" +
                         std::to_string(params.min_fee) + ", " +
                         std::to_string(params.max_fee) + "]");
    }
    if (target_ratio == 0) {
        throw InvalidRatio("target ratio is zero");
    }
    if (target_ratio > params.max_current_ratio) {
        throw InvalidRatio("target ratio " + util::wad_to_decimal(target_ratio) +
                           " above max_current_ratio " +
                           util::wad_to_decimal(params.max_current_ratio));
    }
}

void PoolFeeController::initialize(uint32_t initial_fee, const Wad& initial_target_ratio,
                                   const PoolParams& params) {
    if (state_.is_active) {
        throw InvalidParameter("pool " + pool_id_ + " is already active");
    }
    check_initial_values(initial_fee, initial_target_ratio, params);

    PoolFeeState fresh;
    fresh.current_fee = initial_fee;
    fresh.current_target_ratio = initial_target_ratio;
    fresh.oob = OobState{false, 0};
    fresh.last_update_ts = clock_.now_seconds();
    fresh.is_active = true;

    state_ = fresh;
    params_ = params;

    spdlog::info("Pool {} activated ({}): fee={} target={}",
                 pool_id_, category_name(category_), initial_fee,
                 util::wad_to_decimal(initial_target_ratio));
}

void PoolFeeController::deactivate() {
    require_active();
    state_ = PoolFeeState();
    spdlog::info("Pool {} deactivated", pool_id_);
}

uint64_t PoolFeeController::next_eligible_update() const {
    uint64_t last = state_.last_update_ts;
    if (params_.min_period > std::numeric_limits<uint64_t>::max() - last) {
        return std::numeric_limits<uint64_t>::max();
    }
    return last + params_.min_period;
}

FeeUpdate PoolFeeController::preview_update(const Wad& current_ratio) const {
    require_active();
    return logic_->compute_update(state_, params_, max_adj_rate_, current_ratio);
}

FeeUpdate PoolFeeController::commit_update(const Wad& current_ratio) {
    require_active();

    uint64_t now = clock_.now_seconds();
    uint64_t next_eligible = next_eligible_update();
    if (now < next_eligible) {
        spdlog::debug("Pool {} update rejected: cooldown until {} (now {})",
                      pool_id_, next_eligible, now);
        throw CooldownNotElapsed(now, next_eligible);
    }

    FeeUpdate update;
    try {
        update = logic_->compute_update(state_, params_, max_adj_rate_, current_ratio);
    } catch (const InvalidRatio& e) {
        spdlog::warn("Pool {} update rejected: {}", pool_id_, e.detail());
        throw;
    }

    // Commit all four together
    PoolFeeState next = state_;
    next.current_fee = update.new_fee;
    next.current_target_ratio = update.new_target;
    next.oob = update.new_oob;
    next.last_update_ts = now;
    state_ = next;

    spdlog::info("Pool {} fee {} -> {}, target {} -> {}, oob {}x{}",
                 pool_id_, update.old_fee, update.new_fee,
                 util::wad_to_decimal(update.old_target),
                 util::wad_to_decimal(update.new_target),
                 update.new_oob.last_side_was_upper ? "upper" : "lower",
                 update.new_oob.consecutive_hits);

    return update;
}

void PoolFeeController::set_params(const PoolParams& params) {
    require_active();
    ParamValidator::validate_params(params, bounds_);
    params_ = params;
    spdlog::info("Pool {} parameters updated: fee range [{}, {}], min_period={}s",
                 pool_id_, params.min_fee, params.max_fee, params.min_period);
}

void PoolFeeController::set_adjustment_rate_ceiling(const Wad& rate) {
    ParamValidator::validate_adjustment_rate(rate, bounds_);
    max_adj_rate_ = rate;
}

void PoolFeeController::set_logic(std::shared_ptr<const FeeLogic> logic) {
    if (!logic) {
        throw InvalidParameter("fee logic must not be null");
    }
    logic_ = std::move(logic);
}

void PoolFeeController::restore(const PoolFeeState& state, const PoolParams& params) {
    if (state.is_active) {
        check_initial_values(state.current_fee, state.current_target_ratio, params);
    } else {
        ParamValidator::validate_params(params, bounds_);
    }
    state_ = state;
    params_ = params;
}
