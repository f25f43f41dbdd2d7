#pragma once

#include "types.hpp"
#include "params.hpp"
#include "fee_logic.hpp"
#include "clock.hpp"
#include <memory>
#include <string>

// Cooldown-gated fee state machine for a single pool.
//
// Inactive -> Active via initialize(). Each update attempt runs
// eligibility check -> dry run -> commit, and either writes fee, target,
// OOB streak and timestamp together or leaves everything untouched.
// Callers serialize access; there is no internal locking.
class PoolFeeController {
public:
    PoolFeeController(std::string pool_id,
                      PoolCategory category,
                      const SanityBounds& bounds,
                      const Wad& max_adj_rate,
                      std::shared_ptr<const FeeLogic> logic,
                      const Clock& clock);

    void initialize(uint32_t initial_fee, const Wad& initial_target_ratio,
                    const PoolParams& params);
    void deactivate();

    FeeUpdate preview_update(const Wad& current_ratio) const;
    FeeUpdate commit_update(const Wad& current_ratio);

    // Administrative setters; take effect on the next commit
    void set_params(const PoolParams& params);
    void set_adjustment_rate_ceiling(const Wad& rate);
    void set_logic(std::shared_ptr<const FeeLogic> logic);

    // Reinstates persisted state without going through the commit path
    void restore(const PoolFeeState& state, const PoolParams& params);

    const std::string& pool_id() const { return pool_id_; }
    PoolCategory category() const { return category_; }
    bool is_active() const { return state_.is_active; }
    uint32_t current_fee() const { return state_.current_fee; }
    const Wad& current_target_ratio() const { return state_.current_target_ratio; }
    const OobState& oob_state() const { return state_.oob; }
    const PoolFeeState& state() const { return state_; }
    const PoolParams& params() const { return params_; }
    const Wad& adjustment_rate_ceiling() const { return max_adj_rate_; }
    uint32_t logic_version() const { return logic_->version(); }
    uint64_t next_eligible_update() const;

private:
    std::string pool_id_;
    PoolCategory category_;
    SanityBounds bounds_;
    Wad max_adj_rate_;
    std::shared_ptr<const FeeLogic> logic_;
    const Clock& clock_;

    PoolFeeState state_;
    PoolParams params_;

    void require_active() const;
    void check_initial_values(uint32_t fee, const Wad& target_ratio,
                              const PoolParams& params) const;
};
