#pragma once

#include "types.hpp"
#include "params.hpp"
#include "fee_logic.hpp"
#include "pool_controller.hpp"
#include "clock.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

// Table of per-pool controllers keyed by pool identifier, plus the
// per-category parameter sets and the global adjustment-rate ceiling.
// Single-threaded by contract: callers serialize every call.
class FeeControllerRegistry {
public:
    FeeControllerRegistry(const FeeSettings& settings,
                          const Clock& clock,
                          std::shared_ptr<const FeeLogic> logic = std::make_shared<FeeLogicV1>());

    PoolFeeController& activate_pool(const std::string& pool_id, PoolCategory category,
                                     uint32_t initial_fee, const Wad& initial_target_ratio);
    void deactivate_pool(const std::string& pool_id);

    FeeUpdate preview(const std::string& pool_id, const Wad& current_ratio) const;
    FeeUpdate commit(const std::string& pool_id, const Wad& current_ratio);
    FeeUpdate poke(const std::string& pool_id, const Wad& current_ratio);

    void set_category_params(PoolCategory category, const PoolParams& params);
    void set_adjustment_rate_ceiling(const Wad& rate);
    void upgrade_logic(std::shared_ptr<const FeeLogic> logic);

    // Used when rebuilding from a snapshot
    void restore_pool(const std::string& pool_id, PoolCategory category,
                      const PoolFeeState& state, const PoolParams& params);

    const PoolFeeController& pool(const std::string& pool_id) const;
    bool has_pool(const std::string& pool_id) const;
    std::vector<std::string> pool_ids() const;
    const PoolParams& category_params(PoolCategory category) const;
    const std::map<PoolCategory, PoolParams>& categories() const { return categories_; }
    const SanityBounds& bounds() const { return bounds_; }
    const Wad& adjustment_rate_ceiling() const { return max_adj_rate_; }
    uint32_t logic_version() const { return logic_->version(); }

private:
    SanityBounds bounds_;
    std::map<PoolCategory, PoolParams> categories_;
    Wad max_adj_rate_;
    const Clock& clock_;
    std::shared_ptr<const FeeLogic> logic_;
    std::map<std::string, PoolFeeController> pools_;

    PoolFeeController& find_pool(const std::string& pool_id);
    const PoolFeeController& find_pool(const std::string& pool_id) const;
};
