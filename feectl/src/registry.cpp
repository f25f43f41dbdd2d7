#include "registry.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <utility>
#include <spdlog/spdlog.h>

FeeControllerRegistry::FeeControllerRegistry(const FeeSettings& settings,
                                             const Clock& clock,
                                             std::shared_ptr<const FeeLogic> logic)
    : bounds_(settings.bounds)
    , categories_(settings.categories)
    , max_adj_rate_(settings.max_adjustment_rate)
    , clock_(clock)
    , logic_(std::move(logic))
{
    if (!logic_) {
        throw InvalidParameter("registry created without fee logic");
    }
    settings.validate();
}

PoolFeeController& FeeControllerRegistry::find_pool(const std::string& pool_id) {
    auto it = pools_.find(pool_id);
    if (it == pools_.end()) throw UnknownPool(pool_id);
    return it->second;
}

const PoolFeeController& FeeControllerRegistry::find_pool(const std::string& pool_id) const {
    auto it = pools_.find(pool_id);
    if (it == pools_.end()) throw UnknownPool(pool_id);
    return it->second;
}

PoolFeeController& FeeControllerRegistry::activate_pool(const std::string& pool_id,
                                                        PoolCategory category,
                                                        uint32_t initial_fee,
                                                        const Wad& initial_target_ratio) {
    auto existing = pools_.find(pool_id);
    if (existing != pools_.end() && existing->second.is_active()) {
        throw InvalidParameter("pool " + pool_id + " is already active");
    }

    PoolFeeController controller(pool_id, category, bounds_, max_adj_rate_, logic_, clock_);
    controller.initialize(initial_fee, initial_target_ratio, category_params(category));

    if (existing != pools_.end()) {
        pools_.erase(existing);
    }
    auto result = pools_.emplace(pool_id, std::move(controller));
    return result.first->second;
}

void FeeControllerRegistry::deactivate_pool(const std::string& pool_id) {
    find_pool(pool_id).deactivate();
}

FeeUpdate FeeControllerRegistry::preview(const std::string& pool_id,
                                         const Wad& current_ratio) const {
    return find_pool(pool_id).preview_update(current_ratio);
}

FeeUpdate FeeControllerRegistry::commit(const std::string& pool_id,
                                        const Wad& current_ratio) {
    return find_pool(pool_id).commit_update(current_ratio);
}

FeeUpdate FeeControllerRegistry::poke(const std::string& pool_id,
                                      const Wad& current_ratio) {
    spdlog::info("Explicit poke for pool {} with ratio {}",
                 pool_id, util::wad_to_decimal(current_ratio));
    return commit(pool_id, current_ratio);
}

void FeeControllerRegistry::set_category_params(PoolCategory category,
                                                const PoolParams& params) {
    ParamValidator::validate_params(params, bounds_);

    categories_[category] = params;
    int updated = 0;
    for (auto& [id, controller] : pools_) {
        if (controller.category() == category && controller.is_active()) {
            controller.set_params(params);
            updated++;
        }
    }

    spdlog::info("Category {} parameters replaced, {} active pools updated",
                 category_name(category), updated);
}

void FeeControllerRegistry::set_adjustment_rate_ceiling(const Wad& rate) {
    ParamValidator::validate_adjustment_rate(rate, bounds_);

    max_adj_rate_ = rate;
    for (auto& [id, controller] : pools_) {
        controller.set_adjustment_rate_ceiling(rate);
    }

    spdlog::info("Adjustment rate ceiling set to {}", util::wad_to_decimal(rate));
}

void FeeControllerRegistry::upgrade_logic(std::shared_ptr<const FeeLogic> logic) {
    if (!logic) {
        throw InvalidParameter("fee logic must not be null");
    }

    uint32_t from = logic_->version();
    logic_ = std::move(logic);
    for (auto& [id, controller] : pools_) {
        controller.set_logic(logic_);
    }

    spdlog::info("Fee logic upgraded from v{} to v{} across {} pools",
                 from, logic_->version(), pools_.size());
}

void FeeControllerRegistry::restore_pool(const std::string& pool_id, PoolCategory category,
                                         const PoolFeeState& state, const PoolParams& params) {
    if (pools_.count(pool_id) > 0) {
        throw InvalidParameter("pool " + pool_id + " restored twice");
    }

    PoolFeeController controller(pool_id, category, bounds_, max_adj_rate_, logic_, clock_);
    controller.restore(state, params);
    pools_.emplace(pool_id, std::move(controller));
}

const PoolFeeController& FeeControllerRegistry::pool(const std::string& pool_id) const {
    return find_pool(pool_id);
}

bool FeeControllerRegistry::has_pool(const std::string& pool_id) const {
    return pools_.count(pool_id) > 0;
}

std::vector<std::string> FeeControllerRegistry::pool_ids() const {
    std::vector<std::string> ids;
    for (const auto& [id, _] : pools_) {
        ids.push_back(id);
    }
    return ids;
}

const PoolParams& FeeControllerRegistry::category_params(PoolCategory category) const {
    auto it = categories_.find(category);
    if (it == categories_.end()) {
        throw InvalidParameter("no parameters configured for category " +
                               category_name(category));
    }
    return it->second;
}
