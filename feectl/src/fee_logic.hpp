#pragma once

#include "types.hpp"
#include "fee_math.hpp"
#include <cstdint>

// Versioned update behaviour. Controllers hold the logic through this
// interface so it can be replaced without touching stored pool state.
class FeeLogic {
public:
    virtual ~FeeLogic() = default;

    virtual uint32_t version() const = 0;

    // Dry run: validates the observation and returns the would-be update.
    // Throws InvalidRatio; never mutates anything.
    virtual FeeUpdate compute_update(const PoolFeeState& state,
                                     const PoolParams& params,
                                     const Wad& max_adj_rate,
                                     const Wad& current_ratio) const = 0;
};

class FeeLogicV1 : public FeeLogic {
public:
    explicit FeeLogicV1(const DeltaCapPolicy& policy = DeltaCapPolicy());

    uint32_t version() const override { return 1; }

    FeeUpdate compute_update(const PoolFeeState& state,
                             const PoolParams& params,
                             const Wad& max_adj_rate,
                             const Wad& current_ratio) const override;

    const DeltaCapPolicy& policy() const { return policy_; }

private:
    DeltaCapPolicy policy_;
};
