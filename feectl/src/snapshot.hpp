#pragma once

#include "registry.hpp"
#include "params.hpp"
#include "clock.hpp"
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

// Stable, explicitly versioned layout of the per-pool state table. The
// behaviour (FeeLogic) is not stored; only its version is recorded.
class StateSnapshot {
public:
    static constexpr int SCHEMA_VERSION = 1;

    static nlohmann::json capture(const FeeControllerRegistry& registry);

    // Throws InvalidParameter; on failure no registry is produced
    static FeeControllerRegistry restore(const nlohmann::json& doc,
                                         const SanityBounds& bounds,
                                         const Clock& clock,
                                         std::shared_ptr<const FeeLogic> logic =
                                             std::make_shared<FeeLogicV1>());

    static void save_file(const FeeControllerRegistry& registry, const std::string& path);
    static nlohmann::json load_file(const std::string& path);
};

void to_json(nlohmann::json& j, const PoolFeeState& state);
void from_json(const nlohmann::json& j, PoolFeeState& state);
