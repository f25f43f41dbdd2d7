#include "snapshot.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cstdio>
#include <fstream>
#include <limits>
#include <utility>
#include <spdlog/spdlog.h>

void to_json(nlohmann::json& j, const PoolFeeState& state) {
    j = {
        {"current_fee", state.current_fee},
        {"current_target_ratio", util::wad_to_string(state.current_target_ratio)},
        {"oob", {
            {"last_side_was_upper", state.oob.last_side_was_upper},
            {"consecutive_hits", state.oob.consecutive_hits}
        }},
        {"last_update_ts", state.last_update_ts},
        {"is_active", state.is_active}
    };
}

void from_json(const nlohmann::json& j, PoolFeeState& state) {
    if (!j.is_object() || !j.contains("oob") || !j.contains("is_active")) {
        throw InvalidParameter("pool state is missing 'oob' or 'is_active'");
    }
    const auto& oob = j.at("oob");
    if (!oob.contains("last_side_was_upper") || !oob.at("last_side_was_upper").is_boolean() ||
        !j.at("is_active").is_boolean()) {
        throw InvalidParameter("pool state flags must be booleans");
    }

    state.current_fee = static_cast<uint32_t>(uint_from_json(j, "current_fee", MAX_FEE));
    state.current_target_ratio = wad_from_json(j, "current_target_ratio");
    state.oob.last_side_was_upper = oob.at("last_side_was_upper").get<bool>();
    state.oob.consecutive_hits = static_cast<uint32_t>(
        uint_from_json(oob, "consecutive_hits", std::numeric_limits<uint32_t>::max()));
    state.last_update_ts = uint_from_json(j, "last_update_ts", std::numeric_limits<uint64_t>::max());
    state.is_active = j.at("is_active").get<bool>();
}

nlohmann::json StateSnapshot::capture(const FeeControllerRegistry& registry) {
    nlohmann::json categories = nlohmann::json::object();
    for (const auto& [category, params] : registry.categories()) {
        categories[category_name(category)] = params;
    }

    nlohmann::json pools = nlohmann::json::object();
    for (const auto& id : registry.pool_ids()) {
        const auto& controller = registry.pool(id);
        pools[id] = {
            {"category", category_name(controller.category())},
            {"params", controller.params()},
            {"state", controller.state()}
        };
    }

    return {
        {"schema_version", SCHEMA_VERSION},
        {"logic_version", registry.logic_version()},
        {"max_adjustment_rate", util::wad_to_string(registry.adjustment_rate_ceiling())},
        {"categories", categories},
        {"pools", pools},
        {"captured_at", util::current_iso8601()}
    };
}

FeeControllerRegistry StateSnapshot::restore(const nlohmann::json& doc,
                                             const SanityBounds& bounds,
                                             const Clock& clock,
                                             std::shared_ptr<const FeeLogic> logic) {
    if (!doc.is_object() || !doc.contains("schema_version")) {
        throw InvalidParameter("snapshot has no schema_version");
    }
    if (!doc.at("schema_version").is_number_unsigned() ||
        doc.at("schema_version") != SCHEMA_VERSION) {
        throw InvalidParameter("unsupported snapshot schema_version " +
                               doc.at("schema_version").dump());
    }
    if (!doc.contains("categories") || !doc.at("categories").is_object() ||
        !doc.contains("pools") || !doc.at("pools").is_object()) {
        throw InvalidParameter("snapshot is missing 'categories' or 'pools'");
    }

    FeeSettings settings;
    settings.bounds = bounds;
    settings.max_adjustment_rate = wad_from_json(doc, "max_adjustment_rate");
    const auto& categories = doc.at("categories");
    for (auto it = categories.begin(); it != categories.end(); ++it) {
        settings.categories[parse_category(it.key())] = it.value().get<PoolParams>();
    }

    if (doc.contains("logic_version") && logic &&
        doc.at("logic_version") != logic->version()) {
        spdlog::warn("Snapshot written by fee logic v{}, restoring under v{}",
                     doc.at("logic_version").dump(), logic->version());
    }

    FeeControllerRegistry registry(settings, clock, std::move(logic));

    const auto& pools = doc.at("pools");
    for (auto it = pools.begin(); it != pools.end(); ++it) {
        const auto& entry = it.value();
        if (!entry.is_object() || !entry.contains("category") || !entry.contains("params") ||
            !entry.contains("state") || !entry.at("category").is_string()) {
            throw InvalidParameter("snapshot entry for pool " + it.key() + " is incomplete");
        }
        try {
            registry.restore_pool(it.key(),
                                  parse_category(entry.at("category").get<std::string>()),
                                  entry.at("state").get<PoolFeeState>(),
                                  entry.at("params").get<PoolParams>());
        } catch (const FeeError& e) {
            throw InvalidParameter("pool " + it.key() + ": " + e.what());
        }
    }

    spdlog::info("Restored {} pools from snapshot (schema v{})",
                 registry.pool_ids().size(), SCHEMA_VERSION);
    return registry;
}

void StateSnapshot::save_file(const FeeControllerRegistry& registry, const std::string& path) {
    std::string tmp_path = path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            throw std::runtime_error("cannot write snapshot to " + tmp_path);
        }
        out << capture(registry).dump(2) << "\n";
        if (!out) {
            throw std::runtime_error("failed writing snapshot to " + tmp_path);
        }
    }

    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        throw std::runtime_error("cannot move snapshot into place at " + path);
    }
    spdlog::info("Saved state snapshot to {}", path);
}

nlohmann::json StateSnapshot::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw InvalidParameter("cannot open snapshot " + path);
    }
    try {
        nlohmann::json doc;
        in >> doc;
        return doc;
    } catch (const nlohmann::json::parse_error& e) {
        throw InvalidParameter("malformed snapshot " + path + ": " + e.what());
    }
}
