#include "replay.hpp"
#include "errors.hpp"
#include "params.hpp"
#include "snapshot.hpp"
#include "util.hpp"
#include <fstream>
#include <limits>
#include <memory>
#include <spdlog/spdlog.h>

namespace {

std::string require_string(const nlohmann::json& event, const char* field) {
    if (!event.contains(field) || !event.at(field).is_string()) {
        throw InvalidParameter(std::string("event needs string field '") + field + "'");
    }
    return event.at(field).get<std::string>();
}

bool file_exists(const std::string& path) {
    std::ifstream in(path);
    return in.good();
}

} // namespace

nlohmann::json update_to_json(const std::string& pool_id, const FeeUpdate& update) {
    return {
        {"pool", pool_id},
        {"old_fee", update.old_fee},
        {"new_fee", update.new_fee},
        {"old_target", util::wad_to_string(update.old_target)},
        {"new_target", util::wad_to_string(update.new_target)},
        {"oob", {
            {"last_side_was_upper", update.new_oob.last_side_was_upper},
            {"consecutive_hits", update.new_oob.consecutive_hits}
        }}
    };
}

ReplaySession::ReplaySession(FeeControllerRegistry& registry, ManualClock& clock)
    : registry_(registry)
    , clock_(clock)
{}

nlohmann::json ReplaySession::handle_event(const nlohmann::json& event) {
    if (!event.is_object()) {
        throw InvalidParameter("event must be a JSON object");
    }
    std::string op = require_string(event, "op");
    if (event.contains("ts")) {
        clock_.set(uint_from_json(event, "ts", std::numeric_limits<uint64_t>::max()));
    }

    nlohmann::json result;
    if (op == "activate") {
        std::string pool_id = require_string(event, "pool");
        auto& controller = registry_.activate_pool(
            pool_id,
            parse_category(require_string(event, "category")),
            static_cast<uint32_t>(uint_from_json(event, "fee", MAX_FEE)),
            wad_from_json(event, "target"));
        result = {
            {"pool", pool_id},
            {"fee", controller.current_fee()},
            {"target", util::wad_to_string(controller.current_target_ratio())},
            {"next_eligible", controller.next_eligible_update()}
        };
    } else if (op == "observe" || op == "poke") {
        std::string pool_id = require_string(event, "pool");
        Wad ratio = wad_from_json(event, "ratio");
        FeeUpdate update = op == "poke" ? registry_.poke(pool_id, ratio)
                                        : registry_.commit(pool_id, ratio);
        result = update_to_json(pool_id, update);
        result["next_eligible"] = registry_.pool(pool_id).next_eligible_update();
    } else if (op == "preview") {
        std::string pool_id = require_string(event, "pool");
        result = update_to_json(pool_id, registry_.preview(pool_id, wad_from_json(event, "ratio")));
    } else if (op == "set_params") {
        PoolCategory category = parse_category(require_string(event, "category"));
        if (!event.contains("params")) {
            throw InvalidParameter("set_params needs 'params'");
        }
        registry_.set_category_params(category, event.at("params").get<PoolParams>());
        result = {{"category", category_name(category)}};
    } else if (op == "set_rate") {
        Wad rate = wad_from_json(event, "rate");
        registry_.set_adjustment_rate_ceiling(rate);
        result = {{"rate", util::wad_to_string(rate)}};
    } else if (op == "deactivate") {
        std::string pool_id = require_string(event, "pool");
        registry_.deactivate_pool(pool_id);
        result = {{"pool", pool_id}};
    } else if (op == "snapshot") {
        result = {{"snapshot", StateSnapshot::capture(registry_)}};
    } else {
        throw InvalidParameter("unknown op '" + op + "'");
    }

    result["ok"] = true;
    result["op"] = op;
    result["ts"] = clock_.now_seconds();
    return result;
}

nlohmann::json ReplaySession::process_line(const std::string& line) {
    nlohmann::json result;
    try {
        result = handle_event(nlohmann::json::parse(line));
    } catch (const CooldownNotElapsed& e) {
        result = {{"ok", false}, {"error", e.kind()},
                  {"now", e.now()}, {"next_eligible", e.next_eligible()}};
    } catch (const FeeError& e) {
        result = {{"ok", false}, {"error", e.kind()}, {"detail", e.detail()}};
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Bad event line: {}", e.what());
        result = {{"ok", false}, {"error", "BadEvent"}, {"detail", e.what()}};
    } catch (const std::exception& e) {
        spdlog::error("Event failed: {}", e.what());
        result = {{"ok", false}, {"error", "Internal"}, {"detail", e.what()}};
    }

    if (!result.value("ok", false)) failed_++;
    processed_++;
    return result;
}

FeeControllerRegistry load_registry(const Config& config, const FeeSettings& settings,
                                    const Clock& clock) {
    auto logic = std::make_shared<FeeLogicV1>(config.delta_cap_policy());
    bool restoring = !config.state_file.empty() && file_exists(config.state_file);
    if (restoring && !config.params_file.empty()) {
        spdlog::warn("Restoring from {}: its categories and adjustment rate replace those in {}; "
                     "only the sanity bounds come from the params file",
                     config.state_file, config.params_file);
    }

    FeeControllerRegistry registry = restoring
        ? StateSnapshot::restore(StateSnapshot::load_file(config.state_file),
                                 settings.bounds, clock, logic)
        : FeeControllerRegistry(settings, clock, logic);

    Wad rate_override = config.adjustment_rate_override();
    if (rate_override > 0) {
        registry.set_adjustment_rate_ceiling(rate_override);
    }
    return registry;
}
