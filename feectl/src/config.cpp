#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <cctype>
#include <algorithm>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

Config Config::from_env() {
    Config cfg;

    cfg.params_file = get_env("FEE_PARAMS_FILE");
    cfg.state_file = get_env("FEE_STATE_FILE");
    cfg.max_adjustment_rate = get_env("MAX_ADJUSTMENT_RATE");
    cfg.fee_delta_allowance = get_env("FEE_DELTA_ALLOWANCE");

    cfg.service_name = get_env("SERVICE_NAME", "feectl");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

Wad Config::adjustment_rate_override() const {
    if (max_adjustment_rate.empty()) return Wad(0);
    return util::parse_wad(max_adjustment_rate);
}

DeltaCapPolicy Config::delta_cap_policy() const {
    DeltaCapPolicy policy;
    if (fee_delta_allowance.empty()) return policy;

    std::string value = util::trim(fee_delta_allowance);
    bool digits = !value.empty() && value.size() <= 7 &&
                  std::all_of(value.begin(), value.end(),
                              [](unsigned char c) { return std::isdigit(c) != 0; });
    if (!digits || std::stoul(value) > MAX_FEE) {
        throw std::runtime_error("FEE_DELTA_ALLOWANCE must be an integer in [0, " +
                                 std::to_string(MAX_FEE) + "], got '" + fee_delta_allowance + "'");
    }
    policy.fee_delta_allowance = static_cast<uint32_t>(std::stoul(value));
    return policy;
}

void Config::validate() const {
    if (!max_adjustment_rate.empty()) {
        try {
            if (adjustment_rate_override() == 0) {
                throw std::runtime_error("MAX_ADJUSTMENT_RATE must be positive");
            }
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(std::string("MAX_ADJUSTMENT_RATE invalid: ") + e.what());
        }
    }

    DeltaCapPolicy policy = delta_cap_policy();

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Params file: {}", params_file.empty() ? "(defaults)" : params_file);
    spdlog::info("  State file: {}", state_file.empty() ? "(none)" : state_file);
    if (!max_adjustment_rate.empty()) {
        spdlog::info("  Max adjustment rate override: {}", max_adjustment_rate);
    }
    spdlog::info("  Fee delta allowance: {}", policy.fee_delta_allowance);
}
